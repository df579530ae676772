#pragma once

#include "common/constants.hpp"
#include "vm/register.hpp"
#include <array>
#include <cstdint>
#include <vector>

namespace zkvm16 {

/**
 * ByteEncoder - canonical little-endian, fixed-width encoding
 *
 * Integers are written at their full width with no varint compression;
 * sequences carry a u64 length prefix, fixed-size arrays do not. Every
 * commitment pre-image is built with this encoder, so the layout is part of
 * the commitment format:
 *
 *   u8 / u16 / u32 / u64   1 / 2 / 4 / 8 bytes, little-endian
 *   [u16; N]               2N bytes
 *   vector<u16>            u64 length, then elements
 *   RegisterBank           u64 count, then per register in id order:
 *                          u8 key, u32 id discriminant, u16 value
 */
class ByteEncoder {
public:
    void put_u8(uint8_t value) { bytes_.push_back(value); }
    void put_u16(uint16_t value);
    void put_u32(uint32_t value);
    void put_u64(uint64_t value);

    void put_bytes(const std::vector<uint8_t>& bytes);

    template <size_t N>
    void put_u16_array(const std::array<uint16_t, N>& values) {
        for (uint16_t v : values) {
            put_u16(v);
        }
    }

    void put_u16_vec(const std::vector<uint16_t>& values);
    void put_registers(const RegisterBank& registers);

    const std::vector<uint8_t>& bytes() const { return bytes_; }
    std::vector<uint8_t> take() { return std::move(bytes_); }
    size_t size() const { return bytes_.size(); }

private:
    std::vector<uint8_t> bytes_;
};

// Size of one encoded trace step
constexpr size_t STEP_RECORD_SIZE = MAX_REGS * 2 + 2 + 2 + 1;

/**
 * registers ‖ mem_word ‖ pc ‖ opcode
 */
std::vector<uint8_t> encode_step_record(const RegisterBank::Snapshot& registers,
                                        VmWord mem_word, VmAddr pc, uint8_t opcode);

} // namespace zkvm16
