#include "zk/byte_encoder.hpp"

namespace zkvm16 {

void ByteEncoder::put_u16(uint16_t value) {
    bytes_.push_back(static_cast<uint8_t>(value));
    bytes_.push_back(static_cast<uint8_t>(value >> 8));
}

void ByteEncoder::put_u32(uint32_t value) {
    for (size_t i = 0; i < 4; ++i) {
        bytes_.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

void ByteEncoder::put_u64(uint64_t value) {
    for (size_t i = 0; i < 8; ++i) {
        bytes_.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

void ByteEncoder::put_bytes(const std::vector<uint8_t>& bytes) {
    bytes_.insert(bytes_.end(), bytes.begin(), bytes.end());
}

void ByteEncoder::put_u16_vec(const std::vector<uint16_t>& values) {
    put_u64(values.size());
    for (uint16_t v : values) {
        put_u16(v);
    }
}

void ByteEncoder::put_registers(const RegisterBank& registers) {
    put_u64(registers.size());
    for (const auto& entry : registers) {
        put_u8(entry.first);
        put_u32(register_index(entry.second.id));
        put_u16(entry.second.value);
    }
}

std::vector<uint8_t> encode_step_record(const RegisterBank::Snapshot& registers,
                                        VmWord mem_word, VmAddr pc, uint8_t opcode) {
    ByteEncoder encoder;
    encoder.put_u16_array(registers);
    encoder.put_u16(mem_word);
    encoder.put_u16(pc);
    encoder.put_u8(opcode);
    return encoder.take();
}

} // namespace zkvm16
