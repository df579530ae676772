#pragma once

#include "common/constants.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace zkvm16 {

/**
 * Instruction set. Encoded in the top nibble of the instruction word.
 */
enum class Opcode : uint8_t {
    Halt = 0,
    Copy = 1,       // dest <- source
    Load = 2,       // dest <- mem16[source]
    Write = 3,      // mem16[dest] <- source
    Add = 4,        // dest <- dest + source, overflow is fatal
    LoadImm = 5,    // no-op; a nonzero immediate already reached IM
    StoreOut = 6    // mem16[OUTPUT_ADDRESS] <- source
};

constexpr size_t NUM_OPCODES = 7;

const char* opcode_name(Opcode opcode);

// Reverse of opcode_name(); nullopt for an unknown mnemonic
std::optional<Opcode> opcode_from_name(const std::string& name);

/**
 * Instruction word split into its four nibbles:
 *
 *   15..12  11..8  7..4    3..0
 *   opcode  dest   source  immediate
 */
struct DecodedInstruction {
    Opcode opcode = Opcode::Halt;
    uint8_t dest = 0;
    uint8_t source = 0;
    uint8_t immediate = 0;

    VmWord encode() const;

    /**
     * Assembler text for the instruction; words that have no mnemonic form
     * (operand fields naming no register, unused fields set) come out as
     * `.word 0xNNNN`.
     */
    std::string to_string() const;

    bool operator==(const DecodedInstruction& rhs) const {
        return opcode == rhs.opcode && dest == rhs.dest && source == rhs.source &&
               immediate == rhs.immediate;
    }
    bool operator!=(const DecodedInstruction& rhs) const { return !(*this == rhs); }
};

/**
 * Pack four fields into a word. Each field is masked to its low 4 bits;
 * wider inputs are silently truncated.
 */
VmWord encode_instruction(uint8_t opcode, uint8_t dest, uint8_t source, uint8_t immediate);

inline VmWord encode_instruction(Opcode opcode, uint8_t dest, uint8_t source, uint8_t immediate) {
    return encode_instruction(static_cast<uint8_t>(opcode), dest, source, immediate);
}

/**
 * Split a word into fields. VmError(UnknownOpcode) when the top nibble is
 * not an Opcode.
 */
DecodedInstruction decode_instruction(VmWord word);

} // namespace zkvm16
