#include "vm/instruction.hpp"
#include "vm/register.hpp"
#include "common/errors.hpp"
#include <iomanip>
#include <sstream>

namespace zkvm16 {
namespace {

constexpr uint8_t NIBBLE_MASK = 0x0F;

bool names_register(uint8_t field) {
    return field < NUM_REGISTERS;
}

const char* field_register_name(uint8_t field) {
    return register_name(static_cast<RegisterId>(field));
}

std::string raw_word(VmWord word) {
    std::ostringstream oss;
    oss << ".word 0x" << std::hex << std::setw(4) << std::setfill('0') << word;
    return oss.str();
}

} // namespace

const char* opcode_name(Opcode opcode) {
    switch (opcode) {
        case Opcode::Halt: return "halt";
        case Opcode::Copy: return "copy";
        case Opcode::Load: return "load";
        case Opcode::Write: return "write";
        case Opcode::Add: return "add";
        case Opcode::LoadImm: return "load_imm";
        case Opcode::StoreOut: return "store_out";
    }
    return "?";
}

std::optional<Opcode> opcode_from_name(const std::string& name) {
    for (uint8_t i = 0; i < NUM_OPCODES; ++i) {
        Opcode opcode = static_cast<Opcode>(i);
        if (name == opcode_name(opcode)) {
            return opcode;
        }
    }
    return std::nullopt;
}

VmWord encode_instruction(uint8_t opcode, uint8_t dest, uint8_t source, uint8_t immediate) {
    return static_cast<VmWord>(((opcode & NIBBLE_MASK) << 12) |
                               ((dest & NIBBLE_MASK) << 8) |
                               ((source & NIBBLE_MASK) << 4) |
                               (immediate & NIBBLE_MASK));
}

DecodedInstruction decode_instruction(VmWord word) {
    const uint8_t op = static_cast<uint8_t>(word >> 12);
    if (op >= NUM_OPCODES) {
        std::ostringstream detail;
        detail << static_cast<int>(op) << " in word 0x" << std::hex << std::setw(4)
               << std::setfill('0') << word;
        throw VmError(ErrorKind::UnknownOpcode, detail.str());
    }

    DecodedInstruction instr;
    instr.opcode = static_cast<Opcode>(op);
    instr.dest = static_cast<uint8_t>((word >> 8) & NIBBLE_MASK);
    instr.source = static_cast<uint8_t>((word >> 4) & NIBBLE_MASK);
    instr.immediate = static_cast<uint8_t>(word & NIBBLE_MASK);
    return instr;
}

VmWord DecodedInstruction::encode() const {
    return encode_instruction(opcode, dest, source, immediate);
}

std::string DecodedInstruction::to_string() const {
    std::ostringstream oss;
    switch (opcode) {
        case Opcode::Halt:
            if (dest != 0 || source != 0 || immediate != 0) break;
            return opcode_name(opcode);

        case Opcode::Copy:
        case Opcode::Load:
        case Opcode::Write:
        case Opcode::Add:
            if (!names_register(dest) || !names_register(source)) break;
            oss << opcode_name(opcode) << " " << field_register_name(dest) << ", "
                << field_register_name(source);
            if (immediate != 0) {
                oss << ", " << static_cast<int>(immediate);
            }
            return oss.str();

        case Opcode::LoadImm:
            if (dest != register_index(RegisterId::IM) || source != 0) break;
            oss << opcode_name(opcode) << " " << static_cast<int>(immediate);
            return oss.str();

        case Opcode::StoreOut:
            if (dest != 0 || immediate != 0 || !names_register(source)) break;
            oss << opcode_name(opcode) << " " << field_register_name(source);
            return oss.str();
    }
    return raw_word(encode());
}

} // namespace zkvm16
