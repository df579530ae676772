#include "vm/register.hpp"
#include "common/errors.hpp"
#include <iomanip>
#include <sstream>

namespace zkvm16 {

const char* register_name(RegisterId id) {
    switch (id) {
        case RegisterId::R0: return "r0";
        case RegisterId::R1: return "r1";
        case RegisterId::R2: return "r2";
        case RegisterId::R3: return "r3";
        case RegisterId::PC: return "pc";
        case RegisterId::IR: return "ir";
        case RegisterId::IM: return "im";
    }
    return "?";
}

RegisterBank::RegisterBank(VmAddr program_counter) {
    for (uint8_t i = 0; i < NUM_REGISTERS; ++i) {
        RegisterId id = static_cast<RegisterId>(i);
        registers_.emplace(i, Register{id, 0});
    }
    registers_[register_index(RegisterId::PC)].value = program_counter;
}

Register RegisterBank::get(uint8_t id) const {
    auto it = registers_.find(id);
    if (it == registers_.end()) {
        throw VmError(ErrorKind::UnknownRegister, "id " + std::to_string(id));
    }
    return it->second;
}

Register& RegisterBank::get_mut(uint8_t id) {
    auto it = registers_.find(id);
    if (it == registers_.end()) {
        throw VmError(ErrorKind::UnknownRegister, "id " + std::to_string(id));
    }
    return it->second;
}

void RegisterBank::advance_program_counter() {
    Register& pc = get_mut(RegisterId::PC);
    const uint32_t next = static_cast<uint32_t>(pc.value) + INSTRUCTION_SIZE;
    if (next > 0xFFFF) {
        throw VmError(ErrorKind::Overflow, "program counter past 0xFFFF");
    }
    pc.value = static_cast<VmWord>(next);
}

RegisterBank::Snapshot RegisterBank::snapshot() const {
    Snapshot values{};
    for (const auto& [key, reg] : registers_) {
        if (key < MAX_REGS) {
            values[key] = reg.value;
        }
    }
    return values;
}

std::string RegisterBank::to_string() const {
    std::ostringstream oss;
    bool first = true;
    for (const auto& entry : registers_) {
        const Register& reg = entry.second;
        if (!first) oss << " ";
        first = false;
        oss << register_name(reg.id) << "=0x" << std::hex << std::setw(4) << std::setfill('0')
            << reg.value << std::dec;
    }
    return oss.str();
}

} // namespace zkvm16
