#pragma once

#include "common/constants.hpp"
#include <array>
#include <cstdint>
#include <map>
#include <string>

namespace zkvm16 {

/**
 * Register identifiers. The numeric value is both the 4-bit operand field
 * that names the register and its serialized discriminant.
 */
enum class RegisterId : uint8_t {
    R0 = 0,
    R1 = 1,
    R2 = 2,
    R3 = 3,
    PC = 4,   // program counter
    IR = 5,   // raw word of the current instruction
    IM = 6    // immediate operand
};

constexpr size_t NUM_REGISTERS = 7;

// Width of a register snapshot; slots without a register read as zero
constexpr size_t MAX_REGS = 8;

const char* register_name(RegisterId id);

inline constexpr uint8_t register_index(RegisterId id) {
    return static_cast<uint8_t>(id);
}

/**
 * A named 16-bit register. Values are copies; changing a copy does not
 * touch the bank.
 */
struct Register {
    RegisterId id = RegisterId::R0;
    VmWord value = 0;

    bool operator==(const Register& rhs) const { return id == rhs.id && value == rhs.value; }
    bool operator!=(const Register& rhs) const { return !(*this == rhs); }
};

/**
 * RegisterBank - every register of the machine, keyed by id
 *
 * The id set is fixed at construction. Iteration is in ascending id order,
 * which is also the canonical serialization order.
 */
class RegisterBank {
public:
    using Snapshot = std::array<VmWord, MAX_REGS>;

    explicit RegisterBank(VmAddr program_counter = START_ADDRESS);

    /**
     * Copy of register `id`; VmError(UnknownRegister) when no such register
     */
    Register get(uint8_t id) const;
    Register get(RegisterId id) const { return get(register_index(id)); }

    Register& get_mut(uint8_t id);
    Register& get_mut(RegisterId id) { return get_mut(register_index(id)); }

    void set(RegisterId id, VmWord value) { get_mut(id).value = value; }

    /**
     * PC += INSTRUCTION_SIZE. VmError(Overflow) if that leaves the 16-bit
     * range, with PC unchanged.
     */
    void advance_program_counter();

    VmAddr program_counter() const { return get(RegisterId::PC).value; }

    // Values by id; ids with no register stay zero
    Snapshot snapshot() const;

    size_t size() const { return registers_.size(); }

    std::map<uint8_t, Register>::const_iterator begin() const { return registers_.begin(); }
    std::map<uint8_t, Register>::const_iterator end() const { return registers_.end(); }

    bool operator==(const RegisterBank& rhs) const { return registers_ == rhs.registers_; }
    bool operator!=(const RegisterBank& rhs) const { return !(*this == rhs); }

    std::string to_string() const;

private:
    std::map<uint8_t, Register> registers_;
};

} // namespace zkvm16
