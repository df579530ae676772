#pragma once

#include "vm/bus.hpp"
#include "vm/instruction.hpp"
#include "vm/observer.hpp"
#include "vm/register.hpp"
#include "vm/trace.hpp"
#include <memory>

namespace zkvm16 {

/**
 * VM - 16-bit fetch-decode-execute engine
 *
 * Owns its bus and register bank. Every tick fetches the word at PC,
 * advances PC, decodes, optionally records a trace entry, then executes.
 * Any error halts the machine before it reaches the caller; ticking a
 * halted machine throws VmError(Halted) and changes nothing.
 *
 * Each VM instance runs one program from start to finish.
 */
class VM {
public:
    /**
     * Machine with an empty, zero-capacity memory. Install a real one with
     * set_memory() before ticking.
     */
    VM();

    VM(std::unique_ptr<BusDevice> memory, bool tracing);

    void set_memory(std::unique_ptr<BusDevice> memory);
    void enable_tracing(bool enabled = true) { tracing_ = enabled; }

    // Not owned; must outlive the VM or be reset to nullptr
    void set_observer(ExecutionObserver* observer) { observer_ = observer; }

    /**
     * Execute one instruction.
     */
    void tick();

    /**
     * Tick until halted or `max_ticks` ticks were taken. Returns the number
     * of ticks taken by this call. Errors propagate.
     */
    size_t run(size_t max_ticks);

    bool halted() const { return halted_; }
    bool tracing() const { return tracing_; }
    size_t tick_count() const { return tick_count_; }

    const RegisterBank& registers() const { return registers_; }
    RegisterBank& registers() { return registers_; }

    const BusDevice& memory() const { return *memory_; }
    BusDevice& memory() { return *memory_; }

    const ExecutionTrace& trace() const { return trace_; }

private:
    RegisterBank registers_;
    std::unique_ptr<BusDevice> memory_;
    ExecutionTrace trace_;
    ExecutionObserver* observer_ = nullptr;
    bool halted_ = false;
    bool tracing_ = false;
    size_t tick_count_ = 0;

    /**
     * Copy of the register named by `field`. A field naming IM first loads
     * the immediate into IM, unless the immediate is zero.
     */
    Register resolve_operand(uint8_t field, uint8_t immediate);

    void execute(const DecodedInstruction& instr, const Register& dest, const Register& source);
};

} // namespace zkvm16
