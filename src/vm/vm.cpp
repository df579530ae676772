#include "vm/vm.hpp"
#include "vm/linear_memory.hpp"
#include "common/errors.hpp"
#include <stdexcept>

namespace zkvm16 {

VM::VM()
    : registers_()
    , memory_(std::make_unique<LinearMemory>(0))
{
}

VM::VM(std::unique_ptr<BusDevice> memory, bool tracing)
    : registers_()
    , memory_(std::move(memory))
    , tracing_(tracing)
{
    if (!memory_) {
        throw std::invalid_argument("VM requires a memory device");
    }
}

void VM::set_memory(std::unique_ptr<BusDevice> memory) {
    if (!memory) {
        throw std::invalid_argument("VM requires a memory device");
    }
    memory_ = std::move(memory);
}

void VM::tick() {
    if (halted_) {
        throw VmError(ErrorKind::Halted);
    }

    const VmAddr pc = registers_.program_counter();
    try {
        // Fetch
        auto word = memory_->read16(pc);
        if (!word) {
            throw VmError(ErrorKind::MemoryReadError, "pc " + std::to_string(pc));
        }
        registers_.set(RegisterId::IR, *word);
        registers_.advance_program_counter();

        // Decode
        const DecodedInstruction instr = decode_instruction(*word);

        if (tracing_ || observer_) {
            TraceEntry entry;
            entry.pc = pc;
            entry.opcode = instr.opcode;
            entry.dest = instr.dest;
            entry.source = instr.source;
            entry.immediate = instr.immediate;
            entry.registers = registers_;
            if (observer_) {
                observer_->on_step(entry);
            }
            if (tracing_) {
                trace_.record(std::move(entry));
            }
        }

        // Execute
        const Register dest = resolve_operand(instr.dest, instr.immediate);
        const Register source = resolve_operand(instr.source, instr.immediate);
        execute(instr, dest, source);
        ++tick_count_;
    } catch (const VmError& error) {
        halted_ = true;
        ++tick_count_;
        if (observer_) {
            observer_->on_fault(error, pc);
        }
        throw;
    }

    if (halted_ && observer_) {
        observer_->on_halt(registers_, tick_count_);
    }
}

size_t VM::run(size_t max_ticks) {
    size_t ticks = 0;
    while (!halted_ && ticks < max_ticks) {
        tick();
        ++ticks;
    }
    return ticks;
}

Register VM::resolve_operand(uint8_t field, uint8_t immediate) {
    if (field == register_index(RegisterId::IM) && immediate != 0) {
        registers_.set(RegisterId::IM, immediate);
    }
    return registers_.get(field);
}

void VM::execute(const DecodedInstruction& instr, const Register& dest, const Register& source) {
    switch (instr.opcode) {
        case Opcode::Halt:
            halted_ = true;
            break;

        case Opcode::Copy:
            registers_.get_mut(dest.id).value = source.value;
            break;

        case Opcode::Load: {
            auto value = memory_->read16(source.value);
            if (!value) {
                throw VmError(ErrorKind::OutOfBounds, "load from " + std::to_string(source.value));
            }
            registers_.get_mut(dest.id).value = *value;
            break;
        }

        case Opcode::Write:
            memory_->write16(dest.value, source.value);
            break;

        case Opcode::Add: {
            const uint32_t sum = static_cast<uint32_t>(dest.value) + source.value;
            if (sum > 0xFFFF) {
                throw VmError(ErrorKind::Overflow,
                              std::to_string(dest.value) + " + " + std::to_string(source.value));
            }
            registers_.get_mut(dest.id).value = static_cast<VmWord>(sum);
            break;
        }

        case Opcode::LoadImm:
            // Operand resolution already placed the immediate in IM
            break;

        case Opcode::StoreOut:
            memory_->write16(OUTPUT_ADDRESS, source.value);
            break;
    }
}

} // namespace zkvm16
