#include "vm/observer.hpp"
#include "common/debug_control.hpp"
#include <iomanip>

namespace zkvm16 {

void DebugObserver::on_step(const TraceEntry& step) {
    ZKVM16_DEBUG_COUT("DEBUG step: pc=0x" << std::hex << std::setw(4) << std::setfill('0')
                      << step.pc << std::dec << " " << step.instruction().to_string()
                      << " | " << step.registers.to_string() << std::endl);
}

void DebugObserver::on_halt(const RegisterBank& registers, size_t ticks) {
    ZKVM16_DEBUG_COUT("DEBUG halt: ticks=" << ticks << " | " << registers.to_string() << std::endl);
}

void DebugObserver::on_fault(const VmError& error, VmAddr pc) {
    ZKVM16_DEBUG_CERR("DEBUG fault at pc=0x" << std::hex << std::setw(4) << std::setfill('0')
                      << pc << std::dec << ": [" << error_kind_name(error.kind()) << "] "
                      << error.what() << std::endl);
}

} // namespace zkvm16
