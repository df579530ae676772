#pragma once

#include "common/errors.hpp"
#include "vm/trace.hpp"

namespace zkvm16 {

/**
 * Hooks into VM execution. All callbacks default to no-ops.
 *
 * on_step sees the same pre-execution state a trace entry records, whether
 * or not tracing is enabled.
 */
class ExecutionObserver {
public:
    virtual ~ExecutionObserver() = default;

    virtual void on_step(const TraceEntry& /*step*/) {}
    virtual void on_halt(const RegisterBank& /*registers*/, size_t /*ticks*/) {}
    virtual void on_fault(const VmError& /*error*/, VmAddr /*pc*/) {}
};

/**
 * Writes each event to the console when ZKVM16_DEBUG is enabled.
 */
class DebugObserver : public ExecutionObserver {
public:
    void on_step(const TraceEntry& step) override;
    void on_halt(const RegisterBank& registers, size_t ticks) override;
    void on_fault(const VmError& error, VmAddr pc) override;
};

} // namespace zkvm16
