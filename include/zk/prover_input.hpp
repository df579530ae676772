#pragma once

#include "common/config.hpp"
#include "vm/program.hpp"
#include "zk/commitment.hpp"

namespace zkvm16 {

/**
 * Everything an external prover needs from one run of a program.
 */
struct ProverInput {
    size_t ticks = 0;
    VmWord output_value = 0;
    ZkContext zk;
};

/**
 * Commit the program, run it to completion in a fresh VM over
 * LinearMemory(config.memory_size), then commit the final state and, when
 * tracing is enabled, the trace padded to config.require_trace_capacity().
 *
 * VM errors propagate; no partial result is returned.
 */
ProverInput build_prover_input(const Program& program, const RunConfig& config);

} // namespace zkvm16
