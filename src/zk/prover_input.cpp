#include "zk/prover_input.hpp"
#include "vm/linear_memory.hpp"
#include "vm/vm.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include <chrono>
#include <memory>

namespace zkvm16 {
namespace {

double elapsed_ms(std::chrono::high_resolution_clock::time_point start) {
    auto end = std::chrono::high_resolution_clock::now();
    return std::chrono::duration_cast<std::chrono::microseconds>(end - start).count() / 1000.0;
}

} // namespace

ProverInput build_prover_input(const Program& program, const RunConfig& config) {
    // Fail on a missing capacity before doing any work
    const std::optional<size_t> capacity =
        config.trace_enabled ? std::optional<size_t>(config.require_trace_capacity()) : std::nullopt;

    ProverInput input;

    auto start = std::chrono::high_resolution_clock::now();
    input.zk.set_public_program(program);
    ZKVM16_PROFILE_COUT("[profile] program commitment: " << elapsed_ms(start) << " ms" << std::endl);

    auto memory = std::make_unique<LinearMemory>(config.memory_size);
    program.load_into(*memory, START_ADDRESS);

    VM vm(std::move(memory), config.trace_enabled);
    DebugObserver observer;
    ZKVM16_IF_DEBUG {
        vm.set_observer(&observer);
    }

    start = std::chrono::high_resolution_clock::now();
    while (!vm.halted()) {
        vm.tick();
    }
    input.ticks = vm.tick_count();
    ZKVM16_PROFILE_COUT("[profile] execution: " << input.ticks << " ticks in "
                        << elapsed_ms(start) << " ms" << std::endl);

    start = std::chrono::high_resolution_clock::now();
    input.zk.set_public_output(vm.memory(), vm.registers());
    input.output_value = vm.memory().read16(OUTPUT_ADDRESS).value();
    ZKVM16_PROFILE_COUT("[profile] output commitment: " << elapsed_ms(start) << " ms" << std::endl);

    if (vm.tracing()) {
        start = std::chrono::high_resolution_clock::now();
        input.zk.set_trace(vm.trace(), vm.memory(), capacity);
        ZKVM16_PROFILE_COUT("[profile] trace commitments: " << vm.trace().size() << " steps in "
                            << elapsed_ms(start) << " ms" << std::endl);
    }

    return input;
}

} // namespace zkvm16
