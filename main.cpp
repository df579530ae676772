#include "common/config.hpp"
#include "common/errors.hpp"
#include "vm/program.hpp"
#include "zk/prover_input.hpp"
#include "zk/witness_export.hpp"
#include <iostream>
#include <string>

using namespace zkvm16;

namespace {

constexpr int EXIT_VM_ERROR = 1;
constexpr int EXIT_USAGE = 2;

void print_usage(const char* argv0) {
    std::cerr << "Usage:\n";
    std::cerr << "  " << argv0 << " [--program FILE] [--trace] [--capacity N] [--memory N] [--json OUT]\n";
    std::cerr << "    --program FILE  assembly source to run (default: built-in demo program)\n";
    std::cerr << "    --trace         record the execution trace and commit every step\n";
    std::cerr << "    --capacity N    pad the trace commitments to N entries\n";
    std::cerr << "    --memory N      memory size in bytes (default " << DEFAULT_MEMORY_SIZE << ")\n";
    std::cerr << "    --json OUT      write the prover artifacts to OUT\n";
    std::cerr << "  Flags override ZKVM16_TRACE, ZKVM16_TRACE_CAPACITY and ZKVM16_MEMORY_SIZE.\n";
}

struct Options {
    RunConfig config;
    std::string program_path;
    std::string json_path;
};

/**
 * Parse the command line on top of the environment configuration.
 * Throws VmError(ConfigError) for malformed values and unknown flags.
 */
Options parse_options(int argc, char* argv[]) {
    Options options;
    options.config = RunConfig::from_env();

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next_value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw VmError(ErrorKind::ConfigError, arg + " needs a value");
            }
            return argv[++i];
        };

        if (arg == "--program") {
            options.program_path = next_value();
        } else if (arg == "--trace") {
            options.config.trace_enabled = true;
        } else if (arg == "--capacity") {
            options.config.trace_capacity = RunConfig::parse_trace_capacity(next_value(), "--capacity");
        } else if (arg == "--memory") {
            options.config.memory_size = RunConfig::parse_memory_size(next_value(), "--memory");
        } else if (arg == "--json") {
            options.json_path = next_value();
        } else {
            throw VmError(ErrorKind::ConfigError, "unknown argument '" + arg + "'");
        }
    }
    return options;
}

} // namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
    }

    Options options;
    Program program;
    try {
        options = parse_options(argc, argv);
        program = options.program_path.empty() ? Program::demo()
                                               : Program::from_file(options.program_path);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    try {
        std::cout << "=== zkvm16 ===" << std::endl;
        std::cout << "Program: "
                  << (options.program_path.empty() ? "<demo>" : options.program_path)
                  << " (" << program.size() << " words)" << std::endl;
        std::cout << program.disassemble();
        std::cout << "Memory: " << options.config.memory_size << " bytes, tracing "
                  << (options.config.trace_enabled ? "on" : "off") << std::endl;
        std::cout << std::endl;

        ProverInput input = build_prover_input(program, options.config);

        std::cout << "Halted after " << input.ticks << " ticks" << std::endl;
        std::cout << "Output value: " << input.output_value << std::endl;
        std::cout << "Program commitment: " << input.zk.program()->public_value << std::endl;
        std::cout << "Output commitment:  " << input.zk.output()->public_value << std::endl;
        if (input.zk.trace()) {
            const TraceWitness& witness = *input.zk.trace();
            std::cout << "Trace commitments:  " << witness.steps << " steps, padded to "
                      << witness.capacity() << std::endl;
            for (size_t i = 0; i < witness.steps; ++i) {
                std::cout << "  [" << i << "] " << witness.public_values[i] << std::endl;
            }
        }

        if (!options.json_path.empty()) {
            save_to_file(input, options.json_path);
            std::cout << "Artifacts written to " << options.json_path << std::endl;
        }
    } catch (const VmError& e) {
        std::cerr << "Error [" << error_kind_name(e.kind()) << "]: " << e.what() << std::endl;
        return e.kind() == ErrorKind::ConfigError ? EXIT_USAGE : EXIT_VM_ERROR;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_VM_ERROR;
    }

    return 0;
}
