#pragma once

#include "common/constants.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace zkvm16 {

/**
 * RunConfig - settings for one VM run and its commitments
 *
 * Environment variables (read by from_env()):
 * - ZKVM16_MEMORY_SIZE: memory capacity in bytes (1..65536, default 5000)
 * - ZKVM16_TRACE: "1" or "true" records the execution trace
 * - ZKVM16_TRACE_CAPACITY: padded length of the trace witness
 *
 * Malformed values are reported as VmError(ConfigError).
 */
// Strict decimal or 0x-prefixed hex; nullopt for a sign, stray characters or overflow
std::optional<unsigned long long> parse_unsigned(const std::string& text);

struct RunConfig {
    size_t memory_size = DEFAULT_MEMORY_SIZE;
    bool trace_enabled = false;
    std::optional<size_t> trace_capacity;

    static RunConfig from_env();

    /**
     * Trace capacity, or VmError(ConfigError) when none is configured
     */
    size_t require_trace_capacity() const;

    // Parsers shared by from_env() and the command line
    static size_t parse_memory_size(const std::string& text, const std::string& source);
    static size_t parse_trace_capacity(const std::string& text, const std::string& source);
};

} // namespace zkvm16
