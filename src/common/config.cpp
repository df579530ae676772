#include "common/config.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace zkvm16 {

std::optional<unsigned long long> parse_unsigned(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    int base = 10;
    size_t offset = 0;
    if (text.rfind("0x", 0) == 0 || text.rfind("0X", 0) == 0) {
        base = 16;
        offset = 2;
    }
    if (offset >= text.size()) {
        return std::nullopt;
    }
    for (size_t i = offset; i < text.size(); ++i) {
        unsigned char ch = static_cast<unsigned char>(text[i]);
        if (base == 10 ? !std::isdigit(ch) : !std::isxdigit(ch)) {
            return std::nullopt;
        }
    }
    try {
        return std::stoull(text.substr(offset), nullptr, base);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

size_t RunConfig::parse_memory_size(const std::string& text, const std::string& source) {
    auto value = parse_unsigned(text);
    if (!value || *value == 0 || *value > MAX_MEMORY_SIZE) {
        throw VmError(ErrorKind::ConfigError,
                      source + " must be a memory size in 1.." + std::to_string(MAX_MEMORY_SIZE) +
                      ", got '" + text + "'");
    }
    return static_cast<size_t>(*value);
}

size_t RunConfig::parse_trace_capacity(const std::string& text, const std::string& source) {
    auto value = parse_unsigned(text);
    if (!value || *value == 0) {
        throw VmError(ErrorKind::ConfigError,
                      source + " must be a positive integer, got '" + text + "'");
    }
    return static_cast<size_t>(*value);
}

RunConfig RunConfig::from_env() {
    RunConfig config;
    if (const char* env = std::getenv("ZKVM16_MEMORY_SIZE")) {
        config.memory_size = parse_memory_size(env, "ZKVM16_MEMORY_SIZE");
    }
    config.trace_enabled = debug::env_flag_enabled("ZKVM16_TRACE");
    if (const char* env = std::getenv("ZKVM16_TRACE_CAPACITY")) {
        config.trace_capacity = parse_trace_capacity(env, "ZKVM16_TRACE_CAPACITY");
    }
    return config;
}

size_t RunConfig::require_trace_capacity() const {
    if (!trace_capacity.has_value()) {
        throw VmError(ErrorKind::ConfigError,
                      "trace capacity is not set (ZKVM16_TRACE_CAPACITY or --capacity)");
    }
    return *trace_capacity;
}

} // namespace zkvm16
