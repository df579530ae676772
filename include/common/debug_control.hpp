#pragma once

#include <cstdlib>
#include <cstring>
#include <iostream>

namespace zkvm16 {
namespace debug {

/**
 * Diagnostic switches, read from the environment once per process:
 * - ZKVM16_PROFILE: commitment and execution timings on stdout
 * - ZKVM16_DEBUG: per-step state on stdout, faults on stderr
 *
 * "1" or "true" turns a switch on; anything else, or unset, leaves it off.
 */

// Also used for ZKVM16_TRACE, which is re-read on every RunConfig::from_env()
inline bool env_flag_enabled(const char* name) {
    const char* env = std::getenv(name);
    return env && (std::strcmp(env, "1") == 0 || std::strcmp(env, "true") == 0);
}

inline bool is_profile_enabled() {
    static const bool enabled = env_flag_enabled("ZKVM16_PROFILE");
    return enabled;
}

inline bool is_debug_enabled() {
    static const bool enabled = env_flag_enabled("ZKVM16_DEBUG");
    return enabled;
}

} // namespace debug
} // namespace zkvm16

#define ZKVM16_PROFILE_COUT(expr) \
    do { \
        if (zkvm16::debug::is_profile_enabled()) { \
            std::cout << expr; \
        } \
    } while(0)

#define ZKVM16_DEBUG_COUT(expr) \
    do { \
        if (zkvm16::debug::is_debug_enabled()) { \
            std::cout << expr; \
        } \
    } while(0)

#define ZKVM16_DEBUG_CERR(expr) \
    do { \
        if (zkvm16::debug::is_debug_enabled()) { \
            std::cerr << expr; \
        } \
    } while(0)

// Guards work that only feeds debug output
#define ZKVM16_IF_DEBUG if (zkvm16::debug::is_debug_enabled())
