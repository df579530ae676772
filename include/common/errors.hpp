#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace zkvm16 {

/**
 * Every failure the machine and the commitment pipeline report.
 */
enum class ErrorKind : uint8_t {
    OutOfBounds,
    UnknownRegister,
    UnknownOpcode,
    Overflow,
    MemoryReadError,
    CopyFailed,
    Halted,
    ConfigError
};

const char* error_kind_name(ErrorKind kind);

// Fixed human-readable message for a kind
const char* error_message(ErrorKind kind);

/**
 * VmError - typed VM failure
 *
 * what() is the kind's message, followed by the detail when one was given.
 */
class VmError : public std::runtime_error {
public:
    explicit VmError(ErrorKind kind, const std::string& detail = "");

    ErrorKind kind() const { return kind_; }
    const std::string& detail() const { return detail_; }

private:
    ErrorKind kind_;
    std::string detail_;
};

} // namespace zkvm16
