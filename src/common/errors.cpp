#include "common/errors.hpp"

namespace zkvm16 {
namespace {

std::string compose_message(ErrorKind kind, const std::string& detail) {
    std::string message = error_message(kind);
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return message;
}

} // namespace

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::OutOfBounds: return "OutOfBounds";
        case ErrorKind::UnknownRegister: return "UnknownRegister";
        case ErrorKind::UnknownOpcode: return "UnknownOpcode";
        case ErrorKind::Overflow: return "Overflow";
        case ErrorKind::MemoryReadError: return "MemoryReadError";
        case ErrorKind::CopyFailed: return "CopyFailed";
        case ErrorKind::Halted: return "Halted";
        case ErrorKind::ConfigError: return "ConfigError";
    }
    return "Unknown";
}

const char* error_message(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::OutOfBounds: return "Memory access is out of bounds";
        case ErrorKind::UnknownRegister: return "Unknown register";
        case ErrorKind::UnknownOpcode: return "Unknown opcode";
        case ErrorKind::Overflow: return "Arithmetic overflow";
        case ErrorKind::MemoryReadError: return "Could not read instruction from memory";
        case ErrorKind::CopyFailed: return "Copy source is not readable";
        case ErrorKind::Halted: return "Cannot use a halted machine";
        case ErrorKind::ConfigError: return "Invalid configuration";
    }
    return "Unknown error";
}

VmError::VmError(ErrorKind kind, const std::string& detail)
    : std::runtime_error(compose_message(kind, detail))
    , kind_(kind)
    , detail_(detail)
{
}

} // namespace zkvm16
