#include "types/digest.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace zkvm16 {

FrElement Digest::to_field_element() const {
    return FrElement::from_be_bytes_mod_order(bytes_);
}

bool Digest::operator==(const Digest& rhs) const {
    return bytes_ == rhs.bytes_;
}

bool Digest::operator!=(const Digest& rhs) const {
    return !(*this == rhs);
}

std::string Digest::to_hex() const {
    std::ostringstream oss;
    for (uint8_t byte : bytes_) {
        oss << std::setfill('0') << std::setw(2) << std::hex << static_cast<int>(byte);
    }
    return oss.str();
}

Digest Digest::from_hex(const std::string& hex) {
    if (hex.length() != LEN * 2) {
        throw std::invalid_argument("Invalid hex string length for Digest");
    }

    Bytes bytes;
    for (size_t i = 0; i < LEN; ++i) {
        const unsigned char hi = static_cast<unsigned char>(hex[2 * i]);
        const unsigned char lo = static_cast<unsigned char>(hex[2 * i + 1]);
        if (!std::isxdigit(hi) || !std::isxdigit(lo)) {
            throw std::invalid_argument("Invalid hex digit in Digest: " + hex);
        }
        bytes[i] = static_cast<uint8_t>(std::stoul(hex.substr(2 * i, 2), nullptr, 16));
    }

    return Digest(bytes);
}

std::ostream& operator<<(std::ostream& os, const Digest& digest) {
    return os << digest.to_hex();
}

} // namespace zkvm16
