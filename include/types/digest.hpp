#pragma once

#include "types/fr_element.hpp"
#include <array>
#include <cstdint>
#include <ostream>
#include <string>

namespace zkvm16 {

/**
 * Digest - 32-byte SHA-256 output
 *
 * Bytes are kept in the order SHA-256 emits them, so to_hex() matches the
 * usual `sha256sum` rendering.
 */
class Digest {
public:
    static constexpr size_t LEN = 32;

    using Bytes = std::array<uint8_t, LEN>;

    // Constructors
    Digest() : bytes_{} {}

    explicit Digest(const Bytes& bytes)
        : bytes_(bytes) {}

    // Accessors
    const Bytes& bytes() const { return bytes_; }
    uint8_t operator[](size_t i) const { return bytes_[i]; }

    /**
     * The digest read as a big-endian 256-bit integer, reduced modulo the
     * BN254 scalar modulus. Always a canonical field element, even for
     * digests at or above the modulus.
     */
    FrElement to_field_element() const;

    // Comparison
    bool operator==(const Digest& rhs) const;
    bool operator!=(const Digest& rhs) const;

    // Hex representation (64 lowercase digits, no prefix)
    std::string to_hex() const;
    static Digest from_hex(const std::string& hex);

    friend std::ostream& operator<<(std::ostream& os, const Digest& digest);

private:
    Bytes bytes_;
};

} // namespace zkvm16
