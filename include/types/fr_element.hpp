#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

namespace zkvm16 {

// 128-bit unsigned integer type for intermediate calculations
using uint128_t = __uint128_t;

/**
 * FrElement - BN254 scalar field element
 *
 * Element of the prime field with modulus
 * r = 21888242871839275222246405745257275088548364400416034343698204186575808495617
 *   = 0x30644e72e131a029b85045b68181585d2833e84879b9709143e1f593f0000001,
 * the field circom circuits and Poseidon operate over.
 *
 * Values are stored canonically (0 <= value < r) as four little-endian 64-bit
 * limbs. Multiplication goes through Montgomery reduction internally and
 * converts straight back, so callers never see Montgomery form.
 */
class FrElement {
public:
    static constexpr size_t NUM_LIMBS = 4;
    static constexpr size_t NUM_BYTES = 32;
    static constexpr size_t NUM_BITS = 254;

    using Limbs = std::array<uint64_t, NUM_LIMBS>;

    static constexpr Limbs MODULUS = {
        0x43e1f593f0000001ULL,
        0x2833e84879b97091ULL,
        0xb85045b68181585dULL,
        0x30644e72e131a029ULL
    };

    // Constructors
    constexpr FrElement() : limbs_{0, 0, 0, 0} {}
    constexpr explicit FrElement(uint64_t value) : limbs_{value, 0, 0, 0} {}

    // Any 256-bit integer, reduced modulo r
    static FrElement from_limbs(const Limbs& limbs);

    // Big-endian 256-bit integer, reduced modulo r (the SHA-256 digest path)
    static FrElement from_be_bytes_mod_order(const std::array<uint8_t, NUM_BYTES>& bytes);

    // Parses "0x..." or plain hex, reduced modulo r
    static FrElement from_hex(const std::string& hex);

    // Factory methods
    static constexpr FrElement zero() { return FrElement(0); }
    static constexpr FrElement one() { return FrElement(1); }

    // Accessors
    constexpr const Limbs& limbs() const { return limbs_; }
    std::array<uint8_t, NUM_BYTES> to_be_bytes() const;

    // Arithmetic operations
    FrElement operator+(const FrElement& rhs) const;
    FrElement operator-(const FrElement& rhs) const;
    FrElement operator*(const FrElement& rhs) const;
    FrElement operator-() const;

    FrElement& operator+=(const FrElement& rhs);
    FrElement& operator-=(const FrElement& rhs);
    FrElement& operator*=(const FrElement& rhs);

    // Comparison (on canonical integer values)
    bool operator==(const FrElement& rhs) const;
    bool operator!=(const FrElement& rhs) const;
    bool operator<(const FrElement& rhs) const;

    // Field operations
    FrElement square() const;
    FrElement pow(uint64_t exp) const;
    FrElement pow(const Limbs& exp) const;
    FrElement inverse() const;
    bool is_zero() const;
    bool is_one() const;

    // Decimal representation (circom convention)
    std::string to_string() const;
    // 0x-prefixed, 64 hex digits
    std::string to_hex() const;

    friend std::ostream& operator<<(std::ostream& os, const FrElement& elem);

private:
    Limbs limbs_;

    // Montgomery multiplication: a * b * 2^-256 mod r
    static Limbs mont_mul(const Limbs& a, const Limbs& b);

    // Subtracts r while value >= r
    static void reduce_once(Limbs& value);
    static bool geq_modulus(const Limbs& value);
};

} // namespace zkvm16
