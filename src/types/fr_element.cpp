#include "types/fr_element.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace zkvm16 {
namespace {

using Limbs = FrElement::Limbs;
constexpr size_t N = FrElement::NUM_LIMBS;

// r = a - b, returns the final borrow
uint64_t sub_limbs(Limbs& r, const Limbs& a, const Limbs& b) {
    uint64_t borrow = 0;
    for (size_t i = 0; i < N; ++i) {
        uint64_t diff = a[i] - b[i];
        uint64_t borrow_a = static_cast<uint64_t>(a[i] < b[i]);
        uint64_t result = diff - borrow;
        uint64_t borrow_b = static_cast<uint64_t>(diff < borrow);
        r[i] = result;
        borrow = borrow_a | borrow_b;
    }
    return borrow;
}

// r = a + b, returns the final carry
uint64_t add_limbs(Limbs& r, const Limbs& a, const Limbs& b) {
    uint64_t carry = 0;
    for (size_t i = 0; i < N; ++i) {
        uint128_t sum = static_cast<uint128_t>(a[i]) + b[i] + carry;
        r[i] = static_cast<uint64_t>(sum);
        carry = static_cast<uint64_t>(sum >> 64);
    }
    return carry;
}

bool is_zero_limbs(const Limbs& value) {
    return (value[0] | value[1] | value[2] | value[3]) == 0;
}

// -r^-1 mod 2^64 via Newton iteration; each step doubles the correct low bits.
uint64_t compute_mont_inv() {
    const uint64_t r0 = FrElement::MODULUS[0];
    uint64_t inv = 1;
    for (int i = 0; i < 6; ++i) {
        inv *= 2 - r0 * inv;
    }
    return ~inv + 1;
}

uint64_t mont_inv() {
    static const uint64_t inv = compute_mont_inv();
    return inv;
}

} // namespace

bool FrElement::geq_modulus(const Limbs& value) {
    for (size_t i = N; i-- > 0;) {
        if (value[i] != MODULUS[i]) {
            return value[i] > MODULUS[i];
        }
    }
    return true;
}

void FrElement::reduce_once(Limbs& value) {
    // 2^256 < 6r, so at most five subtractions for any 256-bit input
    while (geq_modulus(value)) {
        sub_limbs(value, value, MODULUS);
    }
}

FrElement FrElement::from_limbs(const Limbs& limbs) {
    FrElement result;
    result.limbs_ = limbs;
    reduce_once(result.limbs_);
    return result;
}

FrElement FrElement::from_be_bytes_mod_order(const std::array<uint8_t, NUM_BYTES>& bytes) {
    Limbs limbs{};
    for (size_t limb = 0; limb < N; ++limb) {
        uint64_t value = 0;
        const size_t offset = (N - 1 - limb) * 8;
        for (size_t i = 0; i < 8; ++i) {
            value = (value << 8) | bytes[offset + i];
        }
        limbs[limb] = value;
    }
    return from_limbs(limbs);
}

FrElement FrElement::from_hex(const std::string& hex) {
    std::string digits = hex;
    if (digits.rfind("0x", 0) == 0 || digits.rfind("0X", 0) == 0) {
        digits = digits.substr(2);
    }
    if (digits.empty() || digits.size() > NUM_BYTES * 2) {
        throw std::invalid_argument("Invalid hex string length for FrElement");
    }

    Limbs limbs{};
    size_t bit = 0;
    for (size_t i = digits.size(); i-- > 0;) {
        unsigned char ch = static_cast<unsigned char>(digits[i]);
        if (!std::isxdigit(ch)) {
            throw std::invalid_argument("Invalid hex digit in FrElement: " + hex);
        }
        uint64_t nibble = std::isdigit(ch) ? (ch - '0') : (std::tolower(ch) - 'a' + 10);
        limbs[bit / 64] |= nibble << (bit % 64);
        bit += 4;
    }
    return from_limbs(limbs);
}

std::array<uint8_t, FrElement::NUM_BYTES> FrElement::to_be_bytes() const {
    std::array<uint8_t, NUM_BYTES> bytes{};
    for (size_t limb = 0; limb < N; ++limb) {
        const size_t offset = (N - 1 - limb) * 8;
        for (size_t i = 0; i < 8; ++i) {
            bytes[offset + i] = static_cast<uint8_t>(limbs_[limb] >> (56 - 8 * i));
        }
    }
    return bytes;
}

// CIOS Montgomery multiplication
FrElement::Limbs FrElement::mont_mul(const Limbs& a, const Limbs& b) {
    const uint64_t inv = mont_inv();
    std::array<uint64_t, N + 2> t{};

    for (size_t i = 0; i < N; ++i) {
        uint64_t carry = 0;
        for (size_t j = 0; j < N; ++j) {
            uint128_t s = static_cast<uint128_t>(a[j]) * b[i] + t[j] + carry;
            t[j] = static_cast<uint64_t>(s);
            carry = static_cast<uint64_t>(s >> 64);
        }
        uint128_t s = static_cast<uint128_t>(t[N]) + carry;
        t[N] = static_cast<uint64_t>(s);
        t[N + 1] = static_cast<uint64_t>(s >> 64);

        const uint64_t m = t[0] * inv;
        s = static_cast<uint128_t>(m) * MODULUS[0] + t[0];
        carry = static_cast<uint64_t>(s >> 64);
        for (size_t j = 1; j < N; ++j) {
            s = static_cast<uint128_t>(m) * MODULUS[j] + t[j] + carry;
            t[j - 1] = static_cast<uint64_t>(s);
            carry = static_cast<uint64_t>(s >> 64);
        }
        s = static_cast<uint128_t>(t[N]) + carry;
        t[N - 1] = static_cast<uint64_t>(s);
        t[N] = t[N + 1] + static_cast<uint64_t>(s >> 64);
    }

    Limbs result = {t[0], t[1], t[2], t[3]};
    if (t[N] != 0 || geq_modulus(result)) {
        sub_limbs(result, result, MODULUS);
    }
    return result;
}

FrElement FrElement::operator+(const FrElement& rhs) const {
    // Both operands are below r < 2^254, so the sum never carries out
    FrElement result;
    add_limbs(result.limbs_, limbs_, rhs.limbs_);
    if (geq_modulus(result.limbs_)) {
        sub_limbs(result.limbs_, result.limbs_, MODULUS);
    }
    return result;
}

FrElement FrElement::operator-(const FrElement& rhs) const {
    FrElement result;
    if (sub_limbs(result.limbs_, limbs_, rhs.limbs_) != 0) {
        add_limbs(result.limbs_, result.limbs_, MODULUS);
    }
    return result;
}

FrElement FrElement::operator*(const FrElement& rhs) const {
    // R^2 mod r, i.e. 2^512 mod r, built by doubling
    static const Limbs r_squared = [] {
        FrElement acc = FrElement::one();
        for (int i = 0; i < 512; ++i) {
            acc = acc + acc;
        }
        return acc.limbs_;
    }();

    // (a * b * R^-1) * R^2 * R^-1 = a * b
    FrElement result;
    result.limbs_ = mont_mul(mont_mul(limbs_, rhs.limbs_), r_squared);
    return result;
}

FrElement FrElement::operator-() const {
    if (is_zero()) return *this;
    FrElement result;
    sub_limbs(result.limbs_, MODULUS, limbs_);
    return result;
}

FrElement& FrElement::operator+=(const FrElement& rhs) {
    *this = *this + rhs;
    return *this;
}

FrElement& FrElement::operator-=(const FrElement& rhs) {
    *this = *this - rhs;
    return *this;
}

FrElement& FrElement::operator*=(const FrElement& rhs) {
    *this = *this * rhs;
    return *this;
}

bool FrElement::operator==(const FrElement& rhs) const {
    return limbs_ == rhs.limbs_;
}

bool FrElement::operator!=(const FrElement& rhs) const {
    return !(*this == rhs);
}

bool FrElement::operator<(const FrElement& rhs) const {
    for (size_t i = N; i-- > 0;) {
        if (limbs_[i] != rhs.limbs_[i]) {
            return limbs_[i] < rhs.limbs_[i];
        }
    }
    return false;
}

bool FrElement::is_zero() const {
    return is_zero_limbs(limbs_);
}

bool FrElement::is_one() const {
    return limbs_[0] == 1 && limbs_[1] == 0 && limbs_[2] == 0 && limbs_[3] == 0;
}

FrElement FrElement::square() const {
    return *this * *this;
}

FrElement FrElement::pow(uint64_t exp) const {
    return pow(Limbs{exp, 0, 0, 0});
}

FrElement FrElement::pow(const Limbs& exp) const {
    FrElement result = FrElement::one();
    for (size_t bit = N * 64; bit-- > 0;) {
        result = result.square();
        if ((exp[bit / 64] >> (bit % 64)) & 1) {
            result *= *this;
        }
    }
    return result;
}

FrElement FrElement::inverse() const {
    if (is_zero()) {
        throw std::domain_error("Cannot invert zero");
    }

    // Use Fermat's little theorem: a^(-1) = a^(r-2) mod r
    Limbs exp;
    sub_limbs(exp, MODULUS, Limbs{2, 0, 0, 0});
    return pow(exp);
}

std::string FrElement::to_string() const {
    Limbs value = limbs_;
    std::string digits;
    do {
        uint128_t remainder = 0;
        for (size_t i = N; i-- > 0;) {
            uint128_t current = (remainder << 64) | value[i];
            value[i] = static_cast<uint64_t>(current / 10);
            remainder = current % 10;
        }
        digits.push_back(static_cast<char>('0' + static_cast<int>(remainder)));
    } while (!is_zero_limbs(value));
    std::reverse(digits.begin(), digits.end());
    return digits;
}

std::string FrElement::to_hex() const {
    std::ostringstream oss;
    oss << "0x";
    for (size_t i = N; i-- > 0;) {
        oss << std::setfill('0') << std::setw(16) << std::hex << limbs_[i];
    }
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const FrElement& elem) {
    return os << elem.to_string();
}

} // namespace zkvm16
