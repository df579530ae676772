#include "hash/poseidon.hpp"
#include <stdexcept>
#include <string>

namespace zkvm16 {
namespace {

constexpr size_t FIELD_BITS = FrElement::NUM_BITS;

/**
 * GrainLfsr - the 80-bit self-shrinking LFSR of the Poseidon reference
 * parameter script
 *
 * Seeded with the instance description (prime field, x^alpha S-box, field
 * size, width, round counts) followed by thirty 1 bits. The first 160
 * outputs of the raw register are discarded.
 */
class GrainLfsr {
public:
    GrainLfsr(size_t width, size_t full_rounds, size_t partial_rounds) {
        size_t pos = 0;
        auto push_bits = [&](uint64_t value, size_t count) {
            for (size_t i = count; i-- > 0;) {
                bits_[pos++] = static_cast<uint8_t>((value >> i) & 1);
            }
        };
        push_bits(1, 2);                 // field: GF(p)
        push_bits(0, 4);                 // S-box: x^alpha
        push_bits(FIELD_BITS, 12);
        push_bits(width, 12);
        push_bits(full_rounds, 10);
        push_bits(partial_rounds, 10);
        push_bits((1ULL << 30) - 1, 30);

        for (size_t i = 0; i < 160; ++i) {
            clock();
        }
    }

    // One output bit of the shrinking generator
    uint8_t next_bit() {
        uint8_t bit = clock();
        while (bit == 0) {
            clock();
            bit = clock();
        }
        return clock();
    }

    // FIELD_BITS output bits, most significant first
    FrElement::Limbs next_limbs() {
        FrElement::Limbs limbs{};
        for (size_t i = 0; i < FIELD_BITS; ++i) {
            for (size_t j = FrElement::NUM_LIMBS - 1; j > 0; --j) {
                limbs[j] = (limbs[j] << 1) | (limbs[j - 1] >> 63);
            }
            limbs[0] = (limbs[0] << 1) | next_bit();
        }
        return limbs;
    }

    // Rejection sampling: draws until the value is below the modulus
    FrElement next_field_element() {
        while (true) {
            FrElement::Limbs limbs = next_limbs();
            if (less_than_modulus(limbs)) {
                return FrElement::from_limbs(limbs);
            }
        }
    }

    // A draw reduced modulo r instead of rejected
    FrElement next_field_element_mod_order() {
        return FrElement::from_limbs(next_limbs());
    }

private:
    std::array<uint8_t, 80> bits_{};
    size_t head_ = 0;

    // Feedback taps 62, 51, 38, 23, 13, 0 relative to the oldest bit
    uint8_t clock() {
        auto at = [this](size_t offset) { return bits_[(head_ + offset) % 80]; };
        uint8_t bit = at(62) ^ at(51) ^ at(38) ^ at(23) ^ at(13) ^ at(0);
        bits_[head_] = bit;
        head_ = (head_ + 1) % 80;
        return bit;
    }

    static bool less_than_modulus(const FrElement::Limbs& limbs) {
        for (size_t i = FrElement::NUM_LIMBS; i-- > 0;) {
            if (limbs[i] != FrElement::MODULUS[i]) {
                return limbs[i] < FrElement::MODULUS[i];
            }
        }
        return false;
    }
};

Poseidon::Parameters generate_parameters() {
    GrainLfsr lfsr(Poseidon::WIDTH, Poseidon::FULL_ROUNDS, Poseidon::PARTIAL_ROUNDS);

    Poseidon::Parameters params;
    params.round_constants.reserve(Poseidon::NUM_ROUNDS * Poseidon::WIDTH);
    for (size_t i = 0; i < Poseidon::NUM_ROUNDS * Poseidon::WIDTH; ++i) {
        params.round_constants.push_back(lfsr.next_field_element());
    }

    // Cauchy matrix M[i][j] = 1 / (x_i + y_j); redraw until all 2t points are
    // distinct and no x_i + y_j vanishes
    while (true) {
        std::array<FrElement, 2 * Poseidon::WIDTH> points;
        for (auto& point : points) {
            point = lfsr.next_field_element_mod_order();
        }

        bool valid = true;
        for (size_t i = 0; i < points.size() && valid; ++i) {
            for (size_t j = i + 1; j < points.size(); ++j) {
                if (points[i] == points[j]) {
                    valid = false;
                    break;
                }
            }
        }
        for (size_t i = 0; i < Poseidon::WIDTH && valid; ++i) {
            for (size_t j = 0; j < Poseidon::WIDTH; ++j) {
                if ((points[i] + points[Poseidon::WIDTH + j]).is_zero()) {
                    valid = false;
                    break;
                }
            }
        }
        if (!valid) continue;

        for (size_t i = 0; i < Poseidon::WIDTH; ++i) {
            for (size_t j = 0; j < Poseidon::WIDTH; ++j) {
                params.mds[i][j] = (points[i] + points[Poseidon::WIDTH + j]).inverse();
            }
        }
        return params;
    }
}

} // namespace

const Poseidon::Parameters& Poseidon::parameters() {
    static const Parameters params = generate_parameters();
    return params;
}

Poseidon::Poseidon() : state{} {}

Poseidon::Poseidon(const State& initial) : state(initial) {}

bool Poseidon::is_full_round(size_t round_index) {
    return round_index < FULL_ROUNDS / 2 || round_index >= FULL_ROUNDS / 2 + PARTIAL_ROUNDS;
}

FrElement Poseidon::sbox(const FrElement& x) {
    FrElement x2 = x.square();
    return x2.square() * x;
}

void Poseidon::add_round_constants(size_t round_index) {
    const auto& constants = parameters().round_constants;
    for (size_t i = 0; i < WIDTH; ++i) {
        state[i] += constants[round_index * WIDTH + i];
    }
}

void Poseidon::sbox_layer(size_t round_index) {
    if (is_full_round(round_index)) {
        for (auto& element : state) {
            element = sbox(element);
        }
    } else {
        state[0] = sbox(state[0]);
    }
}

void Poseidon::mds_layer() {
    const Matrix& mds = parameters().mds;
    State result{};
    for (size_t i = 0; i < WIDTH; ++i) {
        for (size_t j = 0; j < WIDTH; ++j) {
            result[i] += mds[i][j] * state[j];
        }
    }
    state = result;
}

void Poseidon::round(size_t round_index) {
    if (round_index >= NUM_ROUNDS) {
        throw std::out_of_range("Poseidon round index out of range: " + std::to_string(round_index));
    }
    add_round_constants(round_index);
    sbox_layer(round_index);
    mds_layer();
}

void Poseidon::permutation() {
    for (size_t r = 0; r < NUM_ROUNDS; ++r) {
        round(r);
    }
}

FrElement Poseidon::hash(const FrElement& input) {
    Poseidon sponge(State{FrElement::zero(), input});
    sponge.permutation();
    return sponge.state[0];
}

} // namespace zkvm16
