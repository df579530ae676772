#pragma once

#include "types/fr_element.hpp"
#include <array>
#include <vector>

namespace zkvm16 {

/**
 * Poseidon - arithmetization-oriented hash over the BN254 scalar field
 *
 * The single-input instance used by circomlib's `Poseidon(1)` template:
 * state width 2, S-box x^5, 8 full rounds (4 before and 4 after) and 56
 * partial rounds. Round constants and the Cauchy MDS matrix are derived
 * with the Grain LFSR of the Poseidon reference parameter script, so the
 * outputs agree with circomlib and circomlibjs.
 */
class Poseidon {
public:
    static constexpr size_t WIDTH = 2;
    static constexpr size_t FULL_ROUNDS = 8;
    static constexpr size_t PARTIAL_ROUNDS = 56;
    static constexpr size_t NUM_ROUNDS = FULL_ROUNDS + PARTIAL_ROUNDS;
    static constexpr uint64_t ALPHA = 5;

    using State = std::array<FrElement, WIDTH>;
    using Matrix = std::array<std::array<FrElement, WIDTH>, WIDTH>;

    struct Parameters {
        std::vector<FrElement> round_constants;  // NUM_ROUNDS * WIDTH, round-major
        Matrix mds;
    };

    /**
     * Shared parameter set, generated on first use.
     */
    static const Parameters& parameters();

    // State
    State state;

    // Constructors
    Poseidon();
    explicit Poseidon(const State& initial);

    // Core operations
    void permutation();
    void round(size_t round_index);

    // Poseidon([x]): permute (0, x) and return the first state element
    static FrElement hash(const FrElement& input);

private:
    void add_round_constants(size_t round_index);
    void sbox_layer(size_t round_index);
    void mds_layer();

    static bool is_full_round(size_t round_index);
    static FrElement sbox(const FrElement& x);
};

} // namespace zkvm16
