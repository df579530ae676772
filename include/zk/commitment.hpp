#pragma once

#include "types/fr_element.hpp"
#include "vm/bus.hpp"
#include "vm/program.hpp"
#include "vm/register.hpp"
#include "vm/trace.hpp"
#include <optional>
#include <vector>

namespace zkvm16 {

/**
 * A committed value: `private_value` is SHA-256 of the pre-image reduced
 * into the BN254 scalar field, `public_value` is its Poseidon hash.
 */
struct Commitment {
    FrElement public_value;
    FrElement private_value;

    bool operator==(const Commitment& rhs) const {
        return public_value == rhs.public_value && private_value == rhs.private_value;
    }
    bool operator!=(const Commitment& rhs) const { return !(*this == rhs); }
};

/**
 * Per-step commitments, in execution order. Entries past `steps` are zero
 * padding.
 */
struct TraceWitness {
    std::vector<FrElement> public_values;
    std::vector<FrElement> private_values;
    size_t steps = 0;

    size_t capacity() const { return public_values.size(); }
};

// SHA-256, read big-endian and reduced modulo r
FrElement hash_to_field(const std::vector<uint8_t>& bytes);

// {poseidon(hash_to_field(bytes)), hash_to_field(bytes)}
Commitment commit_bytes(const std::vector<uint8_t>& bytes);

/**
 * Canonical pre-image of one trace step: register snapshot, the word at
 * the entry's PC in `memory`, the PC and the opcode.
 */
std::vector<uint8_t> encode_step(const TraceEntry& entry, const BusDevice& memory);

TraceWitness commit_trace(const ExecutionTrace& trace, const BusDevice& memory);

/**
 * Extend both sequences with zeros up to `capacity`. VmError(ConfigError)
 * when the witness already holds more than `capacity` entries.
 */
void pad_witness(TraceWitness& witness, size_t capacity);

// Commitment of the program words (u64 length prefix, then the words)
Commitment commit_program(const Program& program);

/**
 * Commitment of the final machine state: the word at OUTPUT_ADDRESS, the
 * memory from START_ADDRESS up to the final PC, and the register bank.
 * VmError(MemoryReadError) when the output word is unreadable,
 * VmError(OutOfBounds) when the range is not inside memory.
 */
Commitment commit_output(const BusDevice& memory, const RegisterBank& registers);

/**
 * ZkContext - the artifacts handed to the external prover
 */
class ZkContext {
public:
    void set_public_program(const Program& program);
    void set_public_output(const BusDevice& memory, const RegisterBank& registers);

    /**
     * Commit every trace step; pads to `capacity` when one is given.
     */
    void set_trace(const ExecutionTrace& trace, const BusDevice& memory,
                   std::optional<size_t> capacity);

    const std::optional<Commitment>& program() const { return program_; }
    const std::optional<Commitment>& output() const { return output_; }
    const std::optional<TraceWitness>& trace() const { return trace_; }

private:
    std::optional<Commitment> program_;
    std::optional<Commitment> output_;
    std::optional<TraceWitness> trace_;
};

} // namespace zkvm16
