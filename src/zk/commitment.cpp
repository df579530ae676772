#include "zk/commitment.hpp"
#include "zk/byte_encoder.hpp"
#include "hash/poseidon.hpp"
#include "hash/sha256.hpp"
#include "common/errors.hpp"
#include <string>

namespace zkvm16 {

FrElement hash_to_field(const std::vector<uint8_t>& bytes) {
    return Sha256::hash(bytes).to_field_element();
}

Commitment commit_bytes(const std::vector<uint8_t>& bytes) {
    Commitment commitment;
    commitment.private_value = hash_to_field(bytes);
    commitment.public_value = Poseidon::hash(commitment.private_value);
    return commitment;
}

std::vector<uint8_t> encode_step(const TraceEntry& entry, const BusDevice& memory) {
    return encode_step_record(entry.registers.snapshot(),
                              memory.value_at(entry.pc),
                              entry.pc,
                              static_cast<uint8_t>(entry.opcode));
}

TraceWitness commit_trace(const ExecutionTrace& trace, const BusDevice& memory) {
    TraceWitness witness;
    witness.public_values.reserve(trace.size());
    witness.private_values.reserve(trace.size());

    for (const TraceEntry& entry : trace) {
        Commitment step = commit_bytes(encode_step(entry, memory));
        witness.public_values.push_back(step.public_value);
        witness.private_values.push_back(step.private_value);
    }
    witness.steps = trace.size();
    return witness;
}

void pad_witness(TraceWitness& witness, size_t capacity) {
    if (witness.capacity() > capacity) {
        throw VmError(ErrorKind::ConfigError,
                      "trace of " + std::to_string(witness.capacity()) +
                      " steps exceeds capacity " + std::to_string(capacity));
    }
    witness.public_values.resize(capacity, FrElement::zero());
    witness.private_values.resize(capacity, FrElement::zero());
}

Commitment commit_program(const Program& program) {
    ByteEncoder encoder;
    encoder.put_u16_vec(program.words());
    return commit_bytes(encoder.bytes());
}

Commitment commit_output(const BusDevice& memory, const RegisterBank& registers) {
    auto output = memory.read16(OUTPUT_ADDRESS);
    if (!output) {
        throw VmError(ErrorKind::MemoryReadError, "output word at " + std::to_string(OUTPUT_ADDRESS));
    }

    const size_t pc = registers.program_counter();
    if (pc < START_ADDRESS || pc > memory.memory_range()) {
        throw VmError(ErrorKind::OutOfBounds,
                      "final memory range [" + std::to_string(START_ADDRESS) + ", " +
                      std::to_string(pc) + ")");
    }

    ByteEncoder encoder;
    encoder.put_u16(*output);
    encoder.put_bytes(memory.subset(START_ADDRESS, pc));
    encoder.put_registers(registers);
    return commit_bytes(encoder.bytes());
}

void ZkContext::set_public_program(const Program& program) {
    program_ = commit_program(program);
}

void ZkContext::set_public_output(const BusDevice& memory, const RegisterBank& registers) {
    output_ = commit_output(memory, registers);
}

void ZkContext::set_trace(const ExecutionTrace& trace, const BusDevice& memory,
                          std::optional<size_t> capacity) {
    TraceWitness witness = commit_trace(trace, memory);
    if (capacity) {
        pad_witness(witness, *capacity);
    }
    trace_ = std::move(witness);
}

} // namespace zkvm16
