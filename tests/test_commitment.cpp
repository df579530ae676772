#include <gtest/gtest.h>
#include "zk/commitment.hpp"
#include "zk/byte_encoder.hpp"
#include "zk/prover_input.hpp"
#include "hash/poseidon.hpp"
#include "vm/linear_memory.hpp"
#include "vm/vm.hpp"
#include "common/errors.hpp"
#include <memory>

using namespace zkvm16;

/**
 * Test fixture for the trace-to-commitment pipeline
 */
class CommitmentTest : public ::testing::Test {
protected:
    void SetUp() override {
        program = Program::from_code(
            "add r0, im, 5\nadd r1, im, 3\nadd r0, r1\nstore_out r0\nhalt\n");
    }

    VM run(bool tracing) {
        auto memory = std::make_unique<LinearMemory>(DEFAULT_MEMORY_SIZE);
        program.load_into(*memory);
        VM vm(std::move(memory), tracing);
        vm.run(100);
        return vm;
    }

    Program program;
};

TEST_F(CommitmentTest, CommitBytesIsPoseidonOfReducedSha) {
    std::vector<uint8_t> bytes = {'a', 'b', 'c'};
    Commitment c = commit_bytes(bytes);
    EXPECT_EQ(c.private_value.to_hex(),
              "0x294b2b66eb6cef6d18506fbad92a190c3767a8ca28eb28e8e86b1ea6220015aa");
    EXPECT_EQ(c.public_value, Poseidon::hash(c.private_value));
}

TEST_F(CommitmentTest, ByteEncoderLayout) {
    ByteEncoder encoder;
    encoder.put_u8(0x01);
    encoder.put_u16(0x0302);
    encoder.put_u32(0x07060504);
    encoder.put_u64(0x0F0E0D0C0B0A0908ULL);
    std::vector<uint8_t> expected;
    for (uint8_t i = 1; i <= 0x0F; ++i) expected.push_back(i);
    EXPECT_EQ(encoder.bytes(), expected);
}

TEST_F(CommitmentTest, RegisterBankEncoding) {
    RegisterBank bank;
    ByteEncoder encoder;
    encoder.put_registers(bank);
    const auto& bytes = encoder.bytes();
    ASSERT_EQ(bytes.size(), 8u + NUM_REGISTERS * 7);
    EXPECT_EQ(bytes[0], NUM_REGISTERS);
    // PC entry: key 4, discriminant 4, value 0x0100
    const size_t pc_offset = 8 + 4 * 7;
    EXPECT_EQ(bytes[pc_offset], 4);
    EXPECT_EQ(bytes[pc_offset + 1], 4);
    EXPECT_EQ(bytes[pc_offset + 5], 0x00);
    EXPECT_EQ(bytes[pc_offset + 6], 0x01);
}

TEST_F(CommitmentTest, ProgramCommitment) {
    Commitment c = commit_program(Program::demo());
    EXPECT_EQ(c.private_value.to_string(),
              "11684691122188502807634221403697224940142834888954428619381134382140178492778");
    EXPECT_EQ(c.public_value.to_string(),
              "20976468651948522034267890156391977643496103223773393832446356948449898697625");
}

/**
 * Test: First step record
 *
 * Snapshot after fetch (PC advanced, IR loaded, IM not yet resolved), then
 * the word at the fetch address, the fetch address and the opcode.
 */
TEST_F(CommitmentTest, StepEncoding) {
    VM vm = run(true);
    std::vector<uint8_t> bytes = encode_step(vm.trace()[0], vm.memory());
    std::vector<uint8_t> expected = {
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,   // r0..r3
        0x02, 0x01, 0x65, 0x40, 0x00, 0x00, 0x00, 0x00,   // pc, ir, im, unused
        0x65, 0x40,                                       // word at pc
        0x00, 0x01,                                       // pc
        0x04                                              // opcode
    };
    ASSERT_EQ(bytes.size(), STEP_RECORD_SIZE);
    EXPECT_EQ(bytes, expected);
}

TEST_F(CommitmentTest, FirstStepCommitment) {
    VM vm = run(true);
    TraceWitness witness = commit_trace(vm.trace(), vm.memory());
    ASSERT_EQ(witness.steps, 5u);
    EXPECT_EQ(witness.private_values[0].to_string(),
              "21574061322171697568307300916577651836410124490974607545274510398924327411348");
    EXPECT_EQ(witness.public_values[0].to_string(),
              "17919625346516026766133899599841120114722173131172959221190758602296871588688");
}

TEST_F(CommitmentTest, OutputCommitment) {
    VM vm = run(false);
    Commitment c = commit_output(vm.memory(), vm.registers());
    EXPECT_EQ(c.private_value.to_string(),
              "11570846632659431611885245613258881043116665507817582643948511915588029402755");
    EXPECT_EQ(c.public_value.to_string(),
              "18143200484768542204012978342095312989173292302958934176681508231523843487871");
}

TEST_F(CommitmentTest, OutputWordMustBeReadable) {
    LinearMemory tiny(0x10);
    RegisterBank registers;
    try {
        commit_output(tiny, registers);
        FAIL() << "expected MemoryReadError";
    } catch (const VmError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MemoryReadError);
    }
}

TEST_F(CommitmentTest, OutputRangeMustBeInsideMemory) {
    LinearMemory memory(0x100);
    RegisterBank registers(0x0200);
    try {
        commit_output(memory, registers);
        FAIL() << "expected OutOfBounds";
    } catch (const VmError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::OutOfBounds);
    }
}

TEST_F(CommitmentTest, PaddingWithZeros) {
    VM vm = run(true);
    TraceWitness witness = commit_trace(vm.trace(), vm.memory());
    pad_witness(witness, 8);
    EXPECT_EQ(witness.steps, 5u);
    ASSERT_EQ(witness.capacity(), 8u);
    ASSERT_EQ(witness.private_values.size(), 8u);
    for (size_t i = 5; i < 8; ++i) {
        EXPECT_TRUE(witness.public_values[i].is_zero());
        EXPECT_TRUE(witness.private_values[i].is_zero());
    }
    EXPECT_FALSE(witness.public_values[4].is_zero());
}

TEST_F(CommitmentTest, CapacityBelowStepsIsConfigError) {
    VM vm = run(true);
    TraceWitness witness = commit_trace(vm.trace(), vm.memory());
    try {
        pad_witness(witness, 4);
        FAIL() << "expected ConfigError";
    } catch (const VmError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConfigError);
    }
    EXPECT_EQ(witness.capacity(), 5u);
}

TEST_F(CommitmentTest, IndependentRunsAreDeterministic) {
    RunConfig config;
    config.trace_enabled = true;
    config.trace_capacity = 16;

    ProverInput first = build_prover_input(program, config);
    ProverInput second = build_prover_input(program, config);

    EXPECT_EQ(first.ticks, 5u);
    EXPECT_EQ(first.output_value, 8);
    EXPECT_EQ(*first.zk.program(), *second.zk.program());
    EXPECT_EQ(*first.zk.output(), *second.zk.output());
    EXPECT_EQ(first.zk.trace()->public_values, second.zk.trace()->public_values);
    EXPECT_EQ(first.zk.trace()->private_values, second.zk.trace()->private_values);
    EXPECT_EQ(first.zk.trace()->capacity(), 16u);
}

TEST_F(CommitmentTest, ProverInputNeedsCapacityWhenTracing) {
    RunConfig config;
    config.trace_enabled = true;
    EXPECT_THROW(build_prover_input(program, config), VmError);
}

TEST_F(CommitmentTest, ProverInputWithoutTrace) {
    RunConfig config;
    ProverInput input = build_prover_input(Program::demo(), config);
    EXPECT_EQ(input.ticks, 7u);
    EXPECT_EQ(input.output_value, 8);
    EXPECT_TRUE(input.zk.program().has_value());
    EXPECT_TRUE(input.zk.output().has_value());
    EXPECT_FALSE(input.zk.trace().has_value());
}

TEST_F(CommitmentTest, ProverInputPropagatesVmErrors) {
    RunConfig config;
    try {
        build_prover_input(Program::from_words({0x7000}), config);
        FAIL() << "expected UnknownOpcode";
    } catch (const VmError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnknownOpcode);
    }
}
