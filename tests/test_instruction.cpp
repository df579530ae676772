#include <gtest/gtest.h>
#include "vm/instruction.hpp"
#include "vm/register.hpp"
#include "common/errors.hpp"

using namespace zkvm16;

class InstructionTest : public ::testing::Test {
protected:
    void SetUp() override {}
};

TEST_F(InstructionTest, EncodeFieldLayout) {
    EXPECT_EQ(encode_instruction(Opcode::LoadImm, 6, 0, 5), 0x5605);
    EXPECT_EQ(encode_instruction(Opcode::Add, 0, 1, 0), 0x4010);
    EXPECT_EQ(encode_instruction(Opcode::Halt, 0, 0, 0), 0x0000);
}

TEST_F(InstructionTest, EncodeTruncatesWideFields) {
    EXPECT_EQ(encode_instruction(uint8_t{0x14}, 0x23, 0x3F, 0xFA), 0x43FA);
}

TEST_F(InstructionTest, DecodeSplitsFields) {
    DecodedInstruction instr = decode_instruction(0x3A5C);
    EXPECT_EQ(instr.opcode, Opcode::Write);
    EXPECT_EQ(instr.dest, 0xA);
    EXPECT_EQ(instr.source, 0x5);
    EXPECT_EQ(instr.immediate, 0xC);
}

TEST_F(InstructionTest, EncodeDecodeAllFields) {
    for (uint8_t op = 0; op < NUM_OPCODES; ++op) {
        for (uint8_t field : {0, 3, 6, 15}) {
            VmWord word = encode_instruction(op, field, 15 - field, field);
            DecodedInstruction instr = decode_instruction(word);
            EXPECT_EQ(static_cast<uint8_t>(instr.opcode), op);
            EXPECT_EQ(instr.dest, field);
            EXPECT_EQ(instr.source, 15 - field);
            EXPECT_EQ(instr.immediate, field);
            EXPECT_EQ(instr.encode(), word);
        }
    }
}

TEST_F(InstructionTest, UnknownOpcode) {
    for (VmWord word : {VmWord{0x7000}, VmWord{0xF123}}) {
        try {
            decode_instruction(word);
            FAIL() << "expected UnknownOpcode for " << word;
        } catch (const VmError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::UnknownOpcode);
        }
    }
}

TEST_F(InstructionTest, Disassembly) {
    EXPECT_EQ(decode_instruction(0x0000).to_string(), "halt");
    EXPECT_EQ(decode_instruction(0x5605).to_string(), "load_imm 5");
    // load_imm only has a mnemonic with IM as dest
    EXPECT_EQ(decode_instruction(0x5065).to_string(), ".word 0x5065");
    EXPECT_EQ(decode_instruction(0x4010).to_string(), "add r0, r1");
    EXPECT_EQ(decode_instruction(0x1233).to_string(), "copy r2, r3, 3");
    EXPECT_EQ(decode_instruction(0x6020).to_string(), "store_out r2");
    // dest names no register
    EXPECT_EQ(decode_instruction(0x1F00).to_string(), ".word 0x1f00");
}

TEST_F(InstructionTest, MnemonicLookup) {
    EXPECT_EQ(opcode_from_name("store_out"), Opcode::StoreOut);
    EXPECT_FALSE(opcode_from_name("jump").has_value());
}
