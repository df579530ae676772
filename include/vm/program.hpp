#pragma once

#include "common/constants.hpp"
#include "vm/bus.hpp"
#include <string>
#include <vector>

namespace zkvm16 {

/**
 * Program - ordered sequence of 16-bit instruction words
 *
 * Assembly syntax, one instruction per line (`//` and `#` start comments,
 * operands are separated by commas or whitespace):
 *
 *   halt
 *   copy rd, rs [, imm]        load rd, rs [, imm]
 *   write rd, rs [, imm]       add rd, rs [, imm]
 *   load_imm imm               store_out rs
 *   .word n
 *
 * Registers are r0..r3, pc, ir, im. Numbers are decimal or 0x-prefixed hex;
 * immediates must fit in four bits.
 */
class Program {
public:
    Program() = default;

    static Program from_words(std::vector<VmWord> words);

    /**
     * Assemble source text. Syntax errors throw std::runtime_error naming
     * the offending line.
     */
    static Program from_code(const std::string& code);

    static Program from_file(const std::string& filepath);

    /**
     * The demonstration program: 5 and 3 are staged through IM into R0 and
     * R1, added, and the sum 8 is stored at OUTPUT_ADDRESS.
     */
    static Program demo();

    const std::vector<VmWord>& words() const { return words_; }
    size_t size() const { return words_.size(); }
    bool empty() const { return words_.empty(); }

    /**
     * Write every word with write16, INSTRUCTION_SIZE bytes apart, starting
     * at `origin`. Bus errors propagate.
     */
    void load_into(BusDevice& bus, VmAddr origin = START_ADDRESS) const;

    // One instruction per line, in assembler syntax
    std::string disassemble() const;

    bool operator==(const Program& rhs) const { return words_ == rhs.words_; }
    bool operator!=(const Program& rhs) const { return !(*this == rhs); }

private:
    std::vector<VmWord> words_;

    explicit Program(std::vector<VmWord> words) : words_(std::move(words)) {}
};

} // namespace zkvm16
