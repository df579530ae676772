#include "vm/program.hpp"
#include "vm/instruction.hpp"
#include "vm/register.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace zkvm16 {
namespace {

std::runtime_error syntax_error(size_t line_no, const std::string& message) {
    return std::runtime_error("line " + std::to_string(line_no) + ": " + message);
}

std::optional<uint8_t> parse_register(const std::string& token) {
    for (uint8_t i = 0; i < NUM_REGISTERS; ++i) {
        if (token == register_name(static_cast<RegisterId>(i))) {
            return i;
        }
    }
    return std::nullopt;
}

// Lowercased operands of one line, comments stripped; empty for a blank line
std::vector<std::string> tokenize(std::string line) {
    if (auto pos = line.find("//"); pos != std::string::npos) line = line.substr(0, pos);
    if (auto pos = line.find('#'); pos != std::string::npos) line = line.substr(0, pos);
    std::replace(line.begin(), line.end(), ',', ' ');
    std::transform(line.begin(), line.end(), line.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::istringstream line_stream(line);
    std::vector<std::string> tokens;
    std::string token;
    while (line_stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

VmWord assemble_line(const std::vector<std::string>& tokens, size_t line_no) {
    const std::string& mnemonic = tokens[0];
    const size_t operands = tokens.size() - 1;

    auto reg = [&](size_t i) -> uint8_t {
        auto id = parse_register(tokens[i]);
        if (!id) {
            throw syntax_error(line_no, "expected a register, got '" + tokens[i] + "'");
        }
        return *id;
    };
    auto imm = [&](size_t i) -> uint8_t {
        auto value = parse_unsigned(tokens[i]);
        if (!value || *value > 0xF) {
            throw syntax_error(line_no, "expected an immediate in 0..15, got '" + tokens[i] + "'");
        }
        return static_cast<uint8_t>(*value);
    };
    auto expect_operands = [&](size_t min, size_t max) {
        if (operands < min || operands > max) {
            throw syntax_error(line_no, "wrong number of operands for '" + mnemonic + "'");
        }
    };

    if (mnemonic == ".word") {
        expect_operands(1, 1);
        auto value = parse_unsigned(tokens[1]);
        if (!value || *value > 0xFFFF) {
            throw syntax_error(line_no, "expected a 16-bit word, got '" + tokens[1] + "'");
        }
        return static_cast<VmWord>(*value);
    }

    auto opcode = opcode_from_name(mnemonic);
    if (!opcode) {
        throw syntax_error(line_no, "unknown mnemonic '" + mnemonic + "'");
    }

    switch (*opcode) {
        case Opcode::Halt:
            expect_operands(0, 0);
            return encode_instruction(Opcode::Halt, 0, 0, 0);

        case Opcode::Copy:
        case Opcode::Load:
        case Opcode::Write:
        case Opcode::Add:
            expect_operands(2, 3);
            return encode_instruction(*opcode, reg(1), reg(2), operands == 3 ? imm(3) : 0);

        case Opcode::LoadImm:
            expect_operands(1, 1);
            return encode_instruction(Opcode::LoadImm, register_index(RegisterId::IM), 0, imm(1));

        case Opcode::StoreOut:
            expect_operands(1, 1);
            return encode_instruction(Opcode::StoreOut, 0, reg(1), 0);
    }
    throw syntax_error(line_no, "unknown mnemonic '" + mnemonic + "'");
}

} // namespace

Program Program::from_words(std::vector<VmWord> words) {
    return Program(std::move(words));
}

Program Program::from_code(const std::string& code) {
    std::vector<VmWord> words;
    std::istringstream iss(code);
    std::string line;
    size_t line_no = 0;
    while (std::getline(iss, line)) {
        ++line_no;
        auto tokens = tokenize(line);
        if (tokens.empty()) continue;
        words.push_back(assemble_line(tokens, line_no));
    }
    return Program(std::move(words));
}

Program Program::from_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_code(buffer.str());
}

Program Program::demo() {
    const uint8_t im = register_index(RegisterId::IM);
    const uint8_t r0 = register_index(RegisterId::R0);
    const uint8_t r1 = register_index(RegisterId::R1);
    return Program({
        encode_instruction(Opcode::LoadImm, im, r0, 5),
        encode_instruction(Opcode::Copy, r0, im, 0),
        encode_instruction(Opcode::LoadImm, im, r0, 3),
        encode_instruction(Opcode::Copy, r1, im, 0),
        encode_instruction(Opcode::Add, r0, r1, 0),
        encode_instruction(Opcode::StoreOut, 0, r0, 0),
        encode_instruction(Opcode::Halt, 0, 0, 0),
    });
}

void Program::load_into(BusDevice& bus, VmAddr origin) const {
    uint32_t addr = origin;
    for (VmWord word : words_) {
        if (addr > 0xFFFF) {
            throw VmError(ErrorKind::OutOfBounds, "program does not fit below 0x10000");
        }
        bus.write16(static_cast<VmAddr>(addr), word);
        addr += INSTRUCTION_SIZE;
    }
}

std::string Program::disassemble() const {
    std::ostringstream oss;
    for (VmWord word : words_) {
        try {
            oss << decode_instruction(word).to_string() << "\n";
        } catch (const VmError&) {
            // Unknown opcode
            oss << ".word 0x" << std::hex << std::setw(4) << std::setfill('0') << word
                << std::dec << "\n";
        }
    }
    return oss.str();
}

} // namespace zkvm16
