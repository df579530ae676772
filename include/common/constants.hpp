#pragma once

#include <cstddef>
#include <cstdint>

namespace zkvm16 {

// The machine word is 16 bits wide and addresses are words too.
using VmWord = uint16_t;
using VmAddr = VmWord;

// Programs are loaded here; the first 256 bytes are a reserved prefix.
constexpr VmAddr START_ADDRESS = 0x0100;

// STORE_OUT target, inside the reserved prefix.
constexpr VmAddr OUTPUT_ADDRESS = 0x00FE;

constexpr size_t DEFAULT_MEMORY_SIZE = 5000;

// Largest capacity a 16-bit address can reach.
constexpr size_t MAX_MEMORY_SIZE = 0x10000;

// Every instruction occupies two bytes.
constexpr VmWord INSTRUCTION_SIZE = 2;

} // namespace zkvm16
