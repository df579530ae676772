#include "vm/linear_memory.hpp"
#include "common/errors.hpp"
#include <stdexcept>
#include <string>

namespace zkvm16 {

LinearMemory::LinearMemory(size_t size)
    : bytes_()
{
    if (size > MAX_MEMORY_SIZE) {
        throw VmError(ErrorKind::ConfigError,
                      "memory size " + std::to_string(size) + " exceeds the 16-bit address space");
    }
    bytes_.assign(size, 0);
}

std::optional<uint8_t> LinearMemory::read(VmAddr addr) const {
    if (addr >= bytes_.size()) {
        return std::nullopt;
    }
    return bytes_[addr];
}

void LinearMemory::write(VmAddr addr, uint8_t value) {
    if (addr >= bytes_.size()) {
        throw VmError(ErrorKind::OutOfBounds,
                      "write to " + std::to_string(addr) + " in memory of " +
                      std::to_string(bytes_.size()) + " bytes");
    }
    bytes_[addr] = value;
}

std::vector<uint8_t> LinearMemory::subset(size_t start, size_t end) const {
    if (start > end || end > bytes_.size()) {
        throw std::out_of_range("subset [" + std::to_string(start) + ", " + std::to_string(end) +
                                ") outside memory of " + std::to_string(bytes_.size()) + " bytes");
    }
    return std::vector<uint8_t>(bytes_.begin() + start, bytes_.begin() + end);
}

} // namespace zkvm16
