#include "vm/bus.hpp"
#include "common/errors.hpp"
#include <stdexcept>
#include <string>

namespace zkvm16 {
namespace {

// The next byte address, or nullopt past the top of the address space
std::optional<VmAddr> high_byte_addr(VmAddr addr) {
    const uint32_t next = static_cast<uint32_t>(addr) + 1;
    if (next > 0xFFFF) {
        return std::nullopt;
    }
    return static_cast<VmAddr>(next);
}

} // namespace

std::optional<VmWord> BusDevice::read16(VmAddr addr) const {
    auto lo = read(addr);
    if (!lo) return std::nullopt;
    auto hi_addr = high_byte_addr(addr);
    if (!hi_addr) return std::nullopt;
    auto hi = read(*hi_addr);
    if (!hi) return std::nullopt;
    return static_cast<VmWord>(*lo | (static_cast<VmWord>(*hi) << 8));
}

void BusDevice::write16(VmAddr addr, VmWord value) {
    write(addr, static_cast<uint8_t>(value & 0xFF));
    auto hi_addr = high_byte_addr(addr);
    if (!hi_addr) {
        throw VmError(ErrorKind::OutOfBounds, "address 0x10000");
    }
    write(*hi_addr, static_cast<uint8_t>(value >> 8));
}

void BusDevice::copy16(VmAddr src, VmAddr dst) {
    auto value = read16(src);
    if (!value) {
        throw VmError(ErrorKind::CopyFailed, "source address " + std::to_string(src));
    }
    write16(dst, *value);
}

VmWord BusDevice::value_at(size_t index) const {
    if (index + 1 >= memory_range() || index + 1 > 0xFFFF) {
        throw std::out_of_range("value_at(" + std::to_string(index) +
                                ") outside memory of " + std::to_string(memory_range()) + " bytes");
    }
    auto value = read16(static_cast<VmAddr>(index));
    if (!value) {
        throw std::out_of_range("value_at(" + std::to_string(index) + ") is not readable");
    }
    return *value;
}

} // namespace zkvm16
