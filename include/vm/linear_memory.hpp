#pragma once

#include "vm/bus.hpp"
#include <cstdint>
#include <vector>

namespace zkvm16 {

/**
 * LinearMemory - flat byte array bus device
 *
 * Zero-initialised; the capacity is fixed at construction and may not
 * exceed the 16-bit address space.
 */
class LinearMemory : public BusDevice {
public:
    explicit LinearMemory(size_t size = DEFAULT_MEMORY_SIZE);
    ~LinearMemory() override = default;

    std::optional<uint8_t> read(VmAddr addr) const override;
    void write(VmAddr addr, uint8_t value) override;
    size_t memory_range() const override { return bytes_.size(); }
    std::vector<uint8_t> subset(size_t start, size_t end) const override;

    const std::vector<uint8_t>& bytes() const { return bytes_; }

private:
    std::vector<uint8_t> bytes_;
};

} // namespace zkvm16
