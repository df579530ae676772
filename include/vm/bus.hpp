#pragma once

#include "common/constants.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace zkvm16 {

/**
 * Abstract byte-addressable bus.
 *
 * Implementations provide bounds-checked single-byte access over a fixed
 * capacity. The 16-bit accessors are built on top of the byte primitives
 * and are shared by every device: two-byte values are little-endian, and
 * addr + 1 is computed without 16-bit wrap-around (0xFFFF + 1 is never
 * addressable).
 */
class BusDevice {
public:
    virtual ~BusDevice() = default;

    // =========================================================================
    // Device primitives
    // =========================================================================

    /**
     * Byte at addr, or nullopt when addr >= memory_range(). Never throws.
     */
    virtual std::optional<uint8_t> read(VmAddr addr) const = 0;

    /**
     * Store one byte. Throws VmError(OutOfBounds) without side effects when
     * addr >= memory_range().
     */
    virtual void write(VmAddr addr, uint8_t value) = 0;

    /**
     * Total byte capacity
     */
    virtual size_t memory_range() const = 0;

    /**
     * Copy of bytes [start, end). Throws std::out_of_range unless
     * start <= end <= memory_range().
     */
    virtual std::vector<uint8_t> subset(size_t start, size_t end) const = 0;

    // =========================================================================
    // 16-bit helpers
    // =========================================================================

    std::optional<VmWord> read16(VmAddr addr) const;

    /**
     * Low byte first, then high byte. The first failure propagates and the
     * high byte is not attempted; a failing high byte leaves the low byte
     * written.
     */
    void write16(VmAddr addr, VmWord value);

    /**
     * read16(src) then write16(dst). VmError(CopyFailed) if src is not
     * readable; write errors propagate unchanged.
     */
    void copy16(VmAddr src, VmAddr dst);

    /**
     * Little-endian word at [index, index + 1]. Throws std::out_of_range
     * unless index + 1 < memory_range().
     */
    VmWord value_at(size_t index) const;
};

} // namespace zkvm16
