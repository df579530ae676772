#pragma once

#include "vm/instruction.hpp"
#include "vm/register.hpp"
#include <vector>

namespace zkvm16 {

/**
 * Machine state recorded for one step, after fetch and decode and before
 * execution. `pc` is the fetch address; the register copy already holds
 * the advanced PC and the fetched word in IR.
 */
struct TraceEntry {
    VmAddr pc = 0;
    Opcode opcode = Opcode::Halt;
    uint8_t dest = 0;
    uint8_t source = 0;
    uint8_t immediate = 0;
    RegisterBank registers;

    DecodedInstruction instruction() const { return {opcode, dest, source, immediate}; }
};

/**
 * ExecutionTrace - append-only record of every executed step
 */
class ExecutionTrace {
public:
    void record(TraceEntry entry) { entries_.push_back(std::move(entry)); }

    const std::vector<TraceEntry>& entries() const { return entries_; }
    const TraceEntry& operator[](size_t i) const { return entries_[i]; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    std::vector<TraceEntry>::const_iterator begin() const { return entries_.begin(); }
    std::vector<TraceEntry>::const_iterator end() const { return entries_.end(); }

private:
    std::vector<TraceEntry> entries_;
};

} // namespace zkvm16
