#ifndef SRC_CHRONOSLOTS_BLOCK_SET_HPP_
#define SRC_CHRONOSLOTS_BLOCK_SET_HPP_

#include "chronoslots/Block.hpp"
#include "chronoslots/Instant.hpp"

#include <vector>

namespace chronoslots {

class Span;

// An ordered sequence of disjoint Blocks, with at least some free time between any two neighbors. Built from an
// unordered collection of possibly overlapping Blocks by normalize().
class BlockSet {
public:
    BlockSet() = default;
    ~BlockSet() = default;

    // Sorts |blocks| ascending by start time, breaking ties by end time, then merges any Blocks that overlap or touch.
    // Touching Blocks merge because the zero-length time between them can never be a free Slot.
    static BlockSet normalize(std::vector<Block> blocks);

    const std::vector<Block>& blocks() const { return m_blocks; }
    std::vector<Block>::const_iterator begin() const { return m_blocks.begin(); }
    std::vector<Block>::const_iterator end() const { return m_blocks.end(); }
    size_t size() const { return m_blocks.size(); }
    bool isEmpty() const { return m_blocks.size() == 0; }

    // Earliest start and latest end of the set, only valid if !isEmpty().
    Instant startTime() const { return m_blocks.front().start(); }
    Instant endTime() const { return m_blocks.back().end(); }

    // Returns true if |p| is within a Block in this set.
    bool covers(Instant p) const;

    // Returns true if some Block in this set shares time with [from, to). Sets |first| to the earliest such instant
    // if true, will not modify first if false.
    bool findFirstIntersection(Instant from, Instant to, Instant& first) const;
    bool findFirstIntersection(const Span& span, Instant& first) const;

private:
    std::vector<Block> m_blocks;
};

} // namespace chronoslots

#endif // SRC_CHRONOSLOTS_BLOCK_SET_HPP_
