#ifndef SRC_CHRONOSLOTS_BLOCK_HPP_
#define SRC_CHRONOSLOTS_BLOCK_HPP_

#include "chronoslots/Period.hpp"

namespace chronoslots {

class Span;

// A Block is an already scheduled, busy period of time. Blocks are built either by Block::make() or by converting a
// caller record through its toBlock() method.
class Block : public Period<Block> {
public:
    Block() = delete;
    ~Block() = default;

    // Relations to a Span below treat both endpoints inclusively.

    // Returns true if this Block covers all of |span|.
    bool contains(const Span& span) const;
    // Returns true if this Block lies within |span|.
    bool isContainedIn(const Span& span) const;
    // Returns true if this Block starts at or before |span| starts and ends within |span|.
    bool overlapsAtStart(const Span& span) const;
    // Returns true if this Block starts within |span| and ends at or after |span| ends.
    bool overlapsAtEnd(const Span& span) const;

    // Returns true if this Block and |span| share time of positive length.
    bool intersects(const Span& span) const;

private:
    friend class Period<Block>;
    friend class BlockSet;
    Block(Instant start, Instant end): Period<Block>(start, end) {}
};

} // namespace chronoslots

#endif // SRC_CHRONOSLOTS_BLOCK_HPP_
