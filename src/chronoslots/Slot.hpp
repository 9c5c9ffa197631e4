#ifndef SRC_CHRONOSLOTS_SLOT_HPP_
#define SRC_CHRONOSLOTS_SLOT_HPP_

#include "chronoslots/Period.hpp"

#include <optional>
#include <vector>

namespace chronoslots {

class Block;
class BlockSet;
class Span;

// A Slot is a free period found by a search. It is structurally identical to a Block but kept a separate type, so
// search results can't be fed back in as busy time without an explicit conversion.
class Slot : public Period<Slot> {
public:
    Slot() = delete;
    ~Slot() = default;

    // The free time from the start of |span| until |block| starts. Reports kInvalidRange if |block| starts at or
    // before the start of |span|.
    static std::optional<Slot> makeBetween(const Span& span, const Block& block,
            ErrorReporter* errorReporter = nullptr);

private:
    friend class Period<Slot>;
    friend class Span;
    friend std::vector<Slot> findSlots(const Span& span, const BlockSet& busy);
    Slot(Instant start, Instant end): Period<Slot>(start, end) {}
};

} // namespace chronoslots

#endif // SRC_CHRONOSLOTS_SLOT_HPP_
