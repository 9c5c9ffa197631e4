#ifndef SRC_CHRONOSLOTS_SPAN_HPP_
#define SRC_CHRONOSLOTS_SPAN_HPP_

#include "chronoslots/Block.hpp"
#include "chronoslots/Period.hpp"
#include "chronoslots/Slot.hpp"

#include <optional>

namespace chronoslots {

// The Span is the search window. Every Slot returned by a search lies within it.
class Span : public Period<Span> {
public:
    Span() = delete;
    ~Span() = default;

    // Returns the part of |block| inside this Span, or std::nullopt if they share no time.
    std::optional<Block> clip(const Block& block) const;

    // The whole Span as a single free Slot.
    Slot toSlot() const;

private:
    friend class Period<Span>;
    Span(Instant start, Instant end): Period<Span>(start, end) {}
};

} // namespace chronoslots

#endif // SRC_CHRONOSLOTS_SPAN_HPP_
