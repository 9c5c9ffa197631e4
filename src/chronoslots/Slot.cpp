#include "chronoslots/Slot.hpp"

#include "chronoslots/Block.hpp"
#include "chronoslots/Span.hpp"

namespace chronoslots {

// static
std::optional<Slot> Slot::makeBetween(const Span& span, const Block& block, ErrorReporter* errorReporter) {
    return make(span.start(), block.start(), errorReporter);
}

} // namespace chronoslots
