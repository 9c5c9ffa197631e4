#include "chronoslots/Span.hpp"

#include <algorithm>

namespace chronoslots {

std::optional<Block> Span::clip(const Block& block) const {
    // An empty intersection fails validation, so no error reporting here.
    return Block::make(std::max(m_start, block.start()), std::min(m_end, block.end()));
}

Slot Span::toSlot() const { return Slot(m_start, m_end); }

} // namespace chronoslots
