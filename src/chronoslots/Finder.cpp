#include "chronoslots/Finder.hpp"

#include "chronoslots/Validator.hpp"

#include <algorithm>

namespace chronoslots {

std::vector<Slot> findSlots(const Span& span, const BlockSet& busy) {
    std::vector<Slot> slots;
    Instant cursor = span.start();

    for (const auto& block : busy) {
        // Blocks ending before the cursor have no effect, and since the set is sorted every Block after one starting
        // past the span does too.
        if (block.end() <= cursor) {
            continue;
        }
        if (block.start() >= span.end()) {
            break;
        }

        if (block.start() > cursor) {
            slots.emplace_back(Slot(cursor, block.start()));
            SPDLOG_TRACE("Free slot [{}, {})", secondsSinceEpoch(cursor), secondsSinceEpoch(block.start()));
        }
        cursor = std::max(cursor, block.end());
        if (cursor >= span.end()) {
            break;
        }
    }

    if (cursor < span.end()) {
        slots.emplace_back(Slot(cursor, span.end()));
        SPDLOG_TRACE("Free slot [{}, {})", secondsSinceEpoch(cursor), secondsSinceEpoch(span.end()));
    }

    SPDLOG_DEBUG("Found {} free slots around {} busy blocks in span [{}, {})", slots.size(), busy.size(),
            secondsSinceEpoch(span.start()), secondsSinceEpoch(span.end()));

#if CHRONOSLOTS_VALIDATE
    if (!Validator::validateSlots(span, busy, slots)) {
        SPDLOG_CRITICAL("Free slots failed validation for span {}", span.toString());
    }
#endif // CHRONOSLOTS_VALIDATE

    return slots;
}

std::vector<Slot> findSlots(const Span& span, std::vector<Block> blocks) {
    auto busy = BlockSet::normalize(std::move(blocks));

#if CHRONOSLOTS_VALIDATE
    if (!Validator::validateBlockSet(busy)) {
        SPDLOG_CRITICAL("Normalized blocks failed validation");
    }
#endif // CHRONOSLOTS_VALIDATE

    return findSlots(span, busy);
}

} // namespace chronoslots
