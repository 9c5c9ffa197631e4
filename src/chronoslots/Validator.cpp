#include "chronoslots/Validator.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <utility>

namespace chronoslots {

// static
template <typename P> bool Validator::validateOrdering(const std::vector<P>& periods, const char* name) {
    for (size_t i = 0; i < periods.size(); ++i) {
        if (periods[i].start() >= periods[i].end()) {
            SPDLOG_ERROR("{} {} has invalid range {}", name, i, periods[i].toString());
            return false;
        }
        // Neighbors must be separated by time of positive length.
        if (i > 0 && periods[i - 1].end() >= periods[i].start()) {
            SPDLOG_ERROR("{} {} at {} does not follow {} at {}", name, i, periods[i].toString(), i - 1,
                    periods[i - 1].toString());
            return false;
        }
    }
    return true;
}

// static
bool Validator::validateBlockSet(const BlockSet& blockSet) {
    return validateOrdering(blockSet.blocks(), "Block");
}

// static
bool Validator::validateSlots(const Span& span, const BlockSet& busy, const std::vector<Slot>& slots) {
    if (!validateOrdering(slots, "Slot")) { return false; }

    for (const auto& slot : slots) {
        if (slot.start() < span.start() || span.end() < slot.end()) {
            SPDLOG_ERROR("Slot {} outside of span {}", slot.toString(), span.toString());
            return false;
        }
        Instant first;
        if (busy.findFirstIntersection(slot.start(), slot.end(), first)) {
            SPDLOG_ERROR("Slot {} intersects busy time at {}", slot.toString(), formatInstant(first));
            return false;
        }
    }

    return validateCoverage(span, busy, slots);
}

// static
bool Validator::validateCoverage(const Span& span, const BlockSet& busy, const std::vector<Slot>& slots) {
    std::vector<std::pair<Instant, Instant>> ranges;
    ranges.reserve(slots.size() + busy.size());
    for (const auto& slot : slots) {
        ranges.emplace_back(std::make_pair(slot.start(), slot.end()));
    }
    for (const auto& block : busy) {
        auto clipped = span.clip(block);
        if (clipped) {
            ranges.emplace_back(std::make_pair(clipped->start(), clipped->end()));
        }
    }
    std::sort(ranges.begin(), ranges.end());

    Instant cursor = span.start();
    for (const auto& range : ranges) {
        if (range.first > cursor) {
            SPDLOG_ERROR("Time from {} to {} is neither free nor busy", formatInstant(cursor),
                    formatInstant(range.first));
            return false;
        }
        cursor = std::max(cursor, range.second);
    }
    if (cursor != span.end()) {
        SPDLOG_ERROR("Coverage ends at {} instead of span end {}", formatInstant(cursor), formatInstant(span.end()));
        return false;
    }

    return true;
}

} // namespace chronoslots
