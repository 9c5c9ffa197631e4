#include "chronoslots/BlockSet.hpp"

#include "chronoslots/Span.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>

namespace chronoslots {

// static
BlockSet BlockSet::normalize(std::vector<Block> blocks) {
    BlockSet blockSet;
    if (blocks.empty()) {
        return blockSet;
    }

    std::sort(blocks.begin(), blocks.end());

    blockSet.m_blocks.reserve(blocks.size());
    Instant currentStart = blocks.front().start();
    Instant currentEnd = blocks.front().end();
    for (auto iter = blocks.begin() + 1; iter != blocks.end(); ++iter) {
        if (iter->start() <= currentEnd) {
            currentEnd = std::max(currentEnd, iter->end());
        } else {
            SPDLOG_TRACE("Merged block [{}, {})", secondsSinceEpoch(currentStart), secondsSinceEpoch(currentEnd));
            blockSet.m_blocks.emplace_back(Block(currentStart, currentEnd));
            currentStart = iter->start();
            currentEnd = iter->end();
        }
    }
    SPDLOG_TRACE("Merged block [{}, {})", secondsSinceEpoch(currentStart), secondsSinceEpoch(currentEnd));
    blockSet.m_blocks.emplace_back(Block(currentStart, currentEnd));

    SPDLOG_DEBUG("Normalized {} blocks into {}", blocks.size(), blockSet.m_blocks.size());
    return blockSet;
}

bool BlockSet::covers(Instant p) const {
    if (isEmpty() || p < startTime() || p >= endTime()) {
        return false;
    }

    // Find the first Block starting after |p|, the only candidate is the one before it.
    auto iter = std::upper_bound(m_blocks.begin(), m_blocks.end(), p,
            [](Instant instant, const Block& block) { return instant < block.start(); });
    if (iter == m_blocks.begin()) {
        return false;
    }
    --iter;
    return p < iter->end();
}

bool BlockSet::findFirstIntersection(Instant from, Instant to, Instant& first) const {
    // Early-out for an empty set or empty range.
    if (isEmpty() || to <= from) {
        return false;
    }

    // Early-out for no intersection between the range and the extent of the set.
    if (endTime() <= from || to <= startTime()) {
        return false;
    }

    // Blocks are disjoint and sorted, so their end times are sorted too.
    auto iter = std::upper_bound(m_blocks.begin(), m_blocks.end(), from,
            [](Instant instant, const Block& block) { return instant < block.end(); });
    if (iter == m_blocks.end() || iter->start() >= to) {
        return false;
    }

    first = std::max(from, iter->start());
    return true;
}

bool BlockSet::findFirstIntersection(const Span& span, Instant& first) const {
    return findFirstIntersection(span.start(), span.end(), first);
}

} // namespace chronoslots
