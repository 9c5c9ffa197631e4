#include "chronoslots/Block.hpp"

#include "chronoslots/Span.hpp"

namespace chronoslots {

bool Block::contains(const Span& span) const { return m_start <= span.start() && span.end() <= m_end; }

bool Block::isContainedIn(const Span& span) const { return span.start() <= m_start && m_end <= span.end(); }

bool Block::overlapsAtStart(const Span& span) const {
    return m_start <= span.start() && m_end <= span.end() && span.start() <= m_end;
}

bool Block::overlapsAtEnd(const Span& span) const {
    return span.start() <= m_start && span.end() <= m_end && m_start <= span.end();
}

bool Block::intersects(const Span& span) const { return m_start < span.end() && span.start() < m_end; }

} // namespace chronoslots
