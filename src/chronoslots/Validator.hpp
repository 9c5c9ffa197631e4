#ifndef SRC_CHRONOSLOTS_VALIDATOR_HPP_
#define SRC_CHRONOSLOTS_VALIDATOR_HPP_

#include "chronoslots/BlockSet.hpp"
#include "chronoslots/Slot.hpp"
#include "chronoslots/Span.hpp"

#include <vector>

namespace chronoslots {

// The validator checks the output of each stage of a search for internal consistency. Failures are logged.
class Validator {
public:
    // Checks that Blocks are sorted, disjoint, and separated by some free time.
    static bool validateBlockSet(const BlockSet& blockSet);

    // Checks that |slots| are sorted, disjoint, separated by some busy time, lie within |span| and share no time with
    // |busy|, and that together with the parts of |busy| inside |span| they cover all of |span| exactly.
    static bool validateSlots(const Span& span, const BlockSet& busy, const std::vector<Slot>& slots);

private:
    template <typename P> static bool validateOrdering(const std::vector<P>& periods, const char* name);
    static bool validateCoverage(const Span& span, const BlockSet& busy, const std::vector<Slot>& slots);
};

} // namespace chronoslots

#endif // SRC_CHRONOSLOTS_VALIDATOR_HPP_
