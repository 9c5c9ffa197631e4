#ifndef SRC_CHRONOSLOTS_FINDER_HPP_
#define SRC_CHRONOSLOTS_FINDER_HPP_

// By default the finder checks its own results in Debug builds only.
#ifndef CHRONOSLOTS_VALIDATE
#ifdef NDEBUG
#define CHRONOSLOTS_VALIDATE 0
#else
#define CHRONOSLOTS_VALIDATE 1
#endif // NDEBUG
#endif // CHRONOSLOTS_VALIDATE

#include "chronoslots/Block.hpp"
#include "chronoslots/BlockSet.hpp"
#include "chronoslots/Capabilities.hpp"
#include "chronoslots/ErrorReporter.hpp"
#include "chronoslots/Slot.hpp"
#include "chronoslots/Span.hpp"

#include "spdlog/spdlog.h"

#include <optional>
#include <utility>
#include <vector>

namespace chronoslots {

// Returns the maximal free Slots of |span| not covered by |busy|, in ascending order. Blocks outside of |span| are
// skipped. Returns a single Slot equal to |span| if |busy| is empty, and nothing if |busy| covers all of |span|.
std::vector<Slot> findSlots(const Span& span, const BlockSet& busy);

// Normalizes |blocks| then finds the free Slots of |span|.
std::vector<Slot> findSlots(const Span& span, std::vector<Block> blocks);

// Finds the free time in |span| around the busy |inputs|, converting each input to a Block with its toBlock() method
// and each resulting Slot to an Out with Out::makeFromSlot(). All |inputs| must describe the schedule of the same
// entity, mixing schedules produces meaningless results. Returns std::nullopt if any input fails conversion, the
// failure is recorded in |errorReporter|.
template <typename Out, typename In>
std::optional<std::vector<Out>> find(const Span& span, const std::vector<In>& inputs,
        ErrorReporter* errorReporter = nullptr) {
    static_assert(IsInput<In>::value, "Input type needs start(), end() and toBlock(ErrorReporter*).");
    static_assert(IsOutput<Out>::value, "Output type needs start(), end() and static makeFromSlot(const Slot&).");

    std::vector<Block> blocks;
    blocks.reserve(inputs.size());
    for (const auto& input : inputs) {
        auto block = input.toBlock(errorReporter);
        if (!block) {
            SPDLOG_ERROR("Input {} of {} failed conversion to a Block.", blocks.size() + 1, inputs.size());
            return std::nullopt;
        }
        blocks.emplace_back(*block);
    }

    auto slots = findSlots(span, std::move(blocks));

    std::vector<Out> outputs;
    outputs.reserve(slots.size());
    for (const auto& slot : slots) {
        outputs.emplace_back(Out::makeFromSlot(slot));
    }
    return outputs;
}

} // namespace chronoslots

#endif // SRC_CHRONOSLOTS_FINDER_HPP_
