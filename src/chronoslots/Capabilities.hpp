#ifndef SRC_CHRONOSLOTS_CAPABILITIES_HPP_
#define SRC_CHRONOSLOTS_CAPABILITIES_HPP_

#include "chronoslots/Block.hpp"
#include "chronoslots/ErrorReporter.hpp"
#include "chronoslots/Instant.hpp"
#include "chronoslots/Slot.hpp"

#include <optional>
#include <type_traits>
#include <utility>

// Compile-time checks for the structural contracts that caller record types satisfy to take part in a search. No
// base class is required, a record only needs the listed member functions.
namespace chronoslots {

// Period: Instant start() const, Instant end() const.
template <typename T, typename = void> struct IsPeriod : std::false_type {};
template <typename T>
struct IsPeriod<T, std::void_t<decltype(std::declval<const T&>().start()), decltype(std::declval<const T&>().end())>>
    : std::bool_constant<std::is_convertible_v<decltype(std::declval<const T&>().start()), Instant>
                         && std::is_convertible_v<decltype(std::declval<const T&>().end()), Instant>> {};

// Input: a Period with std::optional<Block> toBlock(ErrorReporter*) const.
template <typename T, typename = void> struct IsInput : std::false_type {};
template <typename T>
struct IsInput<T, std::void_t<decltype(std::declval<const T&>().toBlock(std::declval<ErrorReporter*>()))>>
    : std::bool_constant<IsPeriod<T>::value
                         && std::is_same_v<decltype(std::declval<const T&>().toBlock(std::declval<ErrorReporter*>())),
                                           std::optional<Block>>> {};

// Output: a Period with static T makeFromSlot(const Slot&).
template <typename T, typename = void> struct IsOutput : std::false_type {};
template <typename T>
struct IsOutput<T, std::void_t<decltype(T::makeFromSlot(std::declval<const Slot&>()))>>
    : std::bool_constant<IsPeriod<T>::value
                         && std::is_same_v<decltype(T::makeFromSlot(std::declval<const Slot&>())), T>> {};

} // namespace chronoslots

#endif // SRC_CHRONOSLOTS_CAPABILITIES_HPP_
