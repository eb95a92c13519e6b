#pragma once

#include <cstddef>
#include <type_traits>
#include <variant>

namespace ratchet {

// Position of a generator that has not been resumed yet.
struct Start {};

// Position of a generator whose body ran to its end.
struct Exhausted {};

namespace detail {

template <typename T, typename... Ts>
constexpr bool none_same = (!std::is_same_v<T, Ts> && ...);

template <typename... Ts>
struct distinct : std::true_type {};

template <typename T, typename... Ts>
struct distinct<T, Ts...>
: std::bool_constant<none_same<T, Ts...> && distinct<Ts...>::value> {};

template <typename T, typename... Ts>
constexpr std::size_t index_of()
{
    constexpr bool same[] = {std::is_same_v<T, Ts>...};
    for (std::size_t i = 0; i < sizeof...(Ts); ++ i) {
        if (same[i]) {
            return i;
        }
    }
    return sizeof...(Ts);
}

} // namespace detail

/*
 * The enumeration of every place a generator body can suspend.
 *
 * Each site is its own struct type whose members are the locals that the
 * continuation after that yield still reads. A generator's state is one
 * alternative of variant at a time: Start, one of the sites, or Exhausted.
 *
 * Two yield sites cannot share a position: the site types must be distinct,
 * and this is checked when the enumeration is named.
 */
template <typename... Sites>
struct Position
{
    static_assert(detail::distinct<Start, Exhausted, std::remove_cv_t<Sites>...>::value,
        "every yield site needs its own position type, distinct from Start and Exhausted");
    static_assert((std::is_object_v<Sites> && ...),
        "position types hold locals by value");

    using variant = std::variant<Start, Sites..., Exhausted>;

    static constexpr std::size_t count = sizeof...(Sites);

    template <typename Site>
    static constexpr bool has = (std::is_same_v<Site, Sites> || ...);

    // Index of a position within variant: Start is 0, Exhausted is count + 1.
    template <typename Site>
    static constexpr std::size_t index = detail::index_of<Site, Start, Sites..., Exhausted>();
};

} // namespace ratchet
