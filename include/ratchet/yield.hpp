#pragma once

#include <ratchet/position.hpp>

#include <optional>
#include <utility>

namespace ratchet {

template <typename R, typename P>
class Yield;

template <typename Body, typename Signature>
class Machine;

// What one arm of a generator body hands back: a value, or nothing once
// the body has finished. Only Yield makes these.
template <typename R>
class Step
{
public:
    bool finished() const noexcept
    { return !value_.has_value(); }

    std::optional<R> take() &&
    { return std::move(value_); }

private:
    template <typename, typename>
    friend class Yield;

    Step() = default;

    explicit Step(R && value)
    : value_(std::move(value))
    { }

    std::optional<R> value_;
};

/*
 * The yield protocol, passed to every arm of a generator body.
 *
 * An arm ends with `return y.yield(value, Site{locals...});` to suspend,
 * or `return y.finish();` to complete. The value and the next site are
 * taken by value: they are built from the current locals before those
 * locals are replaced, so an arm may read its own site while computing
 * them. After yield() or finish() returns, the arm's site reference is
 * gone and must not be touched.
 */
template <typename R, typename P>
class Yield
{
public:
    using position_type = P;
    using result_type = R;

    Yield(Yield const &) = delete;
    Yield & operator=(Yield const &) = delete;

    template <typename Site>
    Step<R> yield(R value, Site site)
    {
        static_assert(P::template has<Site>, "yield to a position the generator does not declare");
        position_.template emplace<Site>(std::move(site));
        return Step<R>(std::move(value));
    }

    template <typename Site>
    Step<R> yield(R value)
    {
        return yield(std::move(value), Site{});
    }

    Step<R> finish()
    {
        position_.template emplace<Exhausted>();
        return Step<R>();
    }

private:
    template <typename, typename>
    friend class Machine;

    explicit Yield(typename P::variant & position) noexcept
    : position_(position)
    { }

    typename P::variant & position_;
};

} // namespace ratchet
