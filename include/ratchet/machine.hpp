#pragma once

#include <ratchet/cleanup.hpp>
#include <ratchet/error.hpp>
#include <ratchet/position.hpp>
#include <ratchet/trace.hpp>
#include <ratchet/yield.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace ratchet {

/*
 * The calling convention shared by every generator of one shape:
 * R is what each resume produces, Args are the per-call parameters.
 */
template <typename Signature>
class Resumable;

template <typename R, typename... Args>
class Resumable<R(Args...)>
{
public:
    virtual ~Resumable() = default;

    /*
     * Run the body from where it last yielded, with this call's parameters.
     * Returns the yielded value, or std::nullopt on the call that finishes
     * the body.
     */
    virtual std::optional<R> resume(Args... args) = 0;

    virtual bool exhausted() const noexcept = 0;
    virtual bool running() const noexcept = 0;
    virtual std::size_t position() const noexcept = 0;
    virtual std::uint64_t id() const noexcept = 0;
};

namespace detail {

template <typename Body, typename Y, typename Variant, typename Signature>
struct handles_every_position;

template <typename Body, typename Y, typename... Alternatives, typename R, typename... Args>
struct handles_every_position<Body, Y, std::variant<Alternatives...>, R(Args...)>
: std::bool_constant<(
    (std::is_same_v<Alternatives, Exhausted>
     || std::is_invocable_r_v<Step<R>, Body &, Alternatives &, Y &, Args...>)
    && ...)> {};

} // namespace detail

/*
 * Owns one generator instance: the body object holding its cross-call
 * state, the position it last yielded at, and its cleanup registry.
 *
 * Body must declare
 *      using signature = R(Args...);
 *      using position = ratchet::Position<Sites...>;
 * and one call operator per position,
 *      Step<R> operator()(Start, Yield<R, position> &, Args...);
 *      Step<R> operator()(Site &, Yield<R, position> &, Args...);
 * A missing arm is a compile error. Body is constructed from the creation
 * arguments, preceded by a Cleanup & if Body accepts one.
 */
template <typename Body, typename R, typename... Args>
class Machine<Body, R(Args...)> final : public Resumable<R(Args...)>
{
public:
    using position_type = typename Body::position;
    using variant_type = typename position_type::variant;
    using yield_type = Yield<R, position_type>;

    static_assert(!std::is_void_v<R> && !std::is_reference_v<R>,
        "generators yield values");
    static_assert(detail::handles_every_position<Body, yield_type, variant_type, R(Args...)>::value,
        "generator body needs an arm for Start and for every yield site");

    template <typename... CreationArgs>
    explicit Machine(CreationArgs &&... args)
    : id_(detail::next_generator_id())
    , body_(make_body(registry_, std::forward<CreationArgs>(args)...))
    {
        if (detail::tracing()) {
            detail::trace("create", id_, position_.index());
        }
    }

    Machine(Machine const &) = delete;
    Machine & operator=(Machine const &) = delete;

    ~Machine() override
    {
        // the action may still reference members of body_
        registry_.fire();
        if (detail::tracing()) {
            detail::trace("teardown", id_, position_.index());
        }
    }

    std::optional<R> resume(Args... args) override
    {
        if (running_) {
            fail(errc::busy);
        }
        if (std::holds_alternative<Exhausted>(position_)) {
            fail(errc::exhausted);
        }
        if (detail::tracing()) {
            detail::trace("resume", id_, position_.index());
        }

        running_ = true;
        std::optional<R> value;
        try {
            value = std::visit([&](auto & at) {
                return arm(at, args...);
            }, position_).take();
        } catch (...) {
            running_ = false;
            position_.template emplace<Exhausted>();
            if (detail::tracing()) {
                detail::trace("error", id_, position_.index(), "body threw");
            }
            throw;
        }
        running_ = false;

        if (detail::tracing()) {
            detail::trace(value ? "yield" : "finish", id_, position_.index());
        }
        return value;
    }

    bool exhausted() const noexcept override
    { return std::holds_alternative<Exhausted>(position_); }

    bool running() const noexcept override
    { return running_; }

    std::size_t position() const noexcept override
    { return position_.index(); }

    std::uint64_t id() const noexcept override
    { return id_; }

private:
    template <typename... CreationArgs>
    static Body make_body(Cleanup & registry, CreationArgs &&... args)
    {
        if constexpr (std::is_constructible_v<Body, Cleanup &, CreationArgs...>) {
            return Body(registry, std::forward<CreationArgs>(args)...);
        } else {
            return Body(std::forward<CreationArgs>(args)...);
        }
    }

    template <typename Site>
    Step<R> arm(Site & at, Args &... args)
    {
        if constexpr (std::is_same_v<Site, Exhausted>) {
            // checked before dispatch
            throw GeneratorError(errc::exhausted);
        } else {
            yield_type y(position_);
            return body_(at, y, std::forward<Args>(args)...);
        }
    }

    [[noreturn]] void fail(errc e) const
    {
        if (detail::tracing()) {
            detail::trace("error", id_, position_.index(), make_error_code(e).message());
        }
        throw GeneratorError(e);
    }

    std::uint64_t id_;
    Cleanup registry_;
    variant_type position_;
    Body body_;
    bool running_ = false;
};

} // namespace ratchet
