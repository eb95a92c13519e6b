#pragma once

#include <ratchet/error.hpp>
#include <ratchet/machine.hpp>

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <utility>

namespace ratchet {

template <typename Signature>
class Generator;

/*
 * Owning handle to one generator instance.
 *
 * Generators with the same signature are interchangeable whatever body
 * they run. Each resume produces one value, or std::nullopt once the body
 * finishes. Destroying or resetting the handle tears the instance down and
 * runs its cleanup action exactly once. An empty handle (default
 * constructed, moved from, or reset) reports errc::torn_down when used.
 *
 * Resuming after the body finished reports errc::exhausted; a generator
 * never restarts.
 */
template <typename R, typename... Args>
class Generator<R(Args...)>
{
public:
    using result_type = R;
    using resumable_type = Resumable<R(Args...)>;

    Generator() noexcept = default;

    explicit Generator(std::unique_ptr<resumable_type> machine) noexcept
    : machine_(std::move(machine))
    { }

    Generator(Generator && other) noexcept = default;

    Generator & operator=(Generator && other)
    {
        if (machine_ && machine_->running()) {
            throw GeneratorError(errc::busy);
        }
        machine_ = std::move(other.machine_);
        return *this;
    }

    std::optional<R> resume(Args... args)
    { return machine().resume(std::forward<Args>(args)...); }

    std::optional<R> operator()(Args... args)
    { return machine().resume(std::forward<Args>(args)...); }

    bool exhausted() const
    { return machine().exhausted(); }

    // Index of the current position: 0 before the first resume, then the
    // yield site's index, then Position::count + 1 once finished.
    std::size_t position() const
    { return machine().position(); }

    std::uint64_t id() const
    { return machine().id(); }

    explicit operator bool() const noexcept
    { return machine_ != nullptr; }

    /*
     * Tear the instance down now. Cannot be called from inside its own body.
     */
    void reset()
    {
        if (machine_ && machine_->running()) {
            throw GeneratorError(errc::busy);
        }
        machine_.reset();
    }

    // Single-pass input iterator; each increment is one resume.
    class iterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using difference_type = std::ptrdiff_t;
        using value_type = R;
        using reference = R const &;
        using pointer = R const *;

        iterator() = default;

        reference operator*() const
        { return *current_; }

        pointer operator->() const
        { return std::addressof(*current_); }

        iterator & operator++()
        {
            advance();
            return *this;
        }

        void operator++(int)
        { advance(); }

        friend bool operator==(iterator const & it, std::default_sentinel_t) noexcept
        { return !it.current_.has_value(); }

    private:
        friend class Generator;

        explicit iterator(Generator & generator)
        : generator_(&generator)
        { advance(); }

        void advance()
        {
            if (generator_->exhausted()) {
                current_.reset();
            } else {
                current_ = generator_->resume();
            }
        }

        Generator * generator_ = nullptr;
        std::optional<R> current_;
    };

    iterator begin() requires (sizeof...(Args) == 0)
    { return iterator(*this); }

    std::default_sentinel_t end() const noexcept requires (sizeof...(Args) == 0)
    { return {}; }

private:
    resumable_type & machine() const
    {
        if (!machine_) {
            throw GeneratorError(errc::torn_down);
        }
        return *machine_;
    }

    std::unique_ptr<resumable_type> machine_;
};

/*
 * Create a fresh, independent generator running Body. The arguments go to
 * Body's constructor, after the cleanup registry if Body takes one.
 */
template <typename Body, typename... CreationArgs>
Generator<typename Body::signature> make_generator(CreationArgs &&... args)
{
    using signature = typename Body::signature;
    return Generator<signature>(
        std::make_unique<Machine<Body, signature>>(std::forward<CreationArgs>(args)...));
}

} // namespace ratchet
