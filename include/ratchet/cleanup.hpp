#pragma once

#include <functional>

namespace ratchet {

/*
 * Holds at most one deferred action, run exactly once when the generator
 * owning it is torn down.
 *
 * A generator body receives its registry in its constructor and defers the
 * release of whatever its state acquired there. The action runs whether the
 * body finished, was abandoned mid-sequence, or was never resumed.
 */
class Cleanup
{
public:
    Cleanup() = default;
    Cleanup(Cleanup const &) = delete;
    Cleanup & operator=(Cleanup const &) = delete;

    ~Cleanup()
    { fire(); }

    /*
     * Register the action. Throws GeneratorError if one was already
     * registered or the registry already fired.
     *
     * The action runs from a destructor: a std::exception it throws is
     * reported on stderr and dropped, anything else terminates.
     */
    void defer(std::function<void()> action);

    bool armed() const noexcept
    { return static_cast<bool>(action_); }

    bool fired() const noexcept
    { return fired_; }

    /*
     * Run the action if there is one. Only the first call does anything.
     */
    void fire() noexcept;

private:
    std::function<void()> action_;
    bool fired_ = false;
};

} // namespace ratchet
