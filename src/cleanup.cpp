#include <ratchet/cleanup.hpp>
#include <ratchet/error.hpp>

#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace ratchet {

void Cleanup::defer(std::function<void()> action)
{
    if (!action) {
        throw std::invalid_argument("cleanup action is empty");
    }
    if (fired_) {
        throw GeneratorError(errc::torn_down);
    }
    if (action_) {
        throw GeneratorError(errc::cleanup_already_registered);
    }
    action_ = std::move(action);
}

void Cleanup::fire() noexcept
{
    if (fired_) {
        return;
    }
    fired_ = true;
    // moved out first so the action cannot observe itself still armed
    auto action = std::move(action_);
    action_ = nullptr;
    if (!action) {
        return;
    }
    try {
        action();
    } catch (std::exception const & e) {
        std::cerr << "ratchet: cleanup action failed: " << e.what() << std::endl;
    }
}

} // namespace ratchet
