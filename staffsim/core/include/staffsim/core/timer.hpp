#pragma once

#include <staffsim/core/event.hpp>

#include <map>

namespace staffsim::core {

class Engine;

/// @brief Provides O(1) timer cancellation by wrapping a map iterator.
/// @ingroup core_events
///
/// A TimerId is returned by Engine::add_timer() and stores an iterator into
/// the engine's ordered event map. Default-constructed instances are invalid;
/// only the Engine may create valid identifiers.
///
/// Timer callbacks should call clear() at their entry point: once the event
/// has been popped the stored iterator dangles.
///
/// @see Engine::add_timer()
/// @see Engine::cancel_timer()
class TimerId {
    friend class Engine;

public:
    TimerId() = default;

    /// @brief Check whether this timer is still valid (not fired, not cancelled).
    [[nodiscard]] bool valid() const noexcept { return valid_; }

    explicit operator bool() const noexcept { return valid_; }

    /// @brief Mark the timer as no longer valid.
    void clear() noexcept { valid_ = false; }

private:
    using Iterator = std::map<EventKey, Event>::iterator;

    TimerId(Iterator it) : it_(it), valid_(true) {}

    void invalidate() noexcept { valid_ = false; }

    Iterator it_{};
    bool valid_{false};
};

} // namespace staffsim::core
