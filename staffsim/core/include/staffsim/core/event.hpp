#pragma once

#include <staffsim/core/types.hpp>

#include <compare>
#include <cstdint>
#include <functional>
#include <variant>

namespace staffsim::core {

/// @brief Deterministic ordering key for events in the priority queue.
///
/// Events are ordered first by simulation time, then by priority
/// (lower values fire first), then by insertion sequence number to
/// guarantee determinism when time and priority are equal.
///
/// @see EventPriority, Engine::schedule_event
/// @ingroup core_events
struct EventKey {
    TimePoint time;      ///< Primary: simulation time at which the event fires.
    int priority;        ///< Secondary: lower values fire first within a timestep.
    uint64_t sequence;   ///< Tertiary: insertion order for determinism.

    /// @cond INTERNAL
    auto operator<=>(const EventKey&) const = default;
    /// @endcond
};

/// @brief Named constants for event dispatch priority.
///
/// Path results land before the tick that shares their timestamp, so a
/// worker polling its request handle during that tick already sees them.
///
/// @see EventKey, Engine::add_timer
/// @ingroup core_events
struct EventPriority {
    static constexpr int PATH_RESULT   = -200; ///< Asynchronous path computation resolves.
    static constexpr int TICK          = -100; ///< Fixed simulation step.
    static constexpr int TIMER_DEFAULT = 0;    ///< Default priority for user timers.
};

/// @brief One fixed-size simulation step.
///
/// Dispatching a tick runs every registered tick handler in registration
/// order and re-arms the next tick one period later.
///
/// @see Engine::add_tick_handler
/// @ingroup core_events
struct TickEvent {
    uint64_t index; ///< Zero-based tick number.
};

/// @brief A one-shot timer callback fires.
///
/// Created by Engine::add_timer(). The callback is invoked during
/// event dispatch at the scheduled time and priority.
///
/// @see Engine::add_timer, Engine::cancel_timer
/// @ingroup core_events
struct TimerEvent {
    std::function<void()> callback;  ///< User-provided callback to invoke.
};

/// @brief Variant holding all possible event types in the simulation.
/// @ingroup core_events
using Event = std::variant<
    TickEvent,
    TimerEvent
>;

} // namespace staffsim::core
