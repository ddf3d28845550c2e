#include <staffsim/core/engine.hpp>
#include <staffsim/core/error.hpp>

#include <type_traits>
#include <utility>

namespace staffsim::core {

void Engine::run() {
    if (ticking_) {
        throw InvalidStateError("Cannot run without a bound while ticking is enabled");
    }
    stop_requested_ = false;
    while (!event_queue_.empty() && !stop_requested_) {
        process_timestep();
    }
}

void Engine::run(TimePoint until) {
    stop_requested_ = false;
    while (!event_queue_.empty() && !stop_requested_) {
        // Check if next event is beyond our stop time
        auto it = event_queue_.begin();
        if (it->first.time > until) {
            current_time_ = until;
            return;
        }
        process_timestep();
    }
    if (!stop_requested_ && current_time_ < until) {
        current_time_ = until;
    }
}

void Engine::run(std::function<bool()> stop_condition) {
    stop_requested_ = false;
    while (!event_queue_.empty() && !stop_requested_ && !stop_condition()) {
        process_timestep();
    }
}

TimerId Engine::add_timer(TimePoint when, int priority, std::function<void()> callback) {
    if (when < current_time_) {
        throw InvalidStateError("Timer must be scheduled in the future (when >= time())");
    }

    EventKey key{when, priority, sequence_++};
    Event event = TimerEvent{std::move(callback)};
    auto [it, inserted] = event_queue_.emplace(key, std::move(event));
    return TimerId(it);
}

TimerId Engine::add_timer(TimePoint when, std::function<void()> callback) {
    return add_timer(when, EventPriority::TIMER_DEFAULT, std::move(callback));
}

void Engine::cancel_timer(TimerId& timer_id) {
    if (!timer_id.valid_) {
        return; // No-op if already invalid
    }
    event_queue_.erase(timer_id.it_);
    timer_id.invalidate();
}

void Engine::set_tick_period(Duration period) {
    if (period <= Duration::zero()) {
        throw InvalidStateError("Tick period must be positive");
    }
    if (ticking_) {
        throw InvalidStateError("Cannot change the tick period once ticking has started");
    }
    tick_period_ = period;
}

void Engine::add_tick_handler(TickHandler handler) {
    tick_handlers_.push_back(std::move(handler));
    if (!ticking_) {
        ticking_ = true;
        schedule_event(current_time_ + tick_period_, EventPriority::TICK, TickEvent{0});
    }
}

void Engine::schedule_event(TimePoint when, int priority, Event event) {
    if (when < current_time_) {
        throw InvalidStateError("Cannot schedule event in the past");
    }

    EventKey key{when, priority, sequence_++};
    event_queue_.emplace(key, std::move(event));
}

void Engine::process_timestep() {
    if (event_queue_.empty()) {
        return;
    }

    TimePoint timestep = event_queue_.begin()->first.time;
    current_time_ = timestep;

    // Events scheduled for the current time while dispatching are picked up
    // by this loop as well.
    while (!event_queue_.empty()) {
        auto it = event_queue_.begin();
        if (it->first.time != timestep) {
            break;
        }

        Event event = std::move(it->second);
        event_queue_.erase(it);

        dispatch_event(event);
    }
}

void Engine::dispatch_event(Event& event) {
    std::visit([this](auto& ev) {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, TickEvent>) {
            dispatch_tick(ev);
        } else if constexpr (std::is_same_v<T, TimerEvent>) {
            if (ev.callback) {
                ev.callback();
            }
        }
    }, event);
}

void Engine::dispatch_tick(const TickEvent& tick) {
    ++tick_count_;
    // Handlers registered during this tick first run on the next one.
    std::size_t count = tick_handlers_.size();
    for (std::size_t i = 0; i < count; ++i) {
        TickHandler handler = tick_handlers_[i];
        handler(tick_period_);
    }
    schedule_event(current_time_ + tick_period_, EventPriority::TICK,
                   TickEvent{tick.index + 1});
}

} // namespace staffsim::core
