#pragma once

#include <staffsim/core/event.hpp>
#include <staffsim/core/timer.hpp>
#include <staffsim/core/trace_writer.hpp>
#include <staffsim/core/types.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <vector>

namespace staffsim::core {

/// @brief Event-driven simulation engine with a fixed-size tick.
///
/// The Engine is the single tick authority of the simulation. It owns an
/// ordered event queue and advances simulation time by dispatching events
/// in chronological order. Within a single timestep, events are processed
/// by priority and then by insertion order.
///
/// Two kinds of events exist: one-shot timers (used for asynchronous
/// completions such as path computations) and the periodic tick. Each tick
/// invokes every tick handler sequentially, in registration order, so
/// callers that mutate shared state from tick handlers never race.
///
/// @code
/// core::Engine engine;
/// engine.set_tick_period(core::duration_from_milliseconds(100));
/// engine.add_tick_handler([&](core::Duration dt) { world.advance(dt); });
/// engine.run(core::time_from_seconds(60.0));
/// @endcode
///
/// The Engine is non-copyable and non-movable, designed for stack
/// allocation.
///
/// @see TraceWriter, TimerId
/// @ingroup core_engine
class Engine {
public:
    /// @brief Callback type for tick handlers; receives the tick period.
    using TickHandler = std::function<void(Duration)>;

    Engine() = default;
    ~Engine() = default;

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;
    Engine(Engine&&) = delete;
    Engine& operator=(Engine&&) = delete;

    /// @brief Returns the current simulation time.
    [[nodiscard]] TimePoint time() const noexcept { return current_time_; }

    /// @brief Run simulation until the event queue is empty.
    /// @throws InvalidStateError if ticking is enabled (the queue never drains).
    void run();

    /// @brief Run simulation until the given time point.
    /// @param until Simulation stops after processing all events at this time.
    void run(TimePoint until);

    /// @brief Run simulation until the stop condition returns true.
    /// @param stop_condition Evaluated between timesteps; simulation stops when it returns true.
    void run(std::function<bool()> stop_condition);

    /// @brief Request the engine to stop after the current timestep completes.
    ///
    /// The flag is checked between timesteps and auto-resets at the start of
    /// each run() call.
    void request_stop() noexcept { stop_requested_ = true; }

    /// @brief Returns true if a stop has been requested.
    [[nodiscard]] bool stop_requested() const noexcept { return stop_requested_; }

    /// @brief Schedule a one-shot timer.
    /// @param when Absolute simulation time to fire (must be >= time()).
    /// @param priority Lower values fire first within the same timestep.
    /// @param callback Invoked when the timer fires.
    /// @return Identifier that can be passed to cancel_timer().
    /// @throws InvalidStateError if @p when < time().
    TimerId add_timer(TimePoint when, int priority, std::function<void()> callback);

    /// @brief Schedule a one-shot timer with default priority.
    TimerId add_timer(TimePoint when, std::function<void()> callback);

    /// @brief Cancel a pending timer.
    /// @param timer_id Timer to cancel; reset to invalid on return.
    void cancel_timer(TimerId& timer_id);

    /// @brief Set the fixed tick period.
    /// @param period Length of one simulation step (must be positive).
    /// @throws InvalidStateError if @p period is not positive or ticking already started.
    void set_tick_period(Duration period);

    /// @brief Returns the fixed tick period (default 100 ms).
    [[nodiscard]] Duration tick_period() const noexcept { return tick_period_; }

    /// @brief Register a handler invoked on every tick.
    ///
    /// Handlers run in registration order. Registering the first handler
    /// arms the first tick at time() + tick_period().
    ///
    /// @param handler Called with the tick period on every tick.
    void add_tick_handler(TickHandler handler);

    /// @brief Returns true once the first tick handler has been registered.
    [[nodiscard]] bool ticking() const noexcept { return ticking_; }

    /// @brief Number of ticks dispatched so far.
    [[nodiscard]] uint64_t tick_count() const noexcept { return tick_count_; }

    /// @brief Set the trace writer for simulation event logging.
    ///
    /// The Engine does not own the writer. Pass nullptr to disable tracing.
    void set_trace_writer(TraceWriter* writer) noexcept { trace_writer_ = writer; }

    /// @brief Returns true if a trace writer is installed.
    [[nodiscard]] bool tracing() const noexcept { return trace_writer_ != nullptr; }

    /// @brief Invoke a tracing callback only if a trace writer is set.
    ///
    /// Zero overhead when tracing is disabled: the callback is not invoked.
    ///
    /// @tparam F Callable with signature void(TraceWriter&).
    /// @param func Callback that writes trace data.
    template<typename F>
    void trace(F&& func);

    /// @brief Insert a raw event into the event queue.
    /// @param when Simulation time for the event.
    /// @param priority Priority within the timestep (lower = earlier).
    /// @param event The event payload.
    /// @throws InvalidStateError if @p when < time().
    void schedule_event(TimePoint when, int priority, Event event);

    /// @brief Number of pending events (timers and the armed tick).
    [[nodiscard]] std::size_t pending_events() const noexcept { return event_queue_.size(); }

private:
    void process_timestep();
    void dispatch_event(Event& event);
    void dispatch_tick(const TickEvent& tick);

    TimePoint current_time_{};
    uint64_t sequence_{0};
    bool stop_requested_{false};

    Duration tick_period_{duration_from_milliseconds(100)};
    bool ticking_{false};
    uint64_t tick_count_{0};
    std::vector<TickHandler> tick_handlers_;

    std::map<EventKey, Event> event_queue_;
    TraceWriter* trace_writer_{nullptr};
};

// Template implementation
template<typename F>
void Engine::trace(F&& func) {
    if (trace_writer_) {
        trace_writer_->begin(current_time_);
        func(*trace_writer_);
        trace_writer_->end();
    }
}

} // namespace staffsim::core
