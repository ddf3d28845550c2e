#include <staffsim/core/engine.hpp>
#include <staffsim/core/error.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace staffsim::core;

class EngineTest : public ::testing::Test {
protected:
    TimePoint time(double seconds) {
        return time_from_seconds(seconds);
    }

    Duration ms(int64_t value) {
        return duration_from_milliseconds(value);
    }
};

TEST_F(EngineTest, InitialState) {
    Engine engine;

    EXPECT_EQ(engine.time(), time(0.0));
    EXPECT_FALSE(engine.ticking());
    EXPECT_EQ(engine.tick_count(), 0U);
    EXPECT_EQ(engine.tick_period(), ms(100));
}

TEST_F(EngineTest, RunUntilAdvancesClock) {
    Engine engine;

    engine.run(time(10.0));

    EXPECT_EQ(engine.time(), time(10.0));
}

TEST_F(EngineTest, TimersFireInTimeOrder) {
    Engine engine;
    std::vector<int> order;

    engine.add_timer(time(2.0), [&order]() { order.push_back(2); });
    engine.add_timer(time(1.0), [&order]() { order.push_back(1); });
    engine.add_timer(time(3.0), [&order]() { order.push_back(3); });

    engine.run();

    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(engine.time(), time(3.0));
}

TEST_F(EngineTest, PriorityOrdersSameTimeEvents) {
    Engine engine;
    std::vector<std::string> order;

    engine.add_timer(time(1.0), EventPriority::TIMER_DEFAULT, [&]() { order.push_back("timer"); });
    engine.add_timer(time(1.0), EventPriority::PATH_RESULT, [&]() { order.push_back("path"); });

    engine.run();

    EXPECT_EQ(order, (std::vector<std::string>{"path", "timer"}));
}

TEST_F(EngineTest, TimerInPastThrows) {
    Engine engine;
    engine.run(time(5.0));

    EXPECT_THROW(engine.add_timer(time(1.0), []() {}), InvalidStateError);
}

TEST_F(EngineTest, CancelledTimerDoesNotFire) {
    Engine engine;
    bool fired = false;

    TimerId id = engine.add_timer(time(1.0), [&fired]() { fired = true; });
    engine.cancel_timer(id);
    EXPECT_FALSE(id.valid());

    engine.run();
    EXPECT_FALSE(fired);
}

TEST_F(EngineTest, RunConditionStopsEarly) {
    Engine engine;
    int counter = 0;

    engine.add_timer(time(1.0), [&counter]() { counter++; });
    engine.add_timer(time(2.0), [&counter]() { counter++; });
    engine.add_timer(time(3.0), [&counter]() { counter++; });

    engine.run([&counter]() { return counter >= 2; });

    EXPECT_EQ(counter, 2);
    EXPECT_EQ(engine.time(), time(2.0));
}

TEST_F(EngineTest, RequestStopFromCallback) {
    Engine engine;
    int counter = 0;

    engine.add_timer(time(1.0), [&]() { counter++; engine.request_stop(); });
    engine.add_timer(time(2.0), [&]() { counter++; });

    engine.run();

    EXPECT_EQ(counter, 1);
    EXPECT_TRUE(engine.stop_requested());
}

// ============================================================================
// Fixed tick
// ============================================================================

TEST_F(EngineTest, TickHandlersRunEveryPeriod) {
    Engine engine;
    std::vector<Duration> steps;

    engine.add_tick_handler([&steps](Duration dt) { steps.push_back(dt); });
    EXPECT_TRUE(engine.ticking());

    engine.run(time(1.0));

    EXPECT_EQ(steps.size(), 10U);
    EXPECT_EQ(engine.tick_count(), 10U);
    for (Duration dt : steps) {
        EXPECT_EQ(dt, ms(100));
    }
}

TEST_F(EngineTest, HandlersRunInRegistrationOrder) {
    Engine engine;
    std::vector<int> order;

    engine.add_tick_handler([&order](Duration) { order.push_back(1); });
    engine.add_tick_handler([&order](Duration) { order.push_back(2); });

    engine.run(time(0.1));

    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST_F(EngineTest, HandlerAddedDuringTickStartsNextTick) {
    Engine engine;
    int late_calls = 0;
    bool added = false;

    engine.add_tick_handler([&](Duration) {
        if (!added) {
            added = true;
            engine.add_tick_handler([&late_calls](Duration) { late_calls++; });
        }
    });

    engine.run(time(0.1));
    EXPECT_EQ(late_calls, 0);

    engine.run(time(0.2));
    EXPECT_EQ(late_calls, 1);
}

TEST_F(EngineTest, CustomTickPeriod) {
    Engine engine;
    engine.set_tick_period(ms(250));
    int ticks = 0;

    engine.add_tick_handler([&ticks](Duration) { ticks++; });
    engine.run(time(1.0));

    EXPECT_EQ(ticks, 4);
}

TEST_F(EngineTest, TickPeriodValidation) {
    Engine engine;

    EXPECT_THROW(engine.set_tick_period(Duration::zero()), InvalidStateError);

    engine.add_tick_handler([](Duration) {});
    EXPECT_THROW(engine.set_tick_period(ms(50)), InvalidStateError);
}

TEST_F(EngineTest, UnboundedRunWhileTickingThrows) {
    Engine engine;
    engine.add_tick_handler([](Duration) {});

    EXPECT_THROW(engine.run(), InvalidStateError);
}

TEST_F(EngineTest, TimerScheduledDuringTickFiresSameTimestep) {
    Engine engine;
    TimePoint fired_at = time(-1.0);

    bool scheduled = false;
    engine.add_tick_handler([&](Duration) {
        if (!scheduled) {
            scheduled = true;
            engine.add_timer(engine.time(), EventPriority::PATH_RESULT,
                             [&]() { fired_at = engine.time(); });
        }
    });

    engine.run(time(0.1));

    EXPECT_EQ(fired_at, time(0.1));
}
