#include <staffsim/algo/simulation.hpp>
#include <staffsim/algo/task_manager.hpp>

#include <staffsim/core/engine.hpp>
#include <staffsim/core/types.hpp>
#include <staffsim/core/world.hpp>

#include <benchmark/benchmark.h>

using namespace staffsim::core;
using namespace staffsim::algo;

namespace {

JobInput litter_at(int32_t x, int32_t y, int priority) {
    GridPos tile{x, y};
    return JobInput{.priority = priority, .target = tile, .zone = std::nullopt,
                    .payload = ClearLitterPayload{tile}, .max_retries = 3};
}

} // namespace

// ---------------------------------------------------------------------------
// BM_AddTask: insert N jobs into the global maintenance queue
// ---------------------------------------------------------------------------

static void BM_AddTask(benchmark::State& state) {
    const int64_t n = state.range(0);

    for (auto _ : state) {
        Engine engine;
        TaskManager tasks(engine);
        for (int64_t i = 0; i < n; ++i) {
            tasks.add_task(litter_at(static_cast<int32_t>(i % 64), static_cast<int32_t>(i / 64),
                                     static_cast<int>(i % 3)));
        }
        benchmark::DoNotOptimize(tasks.stats());
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(BM_AddTask)->Arg(1000)->Arg(10000);

// ---------------------------------------------------------------------------
// BM_ClaimComplete: drain N queued jobs through claim + complete
// ---------------------------------------------------------------------------

static void BM_ClaimComplete(benchmark::State& state) {
    const int64_t n = state.range(0);

    for (auto _ : state) {
        state.PauseTiming();
        Engine engine;
        TaskManager tasks(engine);
        for (int64_t i = 0; i < n; ++i) {
            tasks.add_task(litter_at(static_cast<int32_t>(i % 64), static_cast<int32_t>(i / 64),
                                     static_cast<int>(i % 3)));
        }
        ClaimRequest request{.worker = 1, .role = Role::Maintenance, .zones = {},
                             .enabled_kinds = {JobKind::ClearLitter},
                             .position = {32, 32}, .avoid_targets = {}};
        state.ResumeTiming();

        while (auto job = tasks.claim_task(request)) {
            tasks.complete_task(job->id());
        }
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(BM_ClaimComplete)->Arg(100)->Arg(1000);

// ---------------------------------------------------------------------------
// BM_ZoneContention: many zones, workers claiming from their own zone
// ---------------------------------------------------------------------------

static void BM_ZoneContention(benchmark::State& state) {
    const int64_t zones = state.range(0);
    constexpr int64_t JOBS_PER_ZONE = 20;

    for (auto _ : state) {
        state.PauseTiming();
        Engine engine;
        TaskManager tasks(engine);
        for (int64_t z = 1; z <= zones; ++z) {
            tasks.register_zone(static_cast<ZoneId>(z));
            for (int64_t i = 0; i < JOBS_PER_ZONE; ++i) {
                GridPos target{static_cast<int32_t>(i), static_cast<int32_t>(z)};
                tasks.add_task(JobInput{.priority = Priority::NORMAL, .target = target,
                                        .zone = static_cast<ZoneId>(z),
                                        .payload = CleanWastePayload{target}, .max_retries = 3});
            }
        }
        state.ResumeTiming();

        for (int64_t z = 1; z <= zones; ++z) {
            ClaimRequest request{.worker = static_cast<WorkerId>(z), .role = Role::Zookeeper,
                                 .zones = {static_cast<ZoneId>(z)},
                                 .enabled_kinds = {JobKind::CleanWaste},
                                 .position = {0, static_cast<int32_t>(z)}, .avoid_targets = {}};
            while (auto job = tasks.claim_task(request)) {
                tasks.complete_task(job->id());
            }
        }
    }
    state.SetItemsProcessed(state.iterations() * zones * JOBS_PER_ZONE);
}
BENCHMARK(BM_ZoneContention)->Arg(10)->Arg(100);

// ---------------------------------------------------------------------------
// BM_SimulatedHour: full simulation, 8 workers, default producers, no trace
// ---------------------------------------------------------------------------

static void BM_SimulatedHour(benchmark::State& state) {
    for (auto _ : state) {
        Engine engine;
        World world(48, 32);
        for (ZoneId z = 1; z <= 4; ++z) {
            auto x = static_cast<int32_t>(2 + (z - 1) * 11);
            world.add_zone(z, "exhibit", {x, 2}, {x + 8, 10}, FenceCondition::LightDamage,
                           Fence{{x + 4, 10}, EdgeDirection::South});
            world.add_animal(z, FoodType::Meat, 30.0, 1.0);
        }
        for (int32_t x = 0; x < 48; ++x) {
            world.set_path({x, 14}, true);
            if (x % 5 == 0) {
                world.add_litter({x, 14});
            }
        }

        Simulation sim(engine, world);
        sim.register_zones();
        sim.add_default_producers();
        for (ZoneId z = 1; z <= 4; ++z) {
            sim.add_worker(Role::Zookeeper, {static_cast<int32_t>(z * 11 - 5), 14}).assign_zone(z);
            sim.add_worker(Role::Maintenance, {static_cast<int32_t>(z * 11 - 5), 14});
        }
        sim.start();
        engine.run(time_from_seconds(3600.0));
        benchmark::DoNotOptimize(sim.tasks().stats());
    }
}
BENCHMARK(BM_SimulatedHour)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
