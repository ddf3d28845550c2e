#pragma once

#include <staffsim/algo/job_effects.hpp>
#include <staffsim/algo/path_service.hpp>
#include <staffsim/algo/producers.hpp>
#include <staffsim/algo/task_manager.hpp>
#include <staffsim/algo/worker.hpp>

#include <staffsim/core/engine.hpp>
#include <staffsim/core/world.hpp>

#include <cstddef>
#include <memory>
#include <vector>

namespace staffsim::algo {

/// @brief Simulation-wide settings.
/// @ingroup algo_simulation
struct SimulationConfig {
    core::Duration producer_interval{core::duration_from_seconds(1.0)};
    core::Duration path_latency{core::Duration::zero()};
    double food_per_feeding{500.0};
    uint32_t max_retries{3};
    FeedingPolicy feeding{};
    SanitationPolicy sanitation{};
};

/// @brief Wires the world, task manager, path service and staff together.
///
/// Owns every collaborator a worker needs. start() registers one engine
/// tick handler that, per tick:
/// 1. advances the world,
/// 2. runs the producers when their interval has elapsed,
/// 3. updates the workers in the order they were added.
///
/// @par Example
/// @code
/// core::Engine engine;
/// core::World world(32, 32);
/// world.add_zone(1, "lions", {2, 2}, {8, 8});
///
/// algo::Simulation sim(engine, world);
/// sim.add_default_producers();
/// sim.add_worker(Role::Zookeeper, {0, 0}).assign_zone(1);
/// sim.start();
/// engine.run(core::time_from_seconds(600.0));
/// @endcode
///
/// @ingroup algo_simulation
class Simulation {
public:
    Simulation(core::Engine& engine, core::World& world, SimulationConfig config = {});

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;
    Simulation(Simulation&&) = delete;
    Simulation& operator=(Simulation&&) = delete;

    [[nodiscard]] TaskManager& tasks() noexcept { return tasks_; }
    [[nodiscard]] const TaskManager& tasks() const noexcept { return tasks_; }
    [[nodiscard]] GridPathService& paths() noexcept { return paths_; }
    [[nodiscard]] core::World& world() noexcept { return world_; }
    [[nodiscard]] const SimulationConfig& config() const noexcept { return config_; }

    /// @brief Hire a worker with the role's default configuration.
    Worker& add_worker(Role role, core::GridPos position);
    Worker& add_worker(Role role, core::GridPos position, WorkerConfig config);

    [[nodiscard]] const std::vector<std::unique_ptr<Worker>>& workers() const noexcept {
        return workers_;
    }

    void add_producer(std::unique_ptr<JobProducer> producer);

    /// @brief Add the feeding, fence and sanitation detectors.
    void add_default_producers();

    /// @brief Register queues for every zone of the world.
    void register_zones();

    /// @brief Tear a zone down: task manager first, then workers, then the world.
    /// @return False if the world had no such zone.
    bool remove_zone(ZoneId zone);

    /// @brief Run all producers now.
    /// @return Number of jobs added.
    std::size_t run_producers();

    /// @brief Hook the simulation into the engine's tick.
    /// @throws core::InvalidStateError if already started.
    void start();

    /// @brief One tick of work; what the tick handler calls.
    void step(core::Duration dt);

private:
    core::Engine& engine_;
    core::World& world_;
    SimulationConfig config_;

    TaskManager tasks_;
    GridPathService paths_;
    WorldJobEffects effects_;

    std::vector<std::unique_ptr<Worker>> workers_;
    std::vector<std::unique_ptr<JobProducer>> producers_;

    core::Duration producer_timer_{core::Duration::zero()};
    WorkerId next_worker_id_{1};
    bool started_{false};
};

} // namespace staffsim::algo
