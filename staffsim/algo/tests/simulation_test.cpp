#include "test_helpers.hpp"

#include <staffsim/algo/simulation.hpp>

#include <staffsim/core/engine.hpp>
#include <staffsim/core/error.hpp>
#include <staffsim/core/world.hpp>

#include <gtest/gtest.h>

using namespace staffsim;
using namespace staffsim::algo;

class SimulationTest : public ::testing::Test {
protected:
    core::Engine engine;
    core::World world{20, 20};
    test::RecordingWriter writer;

    void SetUp() override {
        engine.set_trace_writer(&writer);
    }

    void add_pen() {
        world.add_zone(1, "pen", {5, 5}, {9, 9}, core::FenceCondition::Good,
                       core::Fence{{7, 5}, core::EdgeDirection::North, core::FenceCondition::Good, true});
    }

    void run_until(double seconds) {
        engine.run(core::time_from_seconds(seconds));
    }
};

TEST_F(SimulationTest, ZookeeperFeedsHungryAnimals) {
    add_pen();
    uint64_t animal = world.add_animal(1, core::FoodType::Meat, 20.0, 0.0);

    Simulation sim(engine, world);
    sim.register_zones();
    sim.add_default_producers();
    sim.add_worker(Role::Zookeeper, {7, 2}).assign_zone(1);
    sim.start();

    run_until(40.0);

    EXPECT_GE(writer.count("job_completed"), 1U);
    EXPECT_GE(world.animal(animal).hunger, 50.0);
    EXPECT_GT(world.food_in_zone(1), 0.0);
    EXPECT_FALSE(sim.tasks().has_task_for(JobKind::FeedAnimals, 1));
}

TEST_F(SimulationTest, MaintenanceRepairsDamagedFence) {
    world.set_fence({3, 3}, core::EdgeDirection::North, core::FenceCondition::Damaged);

    Simulation sim(engine, world);
    sim.add_default_producers();
    sim.add_worker(Role::Maintenance, {0, 0});
    sim.start();

    run_until(20.0);

    const core::Fence* fence = world.fence({3, 3}, core::EdgeDirection::North);
    ASSERT_NE(fence, nullptr);
    EXPECT_EQ(fence->condition, core::FenceCondition::Good);
    EXPECT_EQ(sim.tasks().stats().queued + sim.tasks().stats().active, 0U);
}

TEST_F(SimulationTest, MaintenanceEmptiesBinsAndClearsLitter) {
    world.set_path({4, 0}, true);
    world.add_litter({4, 0});
    uint64_t bin = world.add_bin({2, 2}, 100.0, 0.0, 90.0);

    Simulation sim(engine, world);
    sim.add_default_producers();
    sim.add_worker(Role::Maintenance, {0, 0});
    sim.start();

    run_until(40.0);

    EXPECT_TRUE(world.litter().empty());
    EXPECT_DOUBLE_EQ(world.bin(bin).fill, 0.0);
}

TEST_F(SimulationTest, RolesOnlyTakeTheirOwnWork) {
    world.set_fence({3, 3}, core::EdgeDirection::North, core::FenceCondition::Failed);

    Simulation sim(engine, world);
    sim.add_default_producers();
    sim.add_worker(Role::Zookeeper, {0, 0});
    sim.start();

    run_until(30.0);

    EXPECT_EQ(writer.count("job_claimed"), 0U);
    EXPECT_TRUE(sim.tasks().has_task_for(JobKind::RepairFence));
}

TEST_F(SimulationTest, RemoveZoneTearsDownInOrder) {
    add_pen();
    world.add_animal(1, core::FoodType::Meat, 10.0, 0.0);

    Simulation sim(engine, world);
    sim.register_zones();
    Worker& keeper = sim.add_worker(Role::Zookeeper, {7, 2});
    keeper.assign_zone(1);
    EXPECT_EQ(sim.run_producers(), 0U);
    sim.add_default_producers();
    EXPECT_EQ(sim.run_producers(), 1U);

    EXPECT_TRUE(sim.remove_zone(1));

    EXPECT_FALSE(sim.tasks().has_task_for(JobKind::FeedAnimals, 1));
    EXPECT_TRUE(keeper.assigned_zones().empty());
    EXPECT_EQ(world.find_zone(1), nullptr);
    EXPECT_EQ(sim.run_producers(), 0U);
    EXPECT_FALSE(sim.remove_zone(1));
}

TEST_F(SimulationTest, WorkerLosesJobWhenZoneIsRemoved) {
    add_pen();
    world.add_animal(1, core::FoodType::Meat, 10.0, 0.0);

    Simulation sim(engine, world);
    sim.register_zones();
    sim.add_default_producers();
    Worker& keeper = sim.add_worker(Role::Zookeeper, {7, 0});
    keeper.assign_zone(1);
    sim.start();

    run_until(8.0);
    ASSERT_TRUE(keeper.current_job().has_value());

    sim.remove_zone(1);
    run_until(8.1);

    EXPECT_FALSE(keeper.current_job().has_value());
    EXPECT_EQ(writer.count("job_abandoned"), 1U);
    EXPECT_EQ(writer.count("job_failed"), 0U);
}

TEST_F(SimulationTest, StartTwiceThrows) {
    Simulation sim(engine, world);
    sim.start();
    EXPECT_THROW(sim.start(), core::InvalidStateError);
}

TEST_F(SimulationTest, WorkerIdsAreSequential) {
    Simulation sim(engine, world);
    EXPECT_EQ(sim.add_worker(Role::Zookeeper, {0, 0}).id(), 1U);
    EXPECT_EQ(sim.add_worker(Role::Maintenance, {1, 0}).id(), 2U);
    EXPECT_EQ(sim.workers().size(), 2U);
}
