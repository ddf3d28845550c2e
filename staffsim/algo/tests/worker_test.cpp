#include "test_helpers.hpp"

#include <staffsim/algo/job_effects.hpp>
#include <staffsim/algo/path_service.hpp>
#include <staffsim/algo/task_manager.hpp>
#include <staffsim/algo/worker.hpp>

#include <staffsim/core/engine.hpp>
#include <staffsim/core/world.hpp>

#include <gtest/gtest.h>

#include <memory>

using namespace staffsim;
using namespace staffsim::algo;

class WorkerTest : public ::testing::Test {
protected:
    core::Engine engine;
    core::World world{20, 20};
    TaskManager tasks{engine};
    GridPathService paths{engine, world};
    WorldJobEffects effects{world};
    test::RecordingWriter writer;
    std::unique_ptr<Worker> worker;

    void SetUp() override {
        engine.set_trace_writer(&writer);
    }

    // Wandering is off unless asked for, so positions stay predictable.
    Worker& hire(Role role, core::GridPos pos, PathService& service, bool wander = false) {
        WorkerConfig config = WorkerConfig::for_role(role);
        if (!wander) {
            config.wander_interval = core::duration_from_seconds(1e6);
        }
        worker = std::make_unique<Worker>(1, role, pos,
                                          WorkerContext{engine, tasks, service, effects}, config);
        engine.add_tick_handler([this](core::Duration dt) { worker->update(dt); });
        return *worker;
    }

    Worker& hire(Role role, core::GridPos pos) {
        return hire(role, pos, paths);
    }

    void run_until(double seconds) {
        engine.run(core::time_from_seconds(seconds));
    }

    JobId add_litter(core::GridPos tile) {
        world.add_litter(tile);
        return tasks.add_task(test::litter_job(tile));
    }
};

TEST_F(WorkerTest, RoleDefaults) {
    EXPECT_EQ(WorkerConfig::for_role(Role::Zookeeper).poll_interval, core::duration_from_seconds(8.0));
    EXPECT_EQ(WorkerConfig::for_role(Role::Maintenance).poll_interval, core::duration_from_seconds(6.0));

    Worker& w = hire(Role::Zookeeper, {0, 0});
    EXPECT_EQ(w.state(), WorkerState::Idle);
    EXPECT_EQ(w.enabled_kinds(), (std::set<JobKind>{JobKind::FeedAnimals, JobKind::CleanWaste}));
}

TEST_F(WorkerTest, KindTogglesAreRoleChecked) {
    Worker& w = hire(Role::Zookeeper, {0, 0});

    EXPECT_FALSE(w.set_kind_enabled(JobKind::RepairFence, true));
    EXPECT_TRUE(w.set_kind_enabled(JobKind::CleanWaste, false));
    EXPECT_EQ(w.enabled_kinds(), (std::set<JobKind>{JobKind::FeedAnimals}));
}

TEST_F(WorkerTest, ClaimsOnPollInterval) {
    Worker& w = hire(Role::Maintenance, {0, 0});
    JobId id = add_litter({5, 0});

    run_until(5.9);
    EXPECT_FALSE(w.current_job().has_value());
    EXPECT_FALSE(tasks.is_active(id));

    run_until(6.0);
    ASSERT_TRUE(w.current_job().has_value());
    EXPECT_EQ(w.current_job()->id(), id);
    EXPECT_EQ(w.state(), WorkerState::Walking);
    EXPECT_EQ(tasks.active_owner(id), WorkerId{1});
}

TEST_F(WorkerTest, WalksWorksAndCompletes) {
    Worker& w = hire(Role::Maintenance, {0, 0});
    JobId id = add_litter({5, 0});

    // Claim at 6 s, five tiles at 2.5 tiles/s, then 5 s of work.
    run_until(8.5);
    EXPECT_EQ(w.position(), (core::GridPos{5, 0}));
    EXPECT_EQ(w.state(), WorkerState::Working);
    EXPECT_EQ(world.litter().size(), 1U);

    run_until(14.0);
    EXPECT_FALSE(w.current_job().has_value());
    EXPECT_FALSE(tasks.is_active(id));
    EXPECT_TRUE(world.litter().empty());
    EXPECT_EQ(writer.count("job_completed"), 1U);
    EXPECT_EQ(writer.count("job_failed"), 0U);
}

TEST_F(WorkerTest, StartsWorkingWhenAlreadyAtTarget) {
    Worker& w = hire(Role::Maintenance, {3, 3});
    add_litter({3, 3});

    run_until(6.0);
    EXPECT_EQ(w.state(), WorkerState::Working);
}

TEST_F(WorkerTest, FeedingPlacesFoodWhereTheWorkerStands) {
    world.add_zone(1, "pen", {4, 4}, {8, 8}, core::FenceCondition::Good,
                   core::Fence{{6, 4}, core::EdgeDirection::North, core::FenceCondition::Good, true});
    Worker& w = hire(Role::Zookeeper, {6, 2});
    w.assign_zone(1);
    tasks.add_task(test::feed_job({6, 6}, 1));

    run_until(20.0);

    EXPECT_GT(world.food_at({6, 6}), 0.0);
    EXPECT_EQ(writer.count("job_completed"), 1U);
}

TEST_F(WorkerTest, UnreachableTargetIsFailedAndAvoided) {
    // Target enclosed by water.
    for (core::GridPos p : {core::GridPos{9, 10}, core::GridPos{11, 10},
                            core::GridPos{10, 9}, core::GridPos{10, 11}}) {
        world.set_terrain(p, core::Terrain::Water);
    }
    Worker& w = hire(Role::Maintenance, {0, 0});
    JobId id = add_litter({10, 10});

    run_until(6.2);
    EXPECT_FALSE(w.current_job().has_value());
    EXPECT_TRUE(w.is_unreachable({10, 10}));
    EXPECT_EQ(writer.count("job_failed"), 1U);
    EXPECT_EQ(writer.count("job_requeued"), 1U);

    // Still queued, not re-claimed while the failure is remembered.
    run_until(35.0);
    EXPECT_FALSE(tasks.is_active(id));
    ASSERT_EQ(tasks.queued_jobs().size(), 1U);
    EXPECT_EQ(tasks.queued_jobs().front().fail_count(), 1U);

    // After the memory expires the worker tries again.
    run_until(40.0);
    EXPECT_EQ(writer.count("job_failed"), 2U);
}

TEST_F(WorkerTest, UnreachableJobDoesNotBlockOtherWork) {
    for (core::GridPos p : {core::GridPos{9, 10}, core::GridPos{11, 10},
                            core::GridPos{10, 9}, core::GridPos{10, 11}}) {
        world.set_terrain(p, core::Terrain::Water);
    }
    Worker& w = hire(Role::Maintenance, {0, 0});
    tasks.add_task(test::litter_job({10, 10}, Priority::URGENT));
    JobId reachable = add_litter({2, 0});

    // Fail at 6.1 s, retry on the very next tick.
    run_until(6.2);
    ASSERT_TRUE(w.current_job().has_value());
    EXPECT_EQ(w.current_job()->id(), reachable);
}

TEST_F(WorkerTest, StuckWalkerGivesUp) {
    GridPathService slow(engine, world, core::duration_from_seconds(100.0));
    Worker& w = hire(Role::Maintenance, {0, 0}, slow);
    JobId id = add_litter({5, 0});

    run_until(35.9);
    EXPECT_EQ(w.state(), WorkerState::Walking);

    run_until(36.1);
    EXPECT_NE(w.state(), WorkerState::Walking);
    EXPECT_FALSE(tasks.is_active(id));
    EXPECT_EQ(tasks.queued_jobs().front().fail_count(), 1U);
}

TEST_F(WorkerTest, LongWalkIsNotMistakenForStuck) {
    core::World corridor(320, 3);
    GridPathService corridor_paths(engine, corridor);
    WorldJobEffects corridor_effects(corridor);
    WorkerConfig config = WorkerConfig::for_role(Role::Maintenance);
    config.wander_interval = core::duration_from_seconds(1e6);
    worker = std::make_unique<Worker>(1, Role::Maintenance, core::GridPos{0, 0},
                                      WorkerContext{engine, tasks, corridor_paths, corridor_effects},
                                      config);
    engine.add_tick_handler([this](core::Duration dt) { worker->update(dt); });

    corridor.add_litter({300, 0});
    JobId id = tasks.add_task(test::litter_job({300, 0}));

    // Claim at 6 s, 300 tiles at 2.5 tiles/s, then 5 s of work
    run_until(140.0);

    EXPECT_EQ(writer.count("worker_gave_up"), 0U);
    EXPECT_EQ(writer.count("job_failed"), 0U);
    EXPECT_FALSE(tasks.is_active(id));
    EXPECT_TRUE(tasks.queued_jobs().empty());
    EXPECT_TRUE(corridor.litter().empty());
    EXPECT_EQ(worker->position(), (core::GridPos{300, 0}));
}

TEST_F(WorkerTest, VanishedJobIsAbandonedWithoutFailure) {
    world.add_zone(1, "pen", {10, 10}, {14, 14}, core::FenceCondition::Good,
                   core::Fence{{12, 10}, core::EdgeDirection::North, core::FenceCondition::Good, true});
    Worker& w = hire(Role::Zookeeper, {0, 0});
    w.assign_zone(1);
    JobId id = tasks.add_task(test::feed_job({12, 12}, 1));

    run_until(8.0);
    ASSERT_TRUE(w.current_job().has_value());

    tasks.remove_zone(1);
    run_until(8.1);

    EXPECT_FALSE(w.current_job().has_value());
    EXPECT_EQ(w.state(), WorkerState::Idle);
    EXPECT_EQ(writer.count("job_abandoned"), 1U);
    EXPECT_EQ(writer.count("job_failed"), 0U);
    EXPECT_EQ(tasks.fail_task(id), FailOutcome::NotActive);
}

TEST_F(WorkerTest, LatePathResultIsIgnored) {
    GridPathService slow(engine, world, core::duration_from_seconds(1.0));
    Worker& w = hire(Role::Maintenance, {0, 0}, slow);
    JobId id = add_litter({5, 0});

    run_until(6.0);
    ASSERT_TRUE(w.current_job().has_value());
    tasks.cancel_task(id);

    run_until(8.0);
    EXPECT_FALSE(w.current_job().has_value());
    EXPECT_EQ(w.state(), WorkerState::Idle);
    EXPECT_EQ(w.position(), (core::GridPos{0, 0}));
    EXPECT_EQ(writer.count("job_abandoned"), 1U);
}

TEST_F(WorkerTest, IdleWorkerWandersAndKeepsPolling) {
    Worker& w = hire(Role::Maintenance, {10, 10}, paths, true);

    run_until(3.0);
    EXPECT_EQ(w.state(), WorkerState::Wandering);

    run_until(5.0);
    EXPECT_NE(w.position(), (core::GridPos{10, 10}));

    JobId id = add_litter({19, 0});
    run_until(12.1);
    EXPECT_TRUE(tasks.is_active(id));
}
