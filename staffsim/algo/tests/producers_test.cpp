#include <staffsim/algo/producers.hpp>
#include <staffsim/algo/task_manager.hpp>

#include <staffsim/core/engine.hpp>
#include <staffsim/core/world.hpp>

#include <gtest/gtest.h>

using namespace staffsim;
using namespace staffsim::algo;

class ProducersTest : public ::testing::Test {
protected:
    core::Engine engine;
    core::World world{20, 20};
    TaskManager tasks{engine};

    const Job& only_job() {
        jobs_ = tasks.queued_jobs();
        EXPECT_EQ(jobs_.size(), 1U);
        return jobs_.front();
    }

private:
    std::vector<Job> jobs_;
};

// ============================================================================
// FeedingNeedDetector
// ============================================================================

TEST_F(ProducersTest, FeedingPriorityFollowsHungriestAnimal) {
    world.add_zone(1, "a", {1, 1}, {4, 4});
    world.add_zone(2, "b", {6, 6}, {9, 9});
    world.add_zone(3, "c", {11, 11}, {14, 14});
    world.add_animal(1, core::FoodType::Meat, 40.0);
    world.add_animal(2, core::FoodType::Hay, 20.0);
    world.add_animal(3, core::FoodType::Fruit, 10.0);

    FeedingNeedDetector detector(world, tasks);
    EXPECT_EQ(detector.scan(), 3U);

    for (const Job& job : tasks.queued_jobs()) {
        ASSERT_TRUE(job.zone().has_value());
        switch (*job.zone()) {
            case 1: EXPECT_EQ(job.priority(), Priority::LOW); break;
            case 2: EXPECT_EQ(job.priority(), Priority::NORMAL); break;
            case 3: EXPECT_EQ(job.priority(), Priority::URGENT); break;
            default: ADD_FAILURE() << "unexpected zone";
        }
    }
}

TEST_F(ProducersTest, FeedingTargetsFreeTileInsideZone) {
    world.add_zone(1, "a", {2, 2}, {3, 3});
    world.set_path({2, 2}, true);
    world.set_terrain({3, 2}, core::Terrain::Water);
    world.add_food({2, 3}, core::FoodType::Meat, 10.0);
    uint64_t animal = world.add_animal(1, core::FoodType::Vegetables, 5.0);

    FeedingNeedDetector detector(world, tasks);
    detector.scan();

    const Job& job = only_job();
    EXPECT_EQ(job.kind(), JobKind::FeedAnimals);
    EXPECT_EQ(job.target(), (core::GridPos{3, 3}));
    ASSERT_NE(job.payload_if<FeedAnimalsPayload>(), nullptr);
    EXPECT_EQ(job.payload_if<FeedAnimalsPayload>()->food, core::FoodType::Vegetables);
    EXPECT_EQ(job.payload_if<FeedAnimalsPayload>()->animal_id, animal);
}

TEST_F(ProducersTest, FeedingDeduplicatesPerZone) {
    world.add_zone(1, "a", {2, 2}, {5, 5});
    world.add_animal(1, core::FoodType::Meat, 10.0);
    world.add_animal(1, core::FoodType::Meat, 20.0);

    FeedingNeedDetector detector(world, tasks);
    EXPECT_EQ(detector.scan(), 1U);
    EXPECT_EQ(detector.scan(), 0U);
    EXPECT_EQ(tasks.stats().queued, 1U);
}

TEST_F(ProducersTest, FeedingSkipsStockedOrSatedZones) {
    world.add_zone(1, "stocked", {2, 2}, {5, 5});
    world.add_zone(2, "sated", {8, 8}, {10, 10});
    world.add_animal(1, core::FoodType::Meat, 10.0);
    world.add_animal(1, core::FoodType::Meat, 10.0);
    world.add_food({3, 3}, core::FoodType::Meat, 200.0);
    world.add_animal(2, core::FoodType::Hay, 90.0);

    FeedingNeedDetector detector(world, tasks);
    EXPECT_EQ(detector.scan(), 0U);
}

// ============================================================================
// FenceConditionDetector
// ============================================================================

TEST_F(ProducersTest, FencePriorityFollowsCondition) {
    world.set_fence({1, 1}, core::EdgeDirection::North, core::FenceCondition::Failed);
    world.set_fence({5, 1}, core::EdgeDirection::North, core::FenceCondition::Damaged);
    world.set_fence({9, 1}, core::EdgeDirection::North, core::FenceCondition::LightDamage);
    world.set_fence({13, 1}, core::EdgeDirection::North, core::FenceCondition::Good);

    FenceConditionDetector detector(world, tasks);
    EXPECT_EQ(detector.scan(), 3U);

    for (const Job& job : tasks.queued_jobs()) {
        const auto* payload = job.payload_if<RepairFencePayload>();
        ASSERT_NE(payload, nullptr);
        if (payload->tile == core::GridPos{1, 1}) {
            EXPECT_EQ(job.priority(), Priority::URGENT);
        } else if (payload->tile == core::GridPos{5, 1}) {
            EXPECT_EQ(job.priority(), Priority::NORMAL);
        } else {
            EXPECT_EQ(payload->tile, (core::GridPos{9, 1}));
            EXPECT_EQ(job.priority(), Priority::LOW);
        }
        EXPECT_FALSE(job.zone().has_value());
    }
}

TEST_F(ProducersTest, FenceDeduplicatesByEdge) {
    world.set_fence({1, 1}, core::EdgeDirection::East, core::FenceCondition::Damaged);
    world.set_fence({1, 1}, core::EdgeDirection::South, core::FenceCondition::Damaged);

    FenceConditionDetector detector(world, tasks);
    EXPECT_EQ(detector.scan(), 2U);
    EXPECT_EQ(detector.scan(), 0U);
}

TEST_F(ProducersTest, FenceJobsInsideZonesBelongToTheZone) {
    world.add_zone(4, "pen", {5, 5}, {8, 8});
    world.set_fence_condition({5, 5}, core::EdgeDirection::North, core::FenceCondition::Damaged);

    FenceConditionDetector detector(world, tasks);
    detector.scan();

    const Job& job = only_job();
    EXPECT_EQ(job.target(), (core::GridPos{5, 5}));
    EXPECT_EQ(job.zone(), ZoneId{4});
    EXPECT_EQ(job.role(), Role::Maintenance);
}

TEST_F(ProducersTest, FenceWorkSpotPrefersPathTiles) {
    world.add_zone(4, "pen", {5, 5}, {8, 8});
    world.set_path({5, 4}, true);
    world.set_fence_condition({5, 5}, core::EdgeDirection::North, core::FenceCondition::Failed);

    FenceConditionDetector detector(world, tasks);
    detector.scan();

    const Job& job = only_job();
    EXPECT_EQ(job.target(), (core::GridPos{5, 4}));
    EXPECT_FALSE(job.zone().has_value());
}

TEST_F(ProducersTest, FenceBetweenWaterTilesIsSkipped) {
    world.set_terrain({3, 3}, core::Terrain::Water);
    world.set_terrain({3, 2}, core::Terrain::Water);
    world.set_fence({3, 3}, core::EdgeDirection::North, core::FenceCondition::Failed);

    FenceConditionDetector detector(world, tasks);
    EXPECT_EQ(detector.scan(), 0U);
}

// ============================================================================
// SanitationDetector
// ============================================================================

TEST_F(ProducersTest, WasteInsideZonesOnly) {
    world.add_zone(2, "pen", {5, 5}, {8, 8});
    world.add_waste({6, 6});
    world.add_waste({15, 15});

    SanitationDetector detector(world, tasks);
    EXPECT_EQ(detector.scan(), 1U);

    const Job& job = only_job();
    EXPECT_EQ(job.kind(), JobKind::CleanWaste);
    EXPECT_EQ(job.zone(), ZoneId{2});
    EXPECT_EQ(job.target(), (core::GridPos{6, 6}));
    EXPECT_EQ(detector.scan(), 0U);
}

TEST_F(ProducersTest, LitterOnPathsOnly) {
    world.set_path({1, 1}, true);
    world.add_litter({1, 1});
    world.add_litter({2, 2});

    SanitationDetector detector(world, tasks);
    EXPECT_EQ(detector.scan(), 1U);

    const Job& job = only_job();
    EXPECT_EQ(job.kind(), JobKind::ClearLitter);
    EXPECT_EQ(job.priority(), Priority::LOW);
    EXPECT_FALSE(job.zone().has_value());
}

TEST_F(ProducersTest, BinsAboveThreshold) {
    world.add_bin({1, 1}, 100.0, 0.0, 50.0);
    uint64_t filling = world.add_bin({2, 1}, 100.0, 0.0, 80.0);
    uint64_t full = world.add_bin({3, 1}, 100.0, 0.0, 100.0);

    SanitationDetector detector(world, tasks);
    EXPECT_EQ(detector.scan(), 2U);
    EXPECT_EQ(detector.scan(), 0U);

    for (const Job& job : tasks.queued_jobs()) {
        const auto* payload = job.payload_if<EmptyBinPayload>();
        ASSERT_NE(payload, nullptr);
        EXPECT_EQ(job.priority(), payload->bin_id == full ? Priority::URGENT : Priority::NORMAL);
        EXPECT_TRUE(payload->bin_id == full || payload->bin_id == filling);
    }
}
