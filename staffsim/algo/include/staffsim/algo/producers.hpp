#pragma once

#include <staffsim/algo/job.hpp>
#include <staffsim/algo/task_manager.hpp>

#include <staffsim/core/world.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string_view>

namespace staffsim::algo {

/// @brief Policy that turns observed world conditions into jobs.
///
/// A producer reads the world, skips conditions that already have a
/// queued or active job (TaskManager::has_task_for), and inserts the rest
/// with TaskManager::add_task.
///
/// @ingroup algo_producers
class JobProducer {
public:
    virtual ~JobProducer() = default;

    /// @brief Scan the world once.
    /// @return Number of jobs added.
    virtual std::size_t scan() = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/// @brief Thresholds of the feeding detector.
/// @ingroup algo_producers
struct FeedingPolicy {
    double hungry_below{50.0};      ///< Animals below this hunger need food.
    double food_per_animal{100.0};  ///< Zone counts as stocked at this much food per animal.
    double urgent_below{15.0};
    double normal_below{30.0};
    uint32_t max_retries{3};
};

/// @brief Queues feed_animals jobs for zones with hungry animals.
///
/// One job per zone at a time. Priority follows the hungriest animal and
/// the food type follows the first hungry animal's preference. The target
/// is a random walkable, non-path tile in the zone without food on it.
///
/// @ingroup algo_producers
class FeedingNeedDetector : public JobProducer {
public:
    FeedingNeedDetector(const core::World& world, TaskManager& tasks,
                        FeedingPolicy policy = {}, uint32_t seed = 1);

    std::size_t scan() override;
    [[nodiscard]] std::string_view name() const noexcept override { return "feeding"; }

private:
    [[nodiscard]] std::optional<core::GridPos> feeding_spot(const core::Zone& zone);

    const core::World& world_;
    TaskManager& tasks_;
    FeedingPolicy policy_;
    std::mt19937 rng_;
};

/// @brief Queues repair_fence jobs for fences in poor condition.
///
/// Failed fences are urgent, damaged ones normal, lightly damaged ones low.
///
/// @ingroup algo_producers
class FenceConditionDetector : public JobProducer {
public:
    FenceConditionDetector(const core::World& world, TaskManager& tasks,
                           uint32_t max_retries = 3);

    std::size_t scan() override;
    [[nodiscard]] std::string_view name() const noexcept override { return "fences"; }

private:
    [[nodiscard]] std::optional<core::GridPos> work_spot(const core::Fence& fence) const;

    const core::World& world_;
    TaskManager& tasks_;
    uint32_t max_retries_;
};

/// @brief Thresholds of the sanitation detector.
/// @ingroup algo_producers
struct SanitationPolicy {
    double bin_threshold{0.75};     ///< Fill fraction at which a bin needs emptying.
    uint32_t max_retries{3};
};

/// @brief Queues clean_waste, clear_litter and empty_bin jobs.
///
/// Waste inside a zone is zookeeper work for that zone; litter and bins
/// are zone-independent maintenance work.
///
/// @ingroup algo_producers
class SanitationDetector : public JobProducer {
public:
    SanitationDetector(const core::World& world, TaskManager& tasks,
                       SanitationPolicy policy = {});

    std::size_t scan() override;
    [[nodiscard]] std::string_view name() const noexcept override { return "sanitation"; }

private:
    const core::World& world_;
    TaskManager& tasks_;
    SanitationPolicy policy_;
};

} // namespace staffsim::algo
