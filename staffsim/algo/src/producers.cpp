#include <staffsim/algo/producers.hpp>

#include <algorithm>
#include <iterator>
#include <vector>

namespace staffsim::algo {

FeedingNeedDetector::FeedingNeedDetector(const core::World& world, TaskManager& tasks,
                                         FeedingPolicy policy, uint32_t seed)
    : world_(world)
    , tasks_(tasks)
    , policy_(policy)
    , rng_(seed) {}

std::size_t FeedingNeedDetector::scan() {
    std::size_t added = 0;
    for (ZoneId id : world_.zone_ids()) {
        const core::Zone* zone = world_.find_zone(id);
        auto animals = world_.animals_in_zone(id);
        if (zone == nullptr || animals.empty()) {
            continue;
        }

        std::vector<const core::Animal*> hungry;
        std::copy_if(animals.begin(), animals.end(), std::back_inserter(hungry),
                     [&](const core::Animal* a) { return a->hunger < policy_.hungry_below; });
        if (hungry.empty()) {
            continue;
        }
        if (world_.food_in_zone(id) >= policy_.food_per_animal * static_cast<double>(animals.size())) {
            continue;
        }
        if (tasks_.has_task_for(JobKind::FeedAnimals, id)) {
            continue;
        }

        auto spot = feeding_spot(*zone);
        if (!spot) {
            continue;
        }

        const core::Animal* hungriest = *std::min_element(
            hungry.begin(), hungry.end(),
            [](const core::Animal* a, const core::Animal* b) { return a->hunger < b->hunger; });

        int priority = Priority::LOW;
        if (hungriest->hunger < policy_.urgent_below) {
            priority = Priority::URGENT;
        } else if (hungriest->hunger < policy_.normal_below) {
            priority = Priority::NORMAL;
        }

        tasks_.add_task(JobInput{
            priority, *spot, id,
            FeedAnimalsPayload{hungry.front()->preferred_food, hungriest->id},
            policy_.max_retries});
        ++added;
    }
    return added;
}

std::optional<core::GridPos> FeedingNeedDetector::feeding_spot(const core::Zone& zone) {
    std::vector<core::GridPos> free_tiles;
    for (int32_t y = zone.min.y; y <= zone.max.y; ++y) {
        for (int32_t x = zone.min.x; x <= zone.max.x; ++x) {
            core::GridPos pos{x, y};
            if (world_.is_walkable(pos) && !world_.has_path(pos) && world_.food_at(pos) <= 0.0) {
                free_tiles.push_back(pos);
            }
        }
    }
    if (free_tiles.empty()) {
        return std::nullopt;
    }
    std::uniform_int_distribution<std::size_t> pick(0, free_tiles.size() - 1);
    return free_tiles[pick(rng_)];
}

FenceConditionDetector::FenceConditionDetector(const core::World& world, TaskManager& tasks,
                                               uint32_t max_retries)
    : world_(world)
    , tasks_(tasks)
    , max_retries_(max_retries) {}

std::size_t FenceConditionDetector::scan() {
    std::size_t added = 0;
    for (const core::Fence& fence : world_.fences()) {
        int priority = Priority::LOW;
        switch (fence.condition) {
            case core::FenceCondition::Good:        continue;
            case core::FenceCondition::Failed:      priority = Priority::URGENT; break;
            case core::FenceCondition::Damaged:     priority = Priority::NORMAL; break;
            case core::FenceCondition::LightDamage: priority = Priority::LOW; break;
        }

        if (tasks_.has_task_for(JobKind::RepairFence, std::nullopt,
                                RepairFenceFilter{fence.tile, fence.edge})) {
            continue;
        }
        auto spot = work_spot(fence);
        if (!spot) {
            continue;
        }

        tasks_.add_task(JobInput{
            priority, *spot, world_.zone_at(*spot),
            RepairFencePayload{fence.tile, fence.edge}, max_retries_});
        ++added;
    }
    return added;
}

std::optional<core::GridPos> FenceConditionDetector::work_spot(const core::Fence& fence) const {
    core::GridPos inside = fence.tile;
    core::GridPos across = core::neighbor(fence.tile, fence.edge);

    std::optional<core::GridPos> fallback;
    for (core::GridPos pos : {inside, across}) {
        if (!world_.is_walkable(pos)) {
            continue;
        }
        if (world_.has_path(pos)) {
            return pos;
        }
        if (!fallback) {
            fallback = pos;
        }
    }
    return fallback;
}

SanitationDetector::SanitationDetector(const core::World& world, TaskManager& tasks,
                                       SanitationPolicy policy)
    : world_(world)
    , tasks_(tasks)
    , policy_(policy) {}

std::size_t SanitationDetector::scan() {
    std::size_t added = 0;

    for (core::GridPos tile : world_.waste()) {
        auto zone = world_.zone_at(tile);
        if (!zone) {
            continue;
        }
        if (tasks_.has_task_for(JobKind::CleanWaste, std::nullopt, CleanWasteFilter{tile})) {
            continue;
        }
        tasks_.add_task(JobInput{Priority::NORMAL, tile, zone, CleanWastePayload{tile},
                                 policy_.max_retries});
        ++added;
    }

    for (core::GridPos tile : world_.litter()) {
        if (!world_.has_path(tile)) {
            continue;
        }
        if (tasks_.has_task_for(JobKind::ClearLitter, std::nullopt, ClearLitterFilter{tile})) {
            continue;
        }
        tasks_.add_task(JobInput{Priority::LOW, tile, std::nullopt, ClearLitterPayload{tile},
                                 policy_.max_retries});
        ++added;
    }

    for (const core::Bin* bin : world_.bins()) {
        if (bin->capacity <= 0.0 || bin->fill < policy_.bin_threshold * bin->capacity) {
            continue;
        }
        if (tasks_.has_task_for(JobKind::EmptyBin, std::nullopt, EmptyBinFilter{bin->id})) {
            continue;
        }
        int priority = bin->fill >= bin->capacity ? Priority::URGENT : Priority::NORMAL;
        tasks_.add_task(JobInput{priority, bin->tile, std::nullopt, EmptyBinPayload{bin->id},
                                 policy_.max_retries});
        ++added;
    }
    return added;
}

} // namespace staffsim::algo
