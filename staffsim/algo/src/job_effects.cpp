#include <staffsim/algo/job_effects.hpp>

#include <type_traits>

namespace staffsim::algo {

void apply_job_effect(JobEffects& effects, const Job& job, core::GridPos at) {
    std::visit([&](const auto& payload) {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, FeedAnimalsPayload>) {
            effects.feed_animals(payload, at);
        } else if constexpr (std::is_same_v<T, CleanWastePayload>) {
            effects.clean_waste(payload);
        } else if constexpr (std::is_same_v<T, RepairFencePayload>) {
            effects.repair_fence(payload);
        } else if constexpr (std::is_same_v<T, ClearLitterPayload>) {
            effects.clear_litter(payload);
        } else if constexpr (std::is_same_v<T, EmptyBinPayload>) {
            effects.empty_bin(payload);
        }
    }, job.payload());
}

WorldJobEffects::WorldJobEffects(core::World& world, double food_amount)
    : world_(world)
    , food_amount_(food_amount) {}

void WorldJobEffects::feed_animals(const FeedAnimalsPayload& payload, core::GridPos at) {
    world_.add_food(at, payload.food, food_amount_);
}

void WorldJobEffects::clean_waste(const CleanWastePayload& payload) {
    world_.clear_waste(payload.tile);
}

void WorldJobEffects::repair_fence(const RepairFencePayload& payload) {
    if (world_.fence(payload.tile, payload.edge) == nullptr) {
        return;
    }
    world_.set_fence_condition(payload.tile, payload.edge, core::FenceCondition::Good);
}

void WorldJobEffects::clear_litter(const ClearLitterPayload& payload) {
    world_.clear_litter(payload.tile);
}

void WorldJobEffects::empty_bin(const EmptyBinPayload& payload) {
    for (const core::Bin* bin : world_.bins()) {
        if (bin->id == payload.bin_id) {
            world_.empty_bin(payload.bin_id);
            return;
        }
    }
}

} // namespace staffsim::algo
