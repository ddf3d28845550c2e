#pragma once

#include <staffsim/algo/job.hpp>

#include <staffsim/core/types.hpp>
#include <staffsim/core/world.hpp>

namespace staffsim::algo {

/// @brief World changes applied when a worker finishes a job.
///
/// One handler per payload alternative, each receiving exactly the fields
/// its kind carries. Handlers must tolerate targets that changed since the
/// job was created (fence demolished, bin removed, waste already gone).
///
/// @see apply_job_effect
/// @ingroup algo_effects
class JobEffects {
public:
    virtual ~JobEffects() = default;

    /// @param at Tile the worker stands on, where the food is placed.
    virtual void feed_animals(const FeedAnimalsPayload& payload, core::GridPos at) = 0;
    virtual void clean_waste(const CleanWastePayload& payload) = 0;
    virtual void repair_fence(const RepairFencePayload& payload) = 0;
    virtual void clear_litter(const ClearLitterPayload& payload) = 0;
    virtual void empty_bin(const EmptyBinPayload& payload) = 0;
};

/// @brief Dispatch the job's payload to the matching handler.
void apply_job_effect(JobEffects& effects, const Job& job, core::GridPos at);

/// @brief JobEffects that mutate a core::World.
/// @ingroup algo_effects
class WorldJobEffects : public JobEffects {
public:
    /// @param food_amount Food units placed per feeding.
    explicit WorldJobEffects(core::World& world, double food_amount = 500.0);

    void feed_animals(const FeedAnimalsPayload& payload, core::GridPos at) override;
    void clean_waste(const CleanWastePayload& payload) override;
    void repair_fence(const RepairFencePayload& payload) override;
    void clear_litter(const ClearLitterPayload& payload) override;
    void empty_bin(const EmptyBinPayload& payload) override;

private:
    core::World& world_;
    double food_amount_;
};

} // namespace staffsim::algo
