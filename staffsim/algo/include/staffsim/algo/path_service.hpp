#pragma once

#include <staffsim/core/engine.hpp>
#include <staffsim/core/types.hpp>
#include <staffsim/core/world.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace staffsim::algo {

/// @brief Movement rules for one path request.
/// @ingroup algo_paths
struct PathConstraints {
    bool may_use_paths{true};   ///< Path (visitor walkway) tiles are allowed.
    bool may_pass_gates{true};  ///< Gated fence edges can be crossed.
};

/// @brief Resolution state of a path request.
/// @ingroup algo_paths
enum class PathStatus { Pending, Found, Failed };

/// @brief Handle for an asynchronous path request.
///
/// Shared between the service and the requester. The requester polls
/// status() on its tick; dropping the handle is how it loses interest, in
/// which case the result is still written but nobody reads it.
///
/// @ingroup algo_paths
class PathQuery {
public:
    PathQuery(core::GridPos from, core::GridPos to) noexcept
        : from_(from), to_(to) {}

    [[nodiscard]] core::GridPos from() const noexcept { return from_; }
    [[nodiscard]] core::GridPos to() const noexcept { return to_; }
    [[nodiscard]] PathStatus status() const noexcept { return status_; }

    /// @brief Cells to step through, excluding the start and ending on the goal.
    [[nodiscard]] const std::vector<core::GridPos>& cells() const noexcept { return cells_; }

    void resolve(std::vector<core::GridPos> cells);
    void fail() noexcept { status_ = PathStatus::Failed; }

private:
    core::GridPos from_;
    core::GridPos to_;
    PathStatus status_{PathStatus::Pending};
    std::vector<core::GridPos> cells_;
};

/// @brief Source of routes for workers.
/// @ingroup algo_paths
class PathService {
public:
    virtual ~PathService() = default;

    /// @brief Start a path request; the result arrives later through the handle.
    [[nodiscard]] virtual std::shared_ptr<const PathQuery>
    request(core::GridPos from, core::GridPos to, PathConstraints constraints) = 0;

    /// @brief Walkable tiles within @p radius (Chebyshev) of @p from, excluding it.
    ///
    /// Path tiles are returned alone when any are in range.
    [[nodiscard]] virtual std::vector<core::GridPos>
    nearby_walkable(core::GridPos from, int32_t radius) const = 0;
};

/// @brief Breadth-first path finder over a core::World.
///
/// Requests are answered by an engine timer @p latency after they are
/// made, so a worker always spends at least one tick in the pending state.
/// The service must outlive the engine run it schedules timers on.
///
/// @ingroup algo_paths
class GridPathService : public PathService {
public:
    GridPathService(core::Engine& engine, const core::World& world,
                    core::Duration latency = core::Duration::zero());

    GridPathService(const GridPathService&) = delete;
    GridPathService& operator=(const GridPathService&) = delete;

    [[nodiscard]] std::shared_ptr<const PathQuery>
    request(core::GridPos from, core::GridPos to, PathConstraints constraints) override;

    [[nodiscard]] std::vector<core::GridPos>
    nearby_walkable(core::GridPos from, int32_t radius) const override;

    /// @brief Synchronous search used by the timer callback.
    /// @return Cells from the tile after @p from up to @p to, or std::nullopt.
    [[nodiscard]] std::optional<std::vector<core::GridPos>>
    find_path(core::GridPos from, core::GridPos to, PathConstraints constraints) const;

    [[nodiscard]] core::Duration latency() const noexcept { return latency_; }

private:
    [[nodiscard]] bool can_enter(core::GridPos pos, PathConstraints constraints) const;

    core::Engine& engine_;
    const core::World& world_;
    core::Duration latency_;
};

} // namespace staffsim::algo
