#pragma once

#include <staffsim/algo/job.hpp>

#include <array>
#include <cstddef>
#include <deque>
#include <map>
#include <optional>
#include <vector>

namespace staffsim::algo {

/// @brief FIFO job queues keyed by zone and role.
/// @ingroup algo_tasks
///
/// Holds one queue per role for every registered zone plus one global queue
/// per role for zone-independent jobs. Zone queues are created lazily the
/// first time a job for that zone arrives, so producers never need to
/// register zones ahead of time.
///
/// Insertion order within a queue is preserved; claim ordering is computed
/// by TaskManager, not here.
///
/// @see TaskManager
class ZoneQueueStore {
public:
    using Queue = std::deque<Job>;

    /// @brief One FIFO queue per role.
    struct RoleQueues {
        std::array<Queue, ROLE_COUNT> by_role;

        Queue& operator[](Role role) noexcept { return by_role[static_cast<std::size_t>(role)]; }
        const Queue& operator[](Role role) const noexcept {
            return by_role[static_cast<std::size_t>(role)];
        }
        [[nodiscard]] std::size_t size() const noexcept;
    };

    /// @brief Ensure queues exist for @p zone.
    /// @return True if the zone was not known before.
    bool register_zone(ZoneId zone);

    [[nodiscard]] bool has_zone(ZoneId zone) const { return zones_.contains(zone); }

    /// @brief Queue for @p role in @p zone (global if std::nullopt), created on demand.
    Queue& queue_for(Role role, std::optional<ZoneId> zone);

    /// @brief Queue for @p role in @p zone, or nullptr if the zone has none.
    [[nodiscard]] const Queue* find_queue(Role role, std::optional<ZoneId> zone) const;
    [[nodiscard]] Queue* find_queue(Role role, std::optional<ZoneId> zone);

    /// @brief Delete every queue of @p zone.
    /// @return Number of queued jobs dropped with it (0 if the zone was unknown).
    std::size_t drop_zone(ZoneId zone);

    /// @brief Remove the job with @p id from whichever queue holds it.
    /// @return The removed job, or std::nullopt if no queue holds it.
    std::optional<Job> remove(JobId id);

    /// @brief Call @p func(const Job&) for every queued job, zones first.
    template<typename F>
    void for_each_job(F&& func) const {
        for (const auto& [zone, queues] : zones_) {
            for (const Queue& queue : queues.by_role) {
                for (const Job& job : queue) {
                    func(job);
                }
            }
        }
        for (const Queue& queue : global_.by_role) {
            for (const Job& job : queue) {
                func(job);
            }
        }
    }

    [[nodiscard]] std::size_t queued_count() const noexcept;
    [[nodiscard]] std::vector<ZoneId> zone_ids() const;
    [[nodiscard]] const RoleQueues& global_queues() const noexcept { return global_; }

private:
    std::map<ZoneId, RoleQueues> zones_;
    RoleQueues global_;
};

} // namespace staffsim::algo
