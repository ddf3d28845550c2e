#pragma once

#include <staffsim/algo/error.hpp>
#include <staffsim/algo/job.hpp>
#include <staffsim/algo/queue_store.hpp>

#include <staffsim/core/engine.hpp>
#include <staffsim/core/types.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <vector>

namespace staffsim::algo {

/// @brief What a worker sends when it asks for work.
/// @ingroup algo_tasks
struct ClaimRequest {
    WorkerId worker{0};
    Role role{Role::Zookeeper};
    std::set<ZoneId> zones;             ///< Zones the worker is assigned to.
    std::set<JobKind> enabled_kinds;
    core::GridPos position;
    std::set<core::GridPos> avoid_targets;  ///< Targets recently found unreachable.
};

/// @brief A claimed job together with its owner.
/// @ingroup algo_tasks
struct ActiveAssignment {
    Job job;
    WorkerId worker;
    core::TimePoint claimed_at;
};

/// @brief Queue and active-set sizes.
/// @ingroup algo_tasks
struct TaskStats {
    std::size_t queued{0};
    std::size_t active{0};
    std::size_t zones{0};
};

/// @brief Central job scheduler for staff workers.
///
/// Producers insert jobs with add_task(); workers take them with
/// claim_task() and report back with complete_task() or fail_task().
/// Jobs are queued per (zone, role), plus one global queue per role for
/// zone-independent work. A job is in exactly one place at a time: one
/// queue, or the active map under exactly one worker.
///
/// Claim order among the eligible candidates is priority first, then
/// Manhattan distance from the worker, then creation time, then id. The
/// caller's view is atomic: a job handed out by claim_task() cannot be
/// handed out again until it is failed back into its queue.
///
/// The manager reads simulated time from the engine and writes trace
/// records through it. It is not internally synchronized; all calls are
/// made from the engine's tick.
///
/// @par Example
/// @code
/// core::Engine engine;
/// algo::TaskManager tasks(engine);
/// tasks.add_task({.priority = Priority::URGENT, .target = {4, 2}, .zone = 1,
///                 .payload = FeedAnimalsPayload{core::FoodType::Meat, 1}});
///
/// ClaimRequest request{.worker = 7, .role = Role::Zookeeper, .zones = {1},
///                      .enabled_kinds = {JobKind::FeedAnimals}};
/// if (auto job = tasks.claim_task(request)) {
///     tasks.complete_task(job->id());
/// }
/// @endcode
///
/// @see Worker, JobProducer, ZoneQueueStore
/// @ingroup algo_tasks
class TaskManager {
public:
    explicit TaskManager(core::Engine& engine);

    TaskManager(const TaskManager&) = delete;
    TaskManager& operator=(const TaskManager&) = delete;
    TaskManager(TaskManager&&) = delete;
    TaskManager& operator=(TaskManager&&) = delete;

    /// @name Producer interface
    /// @{

    /// @brief Queue a new job.
    ///
    /// The job lands at the tail of the queue for (role of its kind, zone).
    /// There is no duplicate check; producers call has_task_for() first.
    ///
    /// @return The id assigned to the job.
    /// @throws InvalidJobError if the priority is out of range or max_retries is zero.
    JobId add_task(JobInput input);

    /// @brief True if a queued or active job matches.
    /// @param kind   Required job kind.
    /// @param zone   When set, the job's zone must equal it.
    /// @param filter When set, every set field must equal the payload's field.
    [[nodiscard]] bool has_task_for(JobKind kind,
                                    std::optional<ZoneId> zone = std::nullopt,
                                    const std::optional<PayloadFilter>& filter = std::nullopt) const;
    /// @}

    /// @name Worker interface
    /// @{

    /// @brief Take the best eligible job for a worker.
    ///
    /// Candidates come from the request role's queue of every assigned zone
    /// plus the global queue of that role, restricted to enabled kinds and
    /// to targets outside the avoid set.
    ///
    /// @return Copy of the claimed job, or std::nullopt if nothing is eligible.
    [[nodiscard]] std::optional<Job> claim_task(const ClaimRequest& request);

    /// @brief Mark an active job done. Unknown ids are ignored.
    void complete_task(JobId id);

    /// @brief Give an active job back after a failed attempt.
    ///
    /// Increments the failure count, then requeues the job at the tail of
    /// the queue it came from or discards it once max_retries is reached.
    FailOutcome fail_task(JobId id);
    /// @}

    /// @brief Drop a job wherever it is, queued or active.
    /// @return False if no such job exists.
    bool cancel_task(JobId id);

    /// @name Zone lifecycle
    /// @{

    /// @brief Create the queues of a zone. Idempotent.
    void register_zone(ZoneId zone);

    /// @brief Drop the zone's queues and evict its active jobs, whoever owns them.
    ///
    /// Workers holding an evicted job notice on their next update that the
    /// job is no longer theirs.
    void remove_zone(ZoneId zone);
    /// @}

    /// @name Inspection
    /// @{
    [[nodiscard]] bool is_active(JobId id) const { return active_.contains(id); }
    [[nodiscard]] std::optional<WorkerId> active_owner(JobId id) const;
    [[nodiscard]] const Job* active_job_for_worker(WorkerId worker) const;
    [[nodiscard]] TaskStats stats() const noexcept;
    /// @brief Queued and active jobs whose zone is @p zone.
    [[nodiscard]] std::vector<Job> jobs_for_zone(ZoneId zone) const;
    [[nodiscard]] std::vector<Job> queued_jobs() const;
    [[nodiscard]] std::vector<ActiveAssignment> active_jobs() const;
    /// @}

    [[nodiscard]] core::Engine& engine() noexcept { return engine_; }

private:
    void trace_job(std::string_view type, const Job& job);

    core::Engine& engine_;
    ZoneQueueStore queues_;
    std::map<JobId, ActiveAssignment> active_;
    JobId next_id_{1};
};

} // namespace staffsim::algo
