#pragma once

#include <staffsim/algo/job.hpp>
#include <staffsim/algo/job_effects.hpp>
#include <staffsim/algo/path_service.hpp>
#include <staffsim/algo/task_manager.hpp>

#include <staffsim/core/engine.hpp>
#include <staffsim/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <set>
#include <string_view>
#include <vector>

namespace staffsim::algo {

/// @brief Lifecycle state of a worker.
/// @ingroup algo_workers
enum class WorkerState { Idle, Walking, Working, Wandering };

[[nodiscard]] std::string_view to_string(WorkerState state) noexcept;

/// @brief Timing and movement parameters of a worker.
/// @ingroup algo_workers
struct WorkerConfig {
    core::Duration poll_interval{core::duration_from_seconds(8.0)};
    core::Duration wander_interval{core::duration_from_seconds(3.0)};
    core::Duration stuck_timeout{core::duration_from_seconds(30.0)};
    core::Duration unreachable_ttl{core::duration_from_seconds(30.0)};
    double speed{2.5};              ///< Tiles per second.
    int32_t wander_radius{5};
    PathConstraints constraints{};

    /// @brief Defaults for a role: zookeepers poll every 8 s, maintenance every 6 s.
    [[nodiscard]] static WorkerConfig for_role(Role role);
};

/// @brief Collaborators every worker talks to.
///
/// All references are non-owning; the simulation that owns the
/// collaborators outlives its workers.
///
/// @ingroup algo_workers
struct WorkerContext {
    core::Engine& engine;
    TaskManager& tasks;
    PathService& paths;
    JobEffects& effects;
};

/// @brief A staff member driven by a per-tick state machine.
///
/// - **Idle**: polls the task manager at the configured interval. After a
///   wander interval without work it starts wandering.
/// - **Walking**: waits for its path request, then follows the path. A
///   failed path, or no new cell reached within the stuck timeout, gives the
///   job back with TaskManager::fail_task and remembers the target as
///   unreachable.
/// - **Working**: stays at the target for the kind's work duration, applies
///   the job's effect and completes it.
/// - **Wandering**: strolls to a random nearby tile, still polling for work.
///
/// At the top of every update the worker checks that its job is still
/// active under its own id. A job that vanished (zone removed, cancelled)
/// is dropped without calling fail_task.
///
/// @see TaskManager, PathService, JobEffects
/// @ingroup algo_workers
class Worker {
public:
    Worker(WorkerId id, Role role, core::GridPos position, WorkerContext context,
           WorkerConfig config);
    Worker(WorkerId id, Role role, core::GridPos position, WorkerContext context);

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;
    Worker(Worker&&) = delete;
    Worker& operator=(Worker&&) = delete;

    [[nodiscard]] WorkerId id() const noexcept { return id_; }
    [[nodiscard]] Role role() const noexcept { return role_; }
    [[nodiscard]] WorkerState state() const noexcept { return state_; }
    [[nodiscard]] core::GridPos position() const noexcept { return position_; }
    [[nodiscard]] const std::optional<Job>& current_job() const noexcept { return job_; }
    [[nodiscard]] const WorkerConfig& config() const noexcept { return config_; }

    /// @name Assignment
    /// @{
    void assign_zone(ZoneId zone) { zones_.insert(zone); }
    void unassign_zone(ZoneId zone) { zones_.erase(zone); }
    [[nodiscard]] const std::set<ZoneId>& assigned_zones() const noexcept { return zones_; }

    /// @brief Enable or disable a job kind.
    /// @return False if @p kind belongs to another role (nothing changes).
    bool set_kind_enabled(JobKind kind, bool enabled);
    [[nodiscard]] const std::set<JobKind>& enabled_kinds() const noexcept { return kinds_; }
    /// @}

    /// @brief True if @p target failed within the unreachable TTL.
    [[nodiscard]] bool is_unreachable(core::GridPos target) const;

    /// @brief Advance the state machine by one tick of length @p dt.
    void update(core::Duration dt);

private:
    void check_current_job();
    void purge_unreachable();

    void update_idle(core::Duration dt);
    void update_walking(core::Duration dt);
    void update_working(core::Duration dt);
    void update_wandering(core::Duration dt);

    bool poll_for_work(core::Duration dt);
    bool try_claim();
    void begin_job(Job job);
    void start_wandering();
    void give_up_job(std::string_view reason);
    void clear_job();

    /// @brief Pick up a resolved path. False while the request is pending.
    bool take_path();
    /// @brief Move along the current path; true once the last cell is reached.
    bool advance_along_path(core::Duration dt);

    void set_state(WorkerState state);

    WorkerId id_;
    Role role_;
    core::GridPos position_;
    WorkerContext ctx_;
    WorkerConfig config_;

    WorkerState state_{WorkerState::Idle};
    std::set<ZoneId> zones_;
    std::set<JobKind> kinds_;

    std::optional<Job> job_;
    std::shared_ptr<const PathQuery> path_query_;
    std::vector<core::GridPos> path_;
    std::size_t path_index_{0};
    double move_progress_{0.0};

    core::Duration poll_timer_{core::Duration::zero()};
    core::Duration wander_timer_{core::Duration::zero()};
    core::Duration state_timer_{core::Duration::zero()};

    std::map<core::GridPos, core::TimePoint> unreachable_;
    std::mt19937 rng_;
};

} // namespace staffsim::algo
