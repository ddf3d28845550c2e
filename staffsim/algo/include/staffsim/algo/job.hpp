#pragma once

#include <staffsim/core/types.hpp>
#include <staffsim/core/world.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace staffsim::algo {

using core::ZoneId;

/// @brief Unique, monotonically assigned job identifier (first id is 1).
using JobId = uint64_t;

/// @brief Identifier of a worker agent.
using WorkerId = uint64_t;

/// @brief Staff category; restricts which job kinds a worker may claim.
/// @ingroup algo_jobs
enum class Role { Zookeeper, Maintenance };

/// @brief Number of Role enumerators (queues are kept per role).
inline constexpr std::size_t ROLE_COUNT = 2;

/// @brief Closed set of job kinds.
///
/// The enumerator order matches the alternative order of JobPayload, so a
/// payload alone determines its kind.
///
/// @ingroup algo_jobs
enum class JobKind { FeedAnimals, CleanWaste, RepairFence, ClearLitter, EmptyBin };

/// @brief Job priorities; lower values are more urgent.
/// @ingroup algo_jobs
struct Priority {
    static constexpr int URGENT = 0;
    static constexpr int NORMAL = 1;
    static constexpr int LOW    = 2;
};

/// @name Payloads
/// One struct per job kind carrying exactly the fields its handler needs.
/// @{
struct FeedAnimalsPayload {
    core::FoodType food;
    uint64_t animal_id;     ///< Hungriest animal when the job was created.
};

struct CleanWastePayload {
    core::GridPos tile;
};

struct RepairFencePayload {
    core::GridPos tile;
    core::EdgeDirection edge;
};

struct ClearLitterPayload {
    core::GridPos tile;
};

struct EmptyBinPayload {
    uint64_t bin_id;
};
/// @}

/// @brief Kind-specific job data as a tagged union.
/// @ingroup algo_jobs
using JobPayload = std::variant<
    FeedAnimalsPayload,
    CleanWastePayload,
    RepairFencePayload,
    ClearLitterPayload,
    EmptyBinPayload
>;

/// @name Payload filters
/// Partial payloads for TaskManager::has_task_for. Unset fields are wildcards.
/// @{
struct FeedAnimalsFilter {
    std::optional<core::FoodType> food;
    std::optional<uint64_t> animal_id;
};

struct CleanWasteFilter {
    std::optional<core::GridPos> tile;
};

struct RepairFenceFilter {
    std::optional<core::GridPos> tile;
    std::optional<core::EdgeDirection> edge;
};

struct ClearLitterFilter {
    std::optional<core::GridPos> tile;
};

struct EmptyBinFilter {
    std::optional<uint64_t> bin_id;
};
/// @}

/// @brief Partial payload; alternatives line up with JobPayload.
/// @ingroup algo_jobs
using PayloadFilter = std::variant<
    FeedAnimalsFilter,
    CleanWasteFilter,
    RepairFenceFilter,
    ClearLitterFilter,
    EmptyBinFilter
>;

static_assert(std::variant_size_v<JobPayload> == 5);
static_assert(std::variant_size_v<PayloadFilter> == std::variant_size_v<JobPayload>);

/// @brief Kind encoded by a payload.
[[nodiscard]] JobKind kind_of(const JobPayload& payload);

/// @brief Role allowed to perform a job kind.
[[nodiscard]] Role role_for(JobKind kind) noexcept;

/// @brief Kinds a freshly hired worker of @p role has enabled.
[[nodiscard]] std::vector<JobKind> default_kinds(Role role);

/// @brief Fixed time a worker spends at the target performing a job.
[[nodiscard]] core::Duration work_duration(JobKind kind) noexcept;

/// @brief True if every set field of @p filter equals the payload's field.
///
/// A filter of a different kind than the payload never matches.
[[nodiscard]] bool payload_matches(const JobPayload& payload, const PayloadFilter& filter);

/// @name Name conversions
/// @{
[[nodiscard]] std::string_view to_string(JobKind kind) noexcept;
[[nodiscard]] std::string_view to_string(Role role) noexcept;
[[nodiscard]] std::optional<JobKind> parse_job_kind(std::string_view name) noexcept;
[[nodiscard]] std::optional<Role> parse_role(std::string_view name) noexcept;
/// @}

/// @brief Everything a producer supplies when inserting a job.
/// @ingroup algo_jobs
/// @see TaskManager::add_task
struct JobInput {
    int priority{Priority::NORMAL};
    core::GridPos target;
    std::optional<ZoneId> zone;     ///< std::nullopt for zone-independent jobs.
    JobPayload payload;
    uint32_t max_retries{3};
};

/// @brief A unit of work in the task manager.
/// @ingroup algo_jobs
///
/// Identity, kind, priority, target, zone and payload never change after
/// construction; only the failure counter does. A job's role and zone are
/// therefore invariant, so a failed job always returns to the queue it
/// came from.
///
/// Jobs are copyable: the task manager keeps the authoritative instance and
/// hands workers a snapshot of the job they claimed.
///
/// @see TaskManager, JobInput
class Job {
public:
    /// @brief Construct a job from producer input.
    /// @param id         Identifier assigned by the task manager.
    /// @param input      Producer-supplied fields.
    /// @param created_at Insertion time, used as the final claim tie-break.
    Job(JobId id, JobInput input, core::TimePoint created_at);

    [[nodiscard]] JobId id() const noexcept { return id_; }
    [[nodiscard]] JobKind kind() const noexcept { return kind_; }
    [[nodiscard]] Role role() const noexcept { return role_for(kind_); }
    [[nodiscard]] int priority() const noexcept { return priority_; }
    [[nodiscard]] core::GridPos target() const noexcept { return target_; }
    [[nodiscard]] std::optional<ZoneId> zone() const noexcept { return zone_; }
    [[nodiscard]] const JobPayload& payload() const noexcept { return payload_; }
    [[nodiscard]] core::TimePoint created_at() const noexcept { return created_at_; }
    [[nodiscard]] uint32_t fail_count() const noexcept { return fail_count_; }
    [[nodiscard]] uint32_t max_retries() const noexcept { return max_retries_; }

    /// @brief Typed access to the payload.
    /// @return Pointer to the payload if it holds @p P, nullptr otherwise.
    template<typename P>
    [[nodiscard]] const P* payload_if() const noexcept { return std::get_if<P>(&payload_); }

    /// @brief Count one failed attempt.
    /// @return True if the job may be retried, false once retries are exhausted.
    bool record_failure() noexcept;

private:
    JobId id_;
    JobKind kind_;
    int priority_;
    core::GridPos target_;
    std::optional<ZoneId> zone_;
    JobPayload payload_;
    core::TimePoint created_at_;
    uint32_t fail_count_{0};
    uint32_t max_retries_;
};

} // namespace staffsim::algo
