#include <staffsim/algo/job.hpp>

#include <array>
#include <utility>

namespace staffsim::algo {

namespace {

constexpr std::array<JobKind, 5> ALL_KINDS{
    JobKind::FeedAnimals, JobKind::CleanWaste, JobKind::RepairFence,
    JobKind::ClearLitter, JobKind::EmptyBin};

template<typename T>
bool field_matches(const std::optional<T>& wanted, const T& actual) {
    return !wanted || *wanted == actual;
}

bool matches(const FeedAnimalsPayload& p, const FeedAnimalsFilter& f) {
    return field_matches(f.food, p.food) && field_matches(f.animal_id, p.animal_id);
}

bool matches(const CleanWastePayload& p, const CleanWasteFilter& f) {
    return field_matches(f.tile, p.tile);
}

bool matches(const RepairFencePayload& p, const RepairFenceFilter& f) {
    return field_matches(f.tile, p.tile) && field_matches(f.edge, p.edge);
}

bool matches(const ClearLitterPayload& p, const ClearLitterFilter& f) {
    return field_matches(f.tile, p.tile);
}

bool matches(const EmptyBinPayload& p, const EmptyBinFilter& f) {
    return field_matches(f.bin_id, p.bin_id);
}

// Fallback for mismatched payload/filter pairs.
template<typename P, typename F>
bool matches(const P&, const F&) {
    return false;
}

} // namespace

JobKind kind_of(const JobPayload& payload) {
    return static_cast<JobKind>(payload.index());
}

Role role_for(JobKind kind) noexcept {
    switch (kind) {
        case JobKind::FeedAnimals:
        case JobKind::CleanWaste:
            return Role::Zookeeper;
        case JobKind::RepairFence:
        case JobKind::ClearLitter:
        case JobKind::EmptyBin:
            return Role::Maintenance;
    }
    return Role::Maintenance;
}

std::vector<JobKind> default_kinds(Role role) {
    std::vector<JobKind> kinds;
    for (JobKind kind : ALL_KINDS) {
        if (role_for(kind) == role) {
            kinds.push_back(kind);
        }
    }
    return kinds;
}

core::Duration work_duration(JobKind kind) noexcept {
    return role_for(kind) == Role::Zookeeper ? core::duration_from_seconds(4.0)
                                             : core::duration_from_seconds(5.0);
}

bool payload_matches(const JobPayload& payload, const PayloadFilter& filter) {
    return std::visit([](const auto& p, const auto& f) { return matches(p, f); },
                      payload, filter);
}

std::string_view to_string(JobKind kind) noexcept {
    switch (kind) {
        case JobKind::FeedAnimals: return "feed_animals";
        case JobKind::CleanWaste:  return "clean_waste";
        case JobKind::RepairFence: return "repair_fence";
        case JobKind::ClearLitter: return "clear_litter";
        case JobKind::EmptyBin:    return "empty_bin";
    }
    return "unknown";
}

std::string_view to_string(Role role) noexcept {
    switch (role) {
        case Role::Zookeeper:   return "zookeeper";
        case Role::Maintenance: return "maintenance";
    }
    return "unknown";
}

std::optional<JobKind> parse_job_kind(std::string_view name) noexcept {
    for (JobKind kind : ALL_KINDS) {
        if (to_string(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

std::optional<Role> parse_role(std::string_view name) noexcept {
    for (Role role : {Role::Zookeeper, Role::Maintenance}) {
        if (to_string(role) == name) {
            return role;
        }
    }
    return std::nullopt;
}

Job::Job(JobId id, JobInput input, core::TimePoint created_at)
    : id_(id)
    , kind_(kind_of(input.payload))
    , priority_(input.priority)
    , target_(input.target)
    , zone_(input.zone)
    , payload_(std::move(input.payload))
    , created_at_(created_at)
    , max_retries_(input.max_retries) {}

bool Job::record_failure() noexcept {
    ++fail_count_;
    return fail_count_ < max_retries_;
}

} // namespace staffsim::algo
