#include <staffsim/algo/task_manager.hpp>

#include <algorithm>
#include <string>
#include <tuple>
#include <utility>

namespace staffsim::algo {

namespace {

struct Candidate {
    ZoneQueueStore::Queue* queue;
    ZoneQueueStore::Queue::iterator it;
    int64_t distance;
};

// (priority, distance, created_at, id), smallest first.
bool claims_before(const Candidate& a, const Candidate& b) {
    const Job& ja = *a.it;
    const Job& jb = *b.it;
    return std::tuple(ja.priority(), a.distance, ja.created_at(), ja.id())
         < std::tuple(jb.priority(), b.distance, jb.created_at(), jb.id());
}

bool job_matches(const Job& job, JobKind kind, std::optional<ZoneId> zone,
                 const std::optional<PayloadFilter>& filter) {
    if (job.kind() != kind) {
        return false;
    }
    if (zone && job.zone() != zone) {
        return false;
    }
    return !filter || payload_matches(job.payload(), *filter);
}

} // namespace

TaskManager::TaskManager(core::Engine& engine)
    : engine_(engine) {}

JobId TaskManager::add_task(JobInput input) {
    if (input.priority < Priority::URGENT || input.priority > Priority::LOW) {
        throw InvalidJobError("Job priority out of range: " + std::to_string(input.priority));
    }
    if (input.max_retries == 0) {
        throw InvalidJobError("Job max_retries must be at least 1");
    }

    JobId id = next_id_++;
    Job job(id, std::move(input), engine_.time());
    auto& queue = queues_.queue_for(job.role(), job.zone());
    queue.push_back(std::move(job));
    trace_job("job_added", queue.back());
    return id;
}

bool TaskManager::has_task_for(JobKind kind, std::optional<ZoneId> zone,
                               const std::optional<PayloadFilter>& filter) const {
    bool found = false;
    queues_.for_each_job([&](const Job& job) {
        found = found || job_matches(job, kind, zone, filter);
    });
    if (found) {
        return true;
    }
    return std::any_of(active_.begin(), active_.end(), [&](const auto& entry) {
        return job_matches(entry.second.job, kind, zone, filter);
    });
}

std::optional<Job> TaskManager::claim_task(const ClaimRequest& request) {
    std::vector<ZoneQueueStore::Queue*> sources;
    for (ZoneId zone : request.zones) {
        if (auto* queue = queues_.find_queue(request.role, zone)) {
            sources.push_back(queue);
        }
    }
    sources.push_back(queues_.find_queue(request.role, std::nullopt));

    std::vector<Candidate> candidates;
    for (auto* queue : sources) {
        for (auto it = queue->begin(); it != queue->end(); ++it) {
            if (it->role() != request.role) {
                continue;
            }
            if (!request.enabled_kinds.contains(it->kind())) {
                continue;
            }
            if (request.avoid_targets.contains(it->target())) {
                continue;
            }
            if (active_.contains(it->id())) {
                continue;
            }
            candidates.push_back({queue, it, core::manhattan_distance(request.position, it->target())});
        }
    }

    if (candidates.empty()) {
        return std::nullopt;
    }

    auto best = std::min_element(candidates.begin(), candidates.end(), claims_before);
    Job job = std::move(*best->it);
    best->queue->erase(best->it);
    int64_t distance = best->distance;

    auto [entry, inserted] = active_.emplace(
        job.id(), ActiveAssignment{std::move(job), request.worker, engine_.time()});
    const Job& claimed = entry->second.job;

    engine_.trace([&](core::TraceWriter& w) {
        w.type("job_claimed");
        w.field("job_id", static_cast<uint64_t>(claimed.id()));
        w.field("worker_id", static_cast<uint64_t>(request.worker));
        w.field("kind", to_string(claimed.kind()));
        w.field("priority", static_cast<uint64_t>(claimed.priority()));
        w.field("distance", static_cast<double>(distance));
        w.field("wait", core::duration_to_seconds(engine_.time() - claimed.created_at()));
    });
    return claimed;
}

void TaskManager::complete_task(JobId id) {
    auto it = active_.find(id);
    if (it == active_.end()) {
        return;
    }
    ActiveAssignment assignment = std::move(it->second);
    active_.erase(it);

    engine_.trace([&](core::TraceWriter& w) {
        w.type("job_completed");
        w.field("job_id", static_cast<uint64_t>(id));
        w.field("worker_id", static_cast<uint64_t>(assignment.worker));
        w.field("kind", to_string(assignment.job.kind()));
        w.field("turnaround",
                core::duration_to_seconds(engine_.time() - assignment.job.created_at()));
    });
}

FailOutcome TaskManager::fail_task(JobId id) {
    auto it = active_.find(id);
    if (it == active_.end()) {
        return FailOutcome::NotActive;
    }
    ActiveAssignment assignment = std::move(it->second);
    active_.erase(it);

    Job& job = assignment.job;
    bool retry = job.record_failure();

    engine_.trace([&](core::TraceWriter& w) {
        w.type("job_failed");
        w.field("job_id", static_cast<uint64_t>(id));
        w.field("worker_id", static_cast<uint64_t>(assignment.worker));
        w.field("kind", to_string(job.kind()));
        w.field("fail_count", static_cast<uint64_t>(job.fail_count()));
    });

    if (!retry) {
        trace_job("job_discarded", job);
        return FailOutcome::Discarded;
    }

    auto& queue = queues_.queue_for(job.role(), job.zone());
    queue.push_back(std::move(job));
    trace_job("job_requeued", queue.back());
    return FailOutcome::Requeued;
}

bool TaskManager::cancel_task(JobId id) {
    if (auto it = active_.find(id); it != active_.end()) {
        Job job = std::move(it->second.job);
        active_.erase(it);
        trace_job("job_cancelled", job);
        return true;
    }
    if (auto job = queues_.remove(id)) {
        trace_job("job_cancelled", *job);
        return true;
    }
    return false;
}

void TaskManager::register_zone(ZoneId zone) {
    if (!queues_.register_zone(zone)) {
        return;
    }
    engine_.trace([&](core::TraceWriter& w) {
        w.type("zone_registered");
        w.field("zone_id", static_cast<uint64_t>(zone));
    });
}

void TaskManager::remove_zone(ZoneId zone) {
    std::size_t dropped = queues_.drop_zone(zone);
    std::size_t evicted = std::erase_if(active_, [zone](const auto& entry) {
        return entry.second.job.zone() == zone;
    });

    engine_.trace([&](core::TraceWriter& w) {
        w.type("zone_removed");
        w.field("zone_id", static_cast<uint64_t>(zone));
        w.field("queued_dropped", static_cast<uint64_t>(dropped));
        w.field("active_evicted", static_cast<uint64_t>(evicted));
    });
}

std::optional<WorkerId> TaskManager::active_owner(JobId id) const {
    auto it = active_.find(id);
    if (it == active_.end()) {
        return std::nullopt;
    }
    return it->second.worker;
}

const Job* TaskManager::active_job_for_worker(WorkerId worker) const {
    for (const auto& [id, assignment] : active_) {
        if (assignment.worker == worker) {
            return &assignment.job;
        }
    }
    return nullptr;
}

TaskStats TaskManager::stats() const noexcept {
    return TaskStats{queues_.queued_count(), active_.size(), queues_.zone_ids().size()};
}

std::vector<Job> TaskManager::jobs_for_zone(ZoneId zone) const {
    std::vector<Job> jobs;
    queues_.for_each_job([&](const Job& job) {
        if (job.zone() == zone) {
            jobs.push_back(job);
        }
    });
    for (const auto& [id, assignment] : active_) {
        if (assignment.job.zone() == zone) {
            jobs.push_back(assignment.job);
        }
    }
    return jobs;
}

std::vector<Job> TaskManager::queued_jobs() const {
    std::vector<Job> jobs;
    queues_.for_each_job([&](const Job& job) { jobs.push_back(job); });
    return jobs;
}

std::vector<ActiveAssignment> TaskManager::active_jobs() const {
    std::vector<ActiveAssignment> jobs;
    jobs.reserve(active_.size());
    for (const auto& [id, assignment] : active_) {
        jobs.push_back(assignment);
    }
    return jobs;
}

void TaskManager::trace_job(std::string_view type, const Job& job) {
    engine_.trace([&](core::TraceWriter& w) {
        w.type(type);
        w.field("job_id", static_cast<uint64_t>(job.id()));
        w.field("kind", to_string(job.kind()));
        w.field("priority", static_cast<uint64_t>(job.priority()));
        if (job.zone()) {
            w.field("zone_id", static_cast<uint64_t>(*job.zone()));
        }
        w.field("target_x", static_cast<double>(job.target().x));
        w.field("target_y", static_cast<double>(job.target().y));
        w.field("fail_count", static_cast<uint64_t>(job.fail_count()));
    });
}

} // namespace staffsim::algo
