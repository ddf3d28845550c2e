#include <staffsim/algo/queue_store.hpp>

#include <algorithm>
#include <utility>

namespace staffsim::algo {

std::size_t ZoneQueueStore::RoleQueues::size() const noexcept {
    std::size_t total = 0;
    for (const Queue& queue : by_role) {
        total += queue.size();
    }
    return total;
}

bool ZoneQueueStore::register_zone(ZoneId zone) {
    auto [it, inserted] = zones_.try_emplace(zone);
    return inserted;
}

ZoneQueueStore::Queue& ZoneQueueStore::queue_for(Role role, std::optional<ZoneId> zone) {
    if (!zone) {
        return global_[role];
    }
    return zones_[*zone][role];
}

const ZoneQueueStore::Queue* ZoneQueueStore::find_queue(Role role,
                                                        std::optional<ZoneId> zone) const {
    if (!zone) {
        return &global_[role];
    }
    auto it = zones_.find(*zone);
    if (it == zones_.end()) {
        return nullptr;
    }
    return &it->second[role];
}

ZoneQueueStore::Queue* ZoneQueueStore::find_queue(Role role, std::optional<ZoneId> zone) {
    return const_cast<Queue*>(std::as_const(*this).find_queue(role, zone));
}

std::size_t ZoneQueueStore::drop_zone(ZoneId zone) {
    auto it = zones_.find(zone);
    if (it == zones_.end()) {
        return 0;
    }
    std::size_t dropped = it->second.size();
    zones_.erase(it);
    return dropped;
}

std::optional<Job> ZoneQueueStore::remove(JobId id) {
    auto take = [id](Queue& queue) -> std::optional<Job> {
        auto it = std::find_if(queue.begin(), queue.end(),
                               [id](const Job& job) { return job.id() == id; });
        if (it == queue.end()) {
            return std::nullopt;
        }
        Job job = std::move(*it);
        queue.erase(it);
        return job;
    };

    for (auto& [zone, queues] : zones_) {
        for (Queue& queue : queues.by_role) {
            if (auto job = take(queue)) {
                return job;
            }
        }
    }
    for (Queue& queue : global_.by_role) {
        if (auto job = take(queue)) {
            return job;
        }
    }
    return std::nullopt;
}

std::size_t ZoneQueueStore::queued_count() const noexcept {
    std::size_t total = global_.size();
    for (const auto& [zone, queues] : zones_) {
        total += queues.size();
    }
    return total;
}

std::vector<ZoneId> ZoneQueueStore::zone_ids() const {
    std::vector<ZoneId> ids;
    ids.reserve(zones_.size());
    for (const auto& [zone, queues] : zones_) {
        ids.push_back(zone);
    }
    return ids;
}

} // namespace staffsim::algo
