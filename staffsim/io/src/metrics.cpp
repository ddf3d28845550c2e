#include <staffsim/io/metrics.hpp>

#include <algorithm>
#include <iomanip>
#include <numeric>
#include <sstream>
#include <unordered_map>

namespace staffsim::io {

namespace {

double mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

} // anonymous namespace

SimulationMetrics compute_metrics(const std::vector<TraceRecord>& records) {
    SimulationMetrics metrics;

    // job_id -> time it was added; erased on the first claim
    std::unordered_map<uint64_t, double> added_at;
    std::unordered_map<uint64_t, double> created_at;

    for (const auto& record : records) {
        metrics.simulation_end = std::max(metrics.simulation_end, record.time);
        auto job_id = record.get_uint("job_id");

        if (record.type == "job_added") {
            metrics.jobs_added++;
            if (job_id) {
                added_at[*job_id] = record.time;
                created_at[*job_id] = record.time;
            }
        }
        else if (record.type == "job_claimed") {
            metrics.jobs_claimed++;
            if (!job_id) {
                continue;
            }
            auto it = added_at.find(*job_id);
            if (it != added_at.end()) {
                metrics.waiting_times.push_back(record.time - it->second);
                added_at.erase(it);
            }
        }
        else if (record.type == "job_completed") {
            metrics.jobs_completed++;
            if (auto kind = record.get_string("kind")) {
                metrics.completed_per_kind[*kind]++;
            }
            if (job_id) {
                auto it = created_at.find(*job_id);
                if (it != created_at.end()) {
                    metrics.turnaround_times.push_back(record.time - it->second);
                    created_at.erase(it);
                }
            }
        }
        else if (record.type == "job_failed") {
            metrics.jobs_failed++;
        }
        else if (record.type == "job_requeued") {
            metrics.jobs_requeued++;
        }
        else if (record.type == "job_discarded") {
            metrics.jobs_discarded++;
        }
        else if (record.type == "job_cancelled") {
            metrics.jobs_cancelled++;
        }
        else if (record.type == "job_abandoned") {
            metrics.jobs_abandoned++;
        }
        else if (record.type == "worker_gave_up") {
            metrics.workers_gave_up++;
            if (auto reason = record.get_string("reason")) {
                metrics.gave_up_per_reason[*reason]++;
            }
        }
    }

    metrics.mean_wait = mean(metrics.waiting_times);
    if (!metrics.waiting_times.empty()) {
        metrics.max_wait = *std::max_element(metrics.waiting_times.begin(),
                                             metrics.waiting_times.end());
    }
    metrics.mean_turnaround = mean(metrics.turnaround_times);
    return metrics;
}

void print_metrics(const SimulationMetrics& metrics, std::ostream& out) {
    // Formatted into a local stream so the caller's flags and precision are untouched
    std::ostringstream oss;
    oss << "=== Simulation Metrics ===\n"
        << "Simulated time:  " << std::fixed << std::setprecision(1)
        << metrics.simulation_end << " s\n"
        << "Jobs added:      " << metrics.jobs_added << "\n"
        << "Jobs claimed:    " << metrics.jobs_claimed << "\n"
        << "Jobs completed:  " << metrics.jobs_completed << "\n"
        << "Jobs failed:     " << metrics.jobs_failed
        << " (requeued " << metrics.jobs_requeued
        << ", discarded " << metrics.jobs_discarded << ")\n"
        << "Jobs cancelled:  " << metrics.jobs_cancelled << "\n"
        << "Jobs abandoned:  " << metrics.jobs_abandoned << "\n";

    if (!metrics.completed_per_kind.empty()) {
        oss << "\nCompleted per kind:\n";
        for (const auto& [kind, count] : metrics.completed_per_kind) {
            oss << "  " << std::left << std::setw(14) << kind << std::right << count << "\n";
        }
    }
    if (!metrics.gave_up_per_reason.empty()) {
        oss << "\nGive-ups per reason:\n";
        for (const auto& [reason, count] : metrics.gave_up_per_reason) {
            oss << "  " << std::left << std::setw(18) << reason << std::right << count << "\n";
        }
    }

    oss << std::setprecision(2)
        << "\nWait (s):        mean " << metrics.mean_wait << ", max " << metrics.max_wait << "\n"
        << "Turnaround (s):  mean " << metrics.mean_turnaround << "\n";

    out << oss.str();
}

} // namespace staffsim::io
