#pragma once

/// @file metrics.hpp
/// @brief Post-simulation metrics derived from a trace.
///
/// Counts the job lifecycle records emitted by the task manager and the
/// workers and derives waiting and turnaround statistics from them.
///
/// @ingroup io_metrics

#include <staffsim/io/trace_writers.hpp>

#include <cstdint>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace staffsim::io {

/// @brief Aggregated job statistics computed from a simulation trace.
///
/// Waiting time runs from `job_added` to the job's first `job_claimed`;
/// turnaround from `job_added` to `job_completed`. Both are in seconds.
///
/// @ingroup io_metrics
/// @see compute_metrics
struct SimulationMetrics {
    // -- Lifecycle counts ----------------------------------------------------

    uint64_t jobs_added{0};
    uint64_t jobs_claimed{0};       ///< Claims, including re-claims after a requeue.
    uint64_t jobs_completed{0};
    uint64_t jobs_failed{0};
    uint64_t jobs_requeued{0};
    uint64_t jobs_discarded{0};
    uint64_t jobs_cancelled{0};
    uint64_t jobs_abandoned{0};     ///< Workers that lost a job to zone removal or cancellation.
    uint64_t workers_gave_up{0};    ///< Give-ups for unreachable, stuck or cut-short walks.

    /// @brief Completions per kind name, e.g. "feed_animals" -> 3.
    std::map<std::string, uint64_t> completed_per_kind;

    /// @brief Give-ups per reason, e.g. "unreachable" -> 1.
    std::map<std::string, uint64_t> gave_up_per_reason;

    // -- Timing --------------------------------------------------------------

    std::vector<double> waiting_times;      ///< One entry per first claim.
    std::vector<double> turnaround_times;   ///< One entry per completion.

    double mean_wait{0.0};
    double max_wait{0.0};
    double mean_turnaround{0.0};

    double simulation_end{0.0};             ///< Time of the last record.
};

/// @brief Compute metrics from in-memory trace records.
///
/// @param records  Records in emission order, usually from MemoryTraceWriter.
/// @ingroup io_metrics
[[nodiscard]] SimulationMetrics compute_metrics(const std::vector<TraceRecord>& records);

/// @brief Print a human-readable summary.
/// @ingroup io_metrics
void print_metrics(const SimulationMetrics& metrics, std::ostream& out);

} // namespace staffsim::io
