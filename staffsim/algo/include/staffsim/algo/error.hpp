#pragma once

#include <staffsim/core/error.hpp>

#include <string>

namespace staffsim::algo {

/// @brief Thrown when a job input is malformed.
/// @ingroup algo
///
/// Raised by TaskManager::add_task when the priority is outside
/// [Priority::URGENT, Priority::LOW] or when max_retries is zero (a job
/// that may never fail could not be requeued or discarded consistently).
///
/// @see JobInput, TaskManager::add_task
class InvalidJobError : public core::SimulationError {
public:
    using core::SimulationError::SimulationError;
};

/// @brief Outcome of TaskManager::fail_task.
///
/// Retry exhaustion is an expected outcome rather than an error: the
/// producer will re-detect the underlying condition and insert a fresh job.
///
/// @see TaskManager::fail_task
enum class FailOutcome {
    Requeued,   ///< Retries remain; the job went back to the tail of its queue.
    Discarded,  ///< fail_count reached max_retries; the job is gone for good.
    NotActive   ///< No active job with that id; nothing changed.
};

} // namespace staffsim::algo
