#pragma once

/// @defgroup algo Algo Library
/// @brief Task manager, workers, path finding, job producers and effects.
///
/// The algo library implements staff scheduling on top of the core
/// engine and world: the TaskManager with its per-zone and global queues,
/// the Worker state machine, the grid path service, the job producers
/// that watch the world and the effects that finished jobs apply to it.
/// Depends on core only.

/// @defgroup algo_jobs Jobs
/// @ingroup algo
/// @brief Job kinds, payloads, priorities and filters.

/// @defgroup algo_tasks Task Manager
/// @ingroup algo
/// @brief Queues, claiming and the completion protocol.

/// @defgroup algo_workers Workers
/// @ingroup algo
/// @brief Per-tick staff state machine.

/// @defgroup algo_paths Paths
/// @ingroup algo
/// @brief Asynchronous path requests over the grid.

/// @defgroup algo_effects Effects
/// @ingroup algo
/// @brief World changes applied by finished jobs.

/// @defgroup algo_producers Producers
/// @ingroup algo
/// @brief Detectors that insert jobs from world conditions.

/// @defgroup algo_simulation Simulation
/// @ingroup algo
/// @brief Per-tick wiring of world, producers and workers.

// Convenience header for libstaffsim-algo
#include <staffsim/algo/error.hpp>
#include <staffsim/algo/job.hpp>
#include <staffsim/algo/job_effects.hpp>
#include <staffsim/algo/path_service.hpp>
#include <staffsim/algo/producers.hpp>
#include <staffsim/algo/queue_store.hpp>
#include <staffsim/algo/simulation.hpp>
#include <staffsim/algo/task_manager.hpp>
#include <staffsim/algo/worker.hpp>
