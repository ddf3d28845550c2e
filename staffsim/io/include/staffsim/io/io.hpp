#pragma once

/// @defgroup io I/O Library
/// @brief Scenario loading, trace output and metrics.
///
/// The I/O library handles all external data formats: loading scenario
/// JSON files and turning them into a world and a populated simulation,
/// writing simulation traces (JSON, textual, in-memory) and computing
/// post-simulation job metrics (waits, turnaround, failures).
/// Depends on core and algo.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief Scenario JSON loader and injection.

/// @defgroup io_writers Trace Writers
/// @ingroup io
/// @brief JSON, textual, memory, and null trace writers.

/// @defgroup io_metrics Metrics
/// @ingroup io
/// @brief Job lifecycle counts and timing statistics.

// Convenience header for libstaffsim-io

#include <staffsim/io/error.hpp>
#include <staffsim/io/trace_writers.hpp>
#include <staffsim/io/scenario_loader.hpp>
#include <staffsim/io/scenario_injection.hpp>
#include <staffsim/io/metrics.hpp>
