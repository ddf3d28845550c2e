#pragma once

/// @defgroup core Core Library
/// @brief Simulation engine, tile world, events and types.
///
/// The core library provides the foundational simulation infrastructure:
/// the event-driven Engine with its fixed tick, timers, the trace writer
/// interface and the tile World (terrain, paths, fences, zones, animals,
/// bins). It has no dependencies on scheduling or I/O.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Strong types for time and grid positions.

/// @defgroup core_engine Engine
/// @ingroup core
/// @brief Event-driven simulation loop, tick and timer API.

/// @defgroup core_world World
/// @ingroup core
/// @brief Grid, fences, zones, animals, food and sanitation state.

/// @defgroup core_events Events
/// @ingroup core
/// @brief Event types and timer identifiers.

// Convenience header for libstaffsim-core
#include <staffsim/core/types.hpp>
#include <staffsim/core/error.hpp>
#include <staffsim/core/event.hpp>
#include <staffsim/core/timer.hpp>
#include <staffsim/core/trace_writer.hpp>
#include <staffsim/core/engine.hpp>
#include <staffsim/core/world.hpp>
