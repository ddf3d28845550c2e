#pragma once

#include <stdexcept>
#include <string>

namespace staffsim::core {

/// @brief Base exception for all simulation errors.
///
/// All exceptions thrown by the core library derive from this class,
/// allowing callers to catch simulation-specific errors separately
/// from other `std::runtime_error` exceptions.
///
/// @see InvalidStateError, OutOfRangeError
/// @ingroup core
class SimulationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when an operation is invalid for the current object state.
///
/// For example, scheduling a timer in the past, or calling the unbounded
/// Engine::run() while a tick handler keeps the event queue alive forever.
///
/// @see SimulationError
/// @ingroup core
class InvalidStateError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when a value is outside its valid range.
///
/// For example, addressing a tile outside the world grid, or referring to a
/// zone, animal or bin that the world does not know.
///
/// @see SimulationError
/// @ingroup core
class OutOfRangeError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

} // namespace staffsim::core
