#pragma once

/// @file scenario_injection.hpp
/// @brief Turn parsed scenario data into a live world and simulation.
/// @ingroup io_loaders

#include <staffsim/io/scenario_loader.hpp>

#include <staffsim/algo/simulation.hpp>
#include <staffsim/algo/worker.hpp>

#include <staffsim/core/world.hpp>

#include <vector>

namespace staffsim::io {

/// @brief Build the world described by @p scenario.
///
/// Order: terrain and paths, zones (fencing their perimeters), fence
/// overrides, animals, waste, litter, bins. Animal and bin ids are assigned
/// in file order starting at 1.
///
/// @throws core::OutOfRangeError  If a tile lies outside the grid, a zone id
///                                repeats or an animal names an unknown zone.
[[nodiscard]] core::World build_world(const ScenarioData& scenario);

/// @brief Populate @p sim with the scenario's staff, producers and seed jobs.
///
/// Registers every world zone with the task manager, installs the default
/// producers unless `config.producers` is false, hires the staff in file
/// order (worker ids 1, 2, ...) and inserts the seed jobs.
///
/// @return The hired workers, in file order.
/// @throws algo::InvalidJobError  If a seed job is rejected by the task manager.
std::vector<algo::Worker*> inject_scenario(algo::Simulation& sim, const ScenarioData& scenario);

} // namespace staffsim::io
