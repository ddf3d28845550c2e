#pragma once

/// @file scenario_loader.hpp
/// @brief Data structures and functions for loading JSON scenario files.
/// @ingroup io_loaders
///
/// A scenario describes the world (grid, water, paths, zones, fences,
/// animals, sanitation state), the staff, optional seed jobs and run
/// settings. Every section except `world` is optional.
///
/// @code{.json}
/// {
///   "world": { "width": 24, "height": 16, "water": [[10, 3]], "paths": [[0, 0], [1, 0]] },
///   "zones": [ { "id": 1, "name": "lions", "min": [2, 2], "max": [7, 7],
///                "condition": "good", "gate": { "tile": [4, 7], "edge": "south" } } ],
///   "fences": [ { "tile": [2, 2], "edge": "north", "condition": "damaged" } ],
///   "animals": [ { "zone": 1, "food": "meat", "hunger": 40, "decay": 0.5 } ],
///   "waste": [[3, 3]], "litter": [[1, 0]],
///   "bins": [ { "tile": [0, 1], "capacity": 100, "fill": 80, "fill_rate": 0.2 } ],
///   "staff": [ { "role": "zookeeper", "position": [0, 0], "zones": [1],
///                "kinds": ["feed_animals"] } ],
///   "jobs": [ { "kind": "clear_litter", "priority": 2, "target": [1, 0], "tile": [1, 0] } ],
///   "config": { "tick": 0.1, "duration": 600, "producer_interval": 1.0,
///               "path_latency": 0.0, "max_retries": 3, "producers": true,
///               "worker": { "speed": 2.5, "stuck_timeout": 30 } }
/// }
/// @endcode

#include <staffsim/algo/job.hpp>
#include <staffsim/algo/simulation.hpp>
#include <staffsim/algo/worker.hpp>

#include <staffsim/core/types.hpp>
#include <staffsim/core/world.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace staffsim::io {

/// @brief Grid dimensions plus water and path tiles.
/// @ingroup io_loaders
struct WorldParams {
    int32_t width{0};
    int32_t height{0};
    std::vector<core::GridPos> water;
    std::vector<core::GridPos> paths;
};

/// @brief A fenced exhibit.
/// @ingroup io_loaders
struct ZoneParams {
    core::ZoneId id{0};
    std::string name;
    core::GridPos min;
    core::GridPos max;
    core::FenceCondition condition{core::FenceCondition::Good};
    std::optional<core::Fence> gate;    ///< Perimeter edge turned into a gate.
};

/// @brief A fence placed or overridden after the zones are built.
/// @ingroup io_loaders
struct FenceParams {
    core::GridPos tile;
    core::EdgeDirection edge{core::EdgeDirection::North};
    core::FenceCondition condition{core::FenceCondition::Good};
    bool gate{false};
};

/// @ingroup io_loaders
struct AnimalParams {
    core::ZoneId zone{0};
    core::FoodType food{core::FoodType::Meat};
    double hunger{100.0};
    double hunger_decay{0.5};
};

/// @ingroup io_loaders
struct BinParams {
    core::GridPos tile;
    double capacity{100.0};
    double fill{0.0};
    double fill_rate{0.0};
};

/// @brief A staff member to hire.
/// @ingroup io_loaders
struct StaffParams {
    algo::Role role{algo::Role::Zookeeper};
    core::GridPos position;
    std::vector<core::ZoneId> zones;
    /// Enabled kinds; std::nullopt keeps the role's defaults.
    std::optional<std::vector<algo::JobKind>> kinds;
};

/// @brief Worker settings applied on top of the per-role defaults.
/// @ingroup io_loaders
struct WorkerOverrides {
    std::optional<core::Duration> poll_interval;
    std::optional<core::Duration> wander_interval;
    std::optional<core::Duration> stuck_timeout;
    std::optional<core::Duration> unreachable_ttl;
    std::optional<double> speed;
    std::optional<int32_t> wander_radius;

    /// @brief Copy of @p base with every set field replaced.
    [[nodiscard]] algo::WorkerConfig apply(algo::WorkerConfig base) const;
};

/// @brief Run settings from the `config` object.
/// @ingroup io_loaders
struct RunConfig {
    core::Duration tick{core::duration_from_milliseconds(100)};
    std::optional<core::Duration> duration;     ///< CLI --duration wins when given.
    bool producers{true};                       ///< Install the default detectors.
    algo::SimulationConfig simulation{};
    WorkerOverrides worker{};
};

/// @brief Complete scenario definition.
/// @ingroup io_loaders
/// @see load_scenario, build_world, inject_scenario
struct ScenarioData {
    WorldParams world;
    std::vector<ZoneParams> zones;
    std::vector<FenceParams> fences;
    std::vector<AnimalParams> animals;
    std::vector<core::GridPos> waste;
    std::vector<core::GridPos> litter;
    std::vector<BinParams> bins;
    std::vector<StaffParams> staff;
    std::vector<algo::JobInput> jobs;   ///< Seed jobs inserted before the first tick.
    RunConfig config;
};

/// @brief Load a scenario from a JSON file.
///
/// @param path  Filesystem path to the JSON scenario file.
/// @return Parsed scenario data.
///
/// @throws LoaderError  If the file cannot be read or contains invalid JSON.
///
/// @see load_scenario_from_string
ScenarioData load_scenario(const std::filesystem::path& path);

/// @brief Load a scenario from a JSON string.
///
/// Names (roles, kinds, edges, food, fence conditions) are validated here;
/// an unknown name is a LoaderError naming the offending array element.
///
/// @throws LoaderError  If the JSON is malformed or fails validation.
ScenarioData load_scenario_from_string(std::string_view json);

} // namespace staffsim::io
