#include <staffsim/io/scenario_injection.hpp>

#include <staffsim/algo/task_manager.hpp>

namespace staffsim::io {

core::World build_world(const ScenarioData& scenario) {
    core::World world(scenario.world.width, scenario.world.height);

    for (const auto& tile : scenario.world.water) {
        world.set_terrain(tile, core::Terrain::Water);
    }
    for (const auto& tile : scenario.world.paths) {
        world.set_path(tile, true);
    }
    for (const auto& zone : scenario.zones) {
        world.add_zone(zone.id, zone.name, zone.min, zone.max, zone.condition, zone.gate);
    }
    for (const auto& fence : scenario.fences) {
        world.set_fence(fence.tile, fence.edge, fence.condition, fence.gate);
    }
    for (const auto& animal : scenario.animals) {
        world.add_animal(animal.zone, animal.food, animal.hunger, animal.hunger_decay);
    }
    for (const auto& tile : scenario.waste) {
        world.add_waste(tile);
    }
    for (const auto& tile : scenario.litter) {
        world.add_litter(tile);
    }
    for (const auto& bin : scenario.bins) {
        world.add_bin(bin.tile, bin.capacity, bin.fill_rate, bin.fill);
    }
    return world;
}

std::vector<algo::Worker*> inject_scenario(algo::Simulation& sim, const ScenarioData& scenario) {
    sim.register_zones();
    if (scenario.config.producers) {
        sim.add_default_producers();
    }

    std::vector<algo::Worker*> workers;
    workers.reserve(scenario.staff.size());

    for (const auto& member : scenario.staff) {
        auto config = scenario.config.worker.apply(algo::WorkerConfig::for_role(member.role));
        auto& worker = sim.add_worker(member.role, member.position, config);
        for (core::ZoneId zone : member.zones) {
            worker.assign_zone(zone);
        }
        if (member.kinds) {
            const auto defaults = worker.enabled_kinds();
            for (algo::JobKind kind : defaults) {
                worker.set_kind_enabled(kind, false);
            }
            for (algo::JobKind kind : *member.kinds) {
                worker.set_kind_enabled(kind, true);
            }
        }
        workers.push_back(&worker);
    }

    for (const auto& job : scenario.jobs) {
        sim.tasks().add_task(job);
    }
    return workers;
}

} // namespace staffsim::io
