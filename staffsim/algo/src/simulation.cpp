#include <staffsim/algo/simulation.hpp>

#include <staffsim/core/error.hpp>

#include <utility>

namespace staffsim::algo {

Simulation::Simulation(core::Engine& engine, core::World& world, SimulationConfig config)
    : engine_(engine)
    , world_(world)
    , config_(config)
    , tasks_(engine)
    , paths_(engine, world, config.path_latency)
    , effects_(world, config.food_per_feeding) {}

Worker& Simulation::add_worker(Role role, core::GridPos position) {
    return add_worker(role, position, WorkerConfig::for_role(role));
}

Worker& Simulation::add_worker(Role role, core::GridPos position, WorkerConfig config) {
    WorkerContext context{engine_, tasks_, paths_, effects_};
    workers_.push_back(std::make_unique<Worker>(next_worker_id_++, role, position, context, config));
    return *workers_.back();
}

void Simulation::add_producer(std::unique_ptr<JobProducer> producer) {
    producers_.push_back(std::move(producer));
}

void Simulation::add_default_producers() {
    FeedingPolicy feeding = config_.feeding;
    feeding.max_retries = config_.max_retries;
    SanitationPolicy sanitation = config_.sanitation;
    sanitation.max_retries = config_.max_retries;

    add_producer(std::make_unique<FeedingNeedDetector>(world_, tasks_, feeding));
    add_producer(std::make_unique<FenceConditionDetector>(world_, tasks_, config_.max_retries));
    add_producer(std::make_unique<SanitationDetector>(world_, tasks_, sanitation));
}

void Simulation::register_zones() {
    for (ZoneId zone : world_.zone_ids()) {
        tasks_.register_zone(zone);
    }
}

bool Simulation::remove_zone(ZoneId zone) {
    tasks_.remove_zone(zone);
    for (auto& worker : workers_) {
        worker->unassign_zone(zone);
    }
    return world_.remove_zone(zone);
}

std::size_t Simulation::run_producers() {
    std::size_t added = 0;
    for (auto& producer : producers_) {
        added += producer->scan();
    }
    return added;
}

void Simulation::start() {
    if (started_) {
        throw core::InvalidStateError("Simulation already started");
    }
    started_ = true;
    engine_.add_tick_handler([this](core::Duration dt) { step(dt); });
}

void Simulation::step(core::Duration dt) {
    world_.advance(dt);

    producer_timer_ += dt;
    if (producer_timer_ >= config_.producer_interval) {
        producer_timer_ = core::Duration::zero();
        run_producers();
    }

    for (auto& worker : workers_) {
        worker->update(dt);
    }
}

} // namespace staffsim::algo
