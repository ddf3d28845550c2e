#include <staffsim/algo/worker.hpp>

#include <iterator>
#include <utility>

namespace staffsim::algo {

std::string_view to_string(WorkerState state) noexcept {
    switch (state) {
        case WorkerState::Idle:      return "idle";
        case WorkerState::Walking:   return "walking";
        case WorkerState::Working:   return "working";
        case WorkerState::Wandering: return "wandering";
    }
    return "unknown";
}

WorkerConfig WorkerConfig::for_role(Role role) {
    WorkerConfig config;
    config.poll_interval = role == Role::Zookeeper ? core::duration_from_seconds(8.0)
                                                   : core::duration_from_seconds(6.0);
    return config;
}

Worker::Worker(WorkerId id, Role role, core::GridPos position, WorkerContext context,
               WorkerConfig config)
    : id_(id)
    , role_(role)
    , position_(position)
    , ctx_(context)
    , config_(config)
    , rng_(static_cast<std::mt19937::result_type>(id)) {
    for (JobKind kind : default_kinds(role)) {
        kinds_.insert(kind);
    }
}

Worker::Worker(WorkerId id, Role role, core::GridPos position, WorkerContext context)
    : Worker(id, role, position, context, WorkerConfig::for_role(role)) {}

bool Worker::set_kind_enabled(JobKind kind, bool enabled) {
    if (role_for(kind) != role_) {
        return false;
    }
    if (enabled) {
        kinds_.insert(kind);
    } else {
        kinds_.erase(kind);
    }
    return true;
}

bool Worker::is_unreachable(core::GridPos target) const {
    auto it = unreachable_.find(target);
    return it != unreachable_.end()
        && ctx_.engine.time() - it->second < config_.unreachable_ttl;
}

void Worker::update(core::Duration dt) {
    check_current_job();
    purge_unreachable();

    switch (state_) {
        case WorkerState::Idle:      update_idle(dt); break;
        case WorkerState::Walking:   update_walking(dt); break;
        case WorkerState::Working:   update_working(dt); break;
        case WorkerState::Wandering: update_wandering(dt); break;
    }
}

void Worker::check_current_job() {
    if (!job_ || ctx_.tasks.active_owner(job_->id()) == id_) {
        return;
    }
    JobId lost = job_->id();
    ctx_.engine.trace([&](core::TraceWriter& w) {
        w.type("job_abandoned");
        w.field("job_id", static_cast<uint64_t>(lost));
        w.field("worker_id", static_cast<uint64_t>(id_));
    });
    clear_job();
    wander_timer_ = core::Duration::zero();
    set_state(WorkerState::Idle);
}

void Worker::purge_unreachable() {
    core::TimePoint now = ctx_.engine.time();
    std::erase_if(unreachable_, [&](const auto& entry) {
        return now - entry.second >= config_.unreachable_ttl;
    });
}

bool Worker::poll_for_work(core::Duration dt) {
    poll_timer_ += dt;
    if (poll_timer_ < config_.poll_interval) {
        return false;
    }
    poll_timer_ = core::Duration::zero();
    return !job_ && try_claim();
}

void Worker::update_idle(core::Duration dt) {
    if (poll_for_work(dt)) {
        return;
    }
    wander_timer_ += dt;
    if (wander_timer_ >= config_.wander_interval) {
        wander_timer_ = core::Duration::zero();
        start_wandering();
    }
}

void Worker::update_walking(core::Duration dt) {
    state_timer_ += dt;

    const core::GridPos before = position_;
    if (take_path() && advance_along_path(dt)) {
        if (position_ == job_->target()) {
            state_timer_ = core::Duration::zero();
            set_state(WorkerState::Working);
        } else {
            give_up_job("path_ended_early");
        }
        return;
    }
    if (state_ != WorkerState::Walking) {
        return;
    }
    // The stuck timeout measures time without progress: reaching a new cell restarts it.
    if (position_ != before) {
        state_timer_ = core::Duration::zero();
        return;
    }
    if (state_timer_ >= config_.stuck_timeout) {
        give_up_job("stuck");
    }
}

void Worker::update_working(core::Duration dt) {
    state_timer_ += dt;
    if (state_timer_ < work_duration(job_->kind())) {
        return;
    }
    apply_job_effect(ctx_.effects, *job_, position_);
    ctx_.tasks.complete_task(job_->id());
    clear_job();
    wander_timer_ = core::Duration::zero();
    set_state(WorkerState::Idle);
}

void Worker::update_wandering(core::Duration dt) {
    if (poll_for_work(dt)) {
        return;
    }
    if (take_path()) {
        if (advance_along_path(dt)) {
            path_.clear();
            set_state(WorkerState::Idle);
        }
    }
}

bool Worker::try_claim() {
    ClaimRequest request{id_, role_, zones_, kinds_, position_, {}};
    for (const auto& [target, failed_at] : unreachable_) {
        request.avoid_targets.insert(target);
    }
    auto job = ctx_.tasks.claim_task(request);
    if (!job) {
        return false;
    }
    begin_job(std::move(*job));
    return true;
}

void Worker::begin_job(Job job) {
    job_ = std::move(job);
    path_query_.reset();
    path_.clear();
    path_index_ = 0;
    move_progress_ = 0.0;
    state_timer_ = core::Duration::zero();

    if (position_ == job_->target()) {
        set_state(WorkerState::Working);
        return;
    }
    path_query_ = ctx_.paths.request(position_, job_->target(), config_.constraints);
    set_state(WorkerState::Walking);
}

void Worker::start_wandering() {
    auto candidates = ctx_.paths.nearby_walkable(position_, config_.wander_radius);
    if (candidates.empty()) {
        return;
    }
    std::uniform_int_distribution<std::size_t> pick(0, candidates.size() - 1);
    core::GridPos destination = candidates[pick(rng_)];

    path_.clear();
    path_index_ = 0;
    move_progress_ = 0.0;
    path_query_ = ctx_.paths.request(position_, destination, config_.constraints);
    set_state(WorkerState::Wandering);
}

void Worker::give_up_job(std::string_view reason) {
    JobId id = job_->id();
    core::GridPos target = job_->target();
    FailOutcome outcome = ctx_.tasks.fail_task(id);

    ctx_.engine.trace([&](core::TraceWriter& w) {
        w.type("worker_gave_up");
        w.field("worker_id", static_cast<uint64_t>(id_));
        w.field("job_id", static_cast<uint64_t>(id));
        w.field("reason", reason);
        w.field("requeued", static_cast<uint64_t>(outcome == FailOutcome::Requeued));
    });

    unreachable_[target] = ctx_.engine.time();
    clear_job();
    // Retry right away on the next tick instead of wandering off.
    poll_timer_ = config_.poll_interval;
    wander_timer_ = core::Duration::zero();
    set_state(WorkerState::Idle);
}

void Worker::clear_job() {
    job_.reset();
    path_query_.reset();
    path_.clear();
    path_index_ = 0;
    move_progress_ = 0.0;
    state_timer_ = core::Duration::zero();
}

bool Worker::take_path() {
    if (!path_query_) {
        return true;
    }
    switch (path_query_->status()) {
        case PathStatus::Pending:
            return false;
        case PathStatus::Failed:
            path_query_.reset();
            if (state_ == WorkerState::Walking) {
                give_up_job("unreachable");
            } else {
                set_state(WorkerState::Idle);
            }
            return false;
        case PathStatus::Found:
            path_ = path_query_->cells();
            path_index_ = 0;
            move_progress_ = 0.0;
            path_query_.reset();
            return true;
    }
    return false;
}

bool Worker::advance_along_path(core::Duration dt) {
    move_progress_ += config_.speed * core::duration_to_seconds(dt);
    while (move_progress_ >= 1.0 && path_index_ < path_.size()) {
        position_ = path_[path_index_++];
        move_progress_ -= 1.0;
    }
    if (path_index_ < path_.size()) {
        return false;
    }
    move_progress_ = 0.0;
    return true;
}

void Worker::set_state(WorkerState state) {
    if (state == state_) {
        return;
    }
    WorkerState previous = state_;
    state_ = state;
    ctx_.engine.trace([&](core::TraceWriter& w) {
        w.type("worker_state");
        w.field("worker_id", static_cast<uint64_t>(id_));
        w.field("from", to_string(previous));
        w.field("to", to_string(state));
    });
}

} // namespace staffsim::algo
