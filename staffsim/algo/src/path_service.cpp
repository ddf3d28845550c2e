#include <staffsim/algo/path_service.hpp>

#include <staffsim/core/error.hpp>

#include <algorithm>
#include <array>
#include <deque>
#include <unordered_map>
#include <utility>

namespace staffsim::algo {

namespace {

constexpr std::array<core::EdgeDirection, 4> STEPS{
    core::EdgeDirection::North, core::EdgeDirection::East,
    core::EdgeDirection::South, core::EdgeDirection::West};

} // namespace

void PathQuery::resolve(std::vector<core::GridPos> cells) {
    cells_ = std::move(cells);
    status_ = PathStatus::Found;
}

GridPathService::GridPathService(core::Engine& engine, const core::World& world,
                                 core::Duration latency)
    : engine_(engine)
    , world_(world)
    , latency_(latency) {
    if (latency < core::Duration::zero()) {
        throw core::InvalidStateError("Path latency must not be negative");
    }
}

std::shared_ptr<const PathQuery>
GridPathService::request(core::GridPos from, core::GridPos to, PathConstraints constraints) {
    auto query = std::make_shared<PathQuery>(from, to);
    engine_.add_timer(engine_.time() + latency_, core::EventPriority::PATH_RESULT,
                      [this, query, constraints]() {
        auto cells = find_path(query->from(), query->to(), constraints);
        if (cells) {
            query->resolve(std::move(*cells));
        } else {
            query->fail();
        }
        engine_.trace([&](core::TraceWriter& w) {
            w.type("path_resolved");
            w.field("from_x", static_cast<double>(query->from().x));
            w.field("from_y", static_cast<double>(query->from().y));
            w.field("to_x", static_cast<double>(query->to().x));
            w.field("to_y", static_cast<double>(query->to().y));
            w.field("found", static_cast<uint64_t>(query->status() == PathStatus::Found));
            w.field("length", static_cast<uint64_t>(query->cells().size()));
        });
    });
    return query;
}

bool GridPathService::can_enter(core::GridPos pos, PathConstraints constraints) const {
    if (!world_.is_walkable(pos)) {
        return false;
    }
    return constraints.may_use_paths || !world_.has_path(pos);
}

std::optional<std::vector<core::GridPos>>
GridPathService::find_path(core::GridPos from, core::GridPos to, PathConstraints constraints) const {
    if (!world_.contains(from) || !can_enter(to, constraints)) {
        return std::nullopt;
    }
    if (from == to) {
        return std::vector<core::GridPos>{};
    }

    std::unordered_map<core::GridPos, core::GridPos, core::GridPosHash> came_from;
    std::deque<core::GridPos> frontier{from};
    came_from.emplace(from, from);

    while (!frontier.empty()) {
        core::GridPos current = frontier.front();
        frontier.pop_front();
        if (current == to) {
            break;
        }
        for (core::EdgeDirection step : STEPS) {
            core::GridPos next = core::neighbor(current, step);
            if (came_from.contains(next) || !can_enter(next, constraints)) {
                continue;
            }
            if (world_.movement_blocked(current, next, constraints.may_pass_gates)) {
                continue;
            }
            came_from.emplace(next, current);
            frontier.push_back(next);
        }
    }

    if (!came_from.contains(to)) {
        return std::nullopt;
    }

    std::vector<core::GridPos> cells;
    for (core::GridPos pos = to; pos != from; pos = came_from.at(pos)) {
        cells.push_back(pos);
    }
    std::reverse(cells.begin(), cells.end());
    return cells;
}

std::vector<core::GridPos>
GridPathService::nearby_walkable(core::GridPos from, int32_t radius) const {
    std::vector<core::GridPos> walkable;
    std::vector<core::GridPos> paths;
    for (int32_t dy = -radius; dy <= radius; ++dy) {
        for (int32_t dx = -radius; dx <= radius; ++dx) {
            core::GridPos pos{from.x + dx, from.y + dy};
            if (pos == from || !world_.is_walkable(pos)) {
                continue;
            }
            walkable.push_back(pos);
            if (world_.has_path(pos)) {
                paths.push_back(pos);
            }
        }
    }
    return paths.empty() ? walkable : paths;
}

} // namespace staffsim::algo
