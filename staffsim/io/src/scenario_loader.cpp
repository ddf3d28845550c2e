#include <staffsim/io/scenario_loader.hpp>
#include <staffsim/io/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>

namespace staffsim::io {

namespace {

using namespace staffsim::core;
using algo::JobKind;

const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name,
                                   const std::string& context) {
    if (!obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", context);
    }
    return obj[name];
}

double get_double(const rapidjson::Value& obj, const char* name, const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsNumber()) {
        throw LoaderError(std::string("field '") + name + "' must be a number", context);
    }
    return member.GetDouble();
}

uint64_t get_uint64(const rapidjson::Value& obj, const char* name, const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsUint64()) {
        throw LoaderError(std::string("field '") + name + "' must be a non-negative integer",
                          context);
    }
    return member.GetUint64();
}

std::string get_string(const rapidjson::Value& obj, const char* name, const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", context);
    }
    return {member.GetString(), member.GetStringLength()};
}

// Optional array: absent is empty, present must be an array.
const rapidjson::Value* find_array(const rapidjson::Value& obj, const char* name,
                                   const std::string& context) {
    if (!obj.HasMember(name)) {
        return nullptr;
    }
    const auto& member = obj[name];
    if (!member.IsArray()) {
        throw LoaderError(std::string("field '") + name + "' must be an array", context);
    }
    return &member;
}

const rapidjson::Value* find_object(const rapidjson::Value& obj, const char* name,
                                    const std::string& context) {
    if (!obj.HasMember(name)) {
        return nullptr;
    }
    const auto& member = obj[name];
    if (!member.IsObject()) {
        throw LoaderError(std::string("field '") + name + "' must be an object", context);
    }
    return &member;
}

std::optional<double> find_double(const rapidjson::Value& obj, const char* name,
                                  const std::string& context) {
    if (!obj.HasMember(name)) {
        return std::nullopt;
    }
    return get_double(obj, name, context);
}

std::optional<Duration> find_duration(const rapidjson::Value& obj, const char* name,
                                      const std::string& context, bool allow_zero) {
    auto seconds = find_double(obj, name, context);
    if (!seconds) {
        return std::nullopt;
    }
    if (*seconds < 0.0 || (!allow_zero && *seconds == 0.0)) {
        throw LoaderError(std::string("field '") + name +
                              (allow_zero ? "' must not be negative" : "' must be positive"),
                          context);
    }
    return duration_from_seconds(*seconds);
}

std::string element_context(const char* array, rapidjson::SizeType idx) {
    return std::string(array) + "[" + std::to_string(idx) + "]";
}

GridPos parse_pos(const rapidjson::Value& val, const std::string& context) {
    if (!val.IsArray() || val.Size() != 2 || !val[0].IsInt() || !val[1].IsInt()) {
        throw LoaderError("position must be an [x, y] pair of integers", context);
    }
    return GridPos{val[0].GetInt(), val[1].GetInt()};
}

GridPos get_pos(const rapidjson::Value& obj, const char* name, const std::string& context) {
    return parse_pos(get_member(obj, name, context), context + "." + name);
}

std::vector<GridPos> parse_pos_list(const rapidjson::Value& obj, const char* name,
                                    const std::string& context) {
    std::vector<GridPos> result;
    if (const auto* arr = find_array(obj, name, context)) {
        for (rapidjson::SizeType idx = 0; idx < arr->Size(); ++idx) {
            result.push_back(parse_pos((*arr)[idx], element_context(name, idx)));
        }
    }
    return result;
}

// Looks a name up with one of the parse_* helpers and reports it otherwise.
template<typename Parser>
auto get_named(const rapidjson::Value& obj, const char* name, const std::string& context,
               Parser parse) {
    std::string text = get_string(obj, name, context);
    auto parsed = parse(text);
    if (!parsed) {
        throw LoaderError(std::string("unknown ") + name + " '" + text + "'", context);
    }
    return *parsed;
}

void parse_world(ScenarioData& result, const rapidjson::Value& doc) {
    const std::string ctx = "world";
    const auto& world = get_member(doc, "world", "scenario");
    if (!world.IsObject()) {
        throw LoaderError("field 'world' must be an object", "scenario");
    }
    uint64_t width = get_uint64(world, "width", ctx);
    uint64_t height = get_uint64(world, "height", ctx);
    if (width == 0 || height == 0 || width > INT32_MAX || height > INT32_MAX) {
        throw LoaderError("width and height must be positive", ctx);
    }
    result.world.width = static_cast<int32_t>(width);
    result.world.height = static_cast<int32_t>(height);
    result.world.water = parse_pos_list(world, "water", ctx);
    result.world.paths = parse_pos_list(world, "paths", ctx);
}

void parse_zones(ScenarioData& result, const rapidjson::Value& doc) {
    const auto* zones = find_array(doc, "zones", "scenario");
    if (!zones) {
        return;
    }
    for (rapidjson::SizeType idx = 0; idx < zones->Size(); ++idx) {
        const auto& obj = (*zones)[idx];
        std::string ctx = element_context("zones", idx);

        ZoneParams zone;
        zone.id = get_uint64(obj, "id", ctx);
        zone.name = obj.HasMember("name") ? get_string(obj, "name", ctx)
                                          : "zone " + std::to_string(zone.id);
        zone.min = get_pos(obj, "min", ctx);
        zone.max = get_pos(obj, "max", ctx);
        if (zone.min.x > zone.max.x || zone.min.y > zone.max.y) {
            throw LoaderError("min must not exceed max", ctx);
        }
        if (obj.HasMember("condition")) {
            zone.condition = get_named(obj, "condition", ctx, parse_fence_condition);
        }
        if (const auto* gate = find_object(obj, "gate", ctx)) {
            std::string gctx = ctx + ".gate";
            zone.gate = Fence{
                .tile = get_pos(*gate, "tile", gctx),
                .edge = get_named(*gate, "edge", gctx, parse_edge_direction),
                .condition = zone.condition,
                .gate = true,
            };
        }
        result.zones.push_back(std::move(zone));
    }
}

void parse_fences(ScenarioData& result, const rapidjson::Value& doc) {
    const auto* fences = find_array(doc, "fences", "scenario");
    if (!fences) {
        return;
    }
    for (rapidjson::SizeType idx = 0; idx < fences->Size(); ++idx) {
        const auto& obj = (*fences)[idx];
        std::string ctx = element_context("fences", idx);

        FenceParams fence;
        fence.tile = get_pos(obj, "tile", ctx);
        fence.edge = get_named(obj, "edge", ctx, parse_edge_direction);
        if (obj.HasMember("condition")) {
            fence.condition = get_named(obj, "condition", ctx, parse_fence_condition);
        }
        if (obj.HasMember("gate")) {
            if (!obj["gate"].IsBool()) {
                throw LoaderError("field 'gate' must be a boolean", ctx);
            }
            fence.gate = obj["gate"].GetBool();
        }
        result.fences.push_back(fence);
    }
}

void parse_animals(ScenarioData& result, const rapidjson::Value& doc) {
    const auto* animals = find_array(doc, "animals", "scenario");
    if (!animals) {
        return;
    }
    for (rapidjson::SizeType idx = 0; idx < animals->Size(); ++idx) {
        const auto& obj = (*animals)[idx];
        std::string ctx = element_context("animals", idx);

        AnimalParams animal;
        animal.zone = get_uint64(obj, "zone", ctx);
        animal.food = get_named(obj, "food", ctx, parse_food_type);
        animal.hunger = find_double(obj, "hunger", ctx).value_or(animal.hunger);
        if (animal.hunger < 0.0 || animal.hunger > 100.0) {
            throw LoaderError("hunger must be in [0, 100]", ctx);
        }
        animal.hunger_decay = find_double(obj, "decay", ctx).value_or(animal.hunger_decay);
        if (animal.hunger_decay < 0.0) {
            throw LoaderError("decay must not be negative", ctx);
        }
        result.animals.push_back(animal);
    }
}

void parse_bins(ScenarioData& result, const rapidjson::Value& doc) {
    const auto* bins = find_array(doc, "bins", "scenario");
    if (!bins) {
        return;
    }
    for (rapidjson::SizeType idx = 0; idx < bins->Size(); ++idx) {
        const auto& obj = (*bins)[idx];
        std::string ctx = element_context("bins", idx);

        BinParams bin;
        bin.tile = get_pos(obj, "tile", ctx);
        bin.capacity = find_double(obj, "capacity", ctx).value_or(bin.capacity);
        bin.fill = find_double(obj, "fill", ctx).value_or(bin.fill);
        bin.fill_rate = find_double(obj, "fill_rate", ctx).value_or(bin.fill_rate);
        if (bin.capacity <= 0.0) {
            throw LoaderError("capacity must be positive", ctx);
        }
        if (bin.fill < 0.0 || bin.fill > bin.capacity) {
            throw LoaderError("fill must be in [0, capacity]", ctx);
        }
        if (bin.fill_rate < 0.0) {
            throw LoaderError("fill_rate must not be negative", ctx);
        }
        result.bins.push_back(bin);
    }
}

std::vector<JobKind> parse_kinds(const rapidjson::Value& arr, const std::string& context) {
    std::vector<JobKind> kinds;
    for (rapidjson::SizeType idx = 0; idx < arr.Size(); ++idx) {
        const auto& val = arr[idx];
        if (!val.IsString()) {
            throw LoaderError("kinds must be strings", context);
        }
        auto kind = algo::parse_job_kind({val.GetString(), val.GetStringLength()});
        if (!kind) {
            throw LoaderError(std::string("unknown kind '") + val.GetString() + "'", context);
        }
        kinds.push_back(*kind);
    }
    return kinds;
}

void parse_staff(ScenarioData& result, const rapidjson::Value& doc) {
    const auto* staff = find_array(doc, "staff", "scenario");
    if (!staff) {
        return;
    }
    for (rapidjson::SizeType idx = 0; idx < staff->Size(); ++idx) {
        const auto& obj = (*staff)[idx];
        std::string ctx = element_context("staff", idx);

        StaffParams member;
        member.role = get_named(obj, "role", ctx, algo::parse_role);
        member.position = get_pos(obj, "position", ctx);
        if (const auto* zones = find_array(obj, "zones", ctx)) {
            for (rapidjson::SizeType zidx = 0; zidx < zones->Size(); ++zidx) {
                if (!(*zones)[zidx].IsUint64()) {
                    throw LoaderError("zone ids must be non-negative integers", ctx);
                }
                member.zones.push_back((*zones)[zidx].GetUint64());
            }
        }
        if (const auto* kinds = find_array(obj, "kinds", ctx)) {
            member.kinds = parse_kinds(*kinds, ctx);
            for (JobKind kind : *member.kinds) {
                if (algo::role_for(kind) != member.role) {
                    throw LoaderError(std::string("kind '") + std::string(algo::to_string(kind)) +
                                          "' does not belong to role '" +
                                          std::string(algo::to_string(member.role)) + "'",
                                      ctx);
                }
            }
        }
        result.staff.push_back(std::move(member));
    }
}

algo::JobPayload parse_payload(JobKind kind, const rapidjson::Value& obj, const std::string& ctx) {
    switch (kind) {
    case JobKind::FeedAnimals:
        return algo::FeedAnimalsPayload{
            .food = get_named(obj, "food", ctx, parse_food_type),
            .animal_id = obj.HasMember("animal") ? get_uint64(obj, "animal", ctx) : 0,
        };
    case JobKind::CleanWaste:
        return algo::CleanWastePayload{.tile = get_pos(obj, "tile", ctx)};
    case JobKind::RepairFence:
        return algo::RepairFencePayload{
            .tile = get_pos(obj, "tile", ctx),
            .edge = get_named(obj, "edge", ctx, parse_edge_direction),
        };
    case JobKind::ClearLitter:
        return algo::ClearLitterPayload{.tile = get_pos(obj, "tile", ctx)};
    case JobKind::EmptyBin:
        return algo::EmptyBinPayload{.bin_id = get_uint64(obj, "bin", ctx)};
    }
    throw LoaderError("unhandled kind", ctx);
}

void parse_jobs(ScenarioData& result, const rapidjson::Value& doc) {
    const auto* jobs = find_array(doc, "jobs", "scenario");
    if (!jobs) {
        return;
    }
    for (rapidjson::SizeType idx = 0; idx < jobs->Size(); ++idx) {
        const auto& obj = (*jobs)[idx];
        std::string ctx = element_context("jobs", idx);

        JobKind kind = get_named(obj, "kind", ctx, algo::parse_job_kind);

        algo::JobInput input;
        input.payload = parse_payload(kind, obj, ctx);
        if (obj.HasMember("target")) {
            input.target = get_pos(obj, "target", ctx);
        } else if (obj.HasMember("tile")) {
            input.target = get_pos(obj, "tile", ctx);
        } else {
            throw LoaderError("missing required field 'target'", ctx);
        }
        if (obj.HasMember("priority")) {
            uint64_t priority = get_uint64(obj, "priority", ctx);
            if (priority > static_cast<uint64_t>(algo::Priority::LOW)) {
                throw LoaderError("priority must be 0, 1 or 2", ctx);
            }
            input.priority = static_cast<int>(priority);
        }
        if (obj.HasMember("zone")) {
            input.zone = get_uint64(obj, "zone", ctx);
        }
        if (obj.HasMember("max_retries")) {
            uint64_t retries = get_uint64(obj, "max_retries", ctx);
            if (retries == 0 || retries > UINT32_MAX) {
                throw LoaderError("max_retries must be positive", ctx);
            }
            input.max_retries = static_cast<uint32_t>(retries);
        }
        result.jobs.push_back(std::move(input));
    }
}

void parse_worker_overrides(WorkerOverrides& overrides, const rapidjson::Value& obj) {
    const std::string ctx = "config.worker";
    overrides.poll_interval = find_duration(obj, "poll_interval", ctx, false);
    overrides.wander_interval = find_duration(obj, "wander_interval", ctx, false);
    overrides.stuck_timeout = find_duration(obj, "stuck_timeout", ctx, false);
    overrides.unreachable_ttl = find_duration(obj, "unreachable_ttl", ctx, true);
    overrides.speed = find_double(obj, "speed", ctx);
    if (overrides.speed && *overrides.speed <= 0.0) {
        throw LoaderError("speed must be positive", ctx);
    }
    if (obj.HasMember("wander_radius")) {
        uint64_t radius = get_uint64(obj, "wander_radius", ctx);
        if (radius == 0 || radius > INT32_MAX) {
            throw LoaderError("wander_radius must be positive", ctx);
        }
        overrides.wander_radius = static_cast<int32_t>(radius);
    }
}

void parse_config(ScenarioData& result, const rapidjson::Value& doc) {
    const auto* config = find_object(doc, "config", "scenario");
    if (!config) {
        return;
    }
    const std::string ctx = "config";
    RunConfig& run = result.config;

    if (auto tick = find_duration(*config, "tick", ctx, false)) {
        run.tick = *tick;
    }
    run.duration = find_duration(*config, "duration", ctx, false);
    if (auto interval = find_duration(*config, "producer_interval", ctx, false)) {
        run.simulation.producer_interval = *interval;
    }
    if (auto latency = find_duration(*config, "path_latency", ctx, true)) {
        run.simulation.path_latency = *latency;
    }
    if (auto food = find_double(*config, "food_per_feeding", ctx)) {
        if (*food <= 0.0) {
            throw LoaderError("food_per_feeding must be positive", ctx);
        }
        run.simulation.food_per_feeding = *food;
    }
    if (config->HasMember("max_retries")) {
        uint64_t retries = get_uint64(*config, "max_retries", ctx);
        if (retries == 0 || retries > UINT32_MAX) {
            throw LoaderError("max_retries must be positive", ctx);
        }
        run.simulation.max_retries = static_cast<uint32_t>(retries);
    }
    if (config->HasMember("producers")) {
        if (!(*config)["producers"].IsBool()) {
            throw LoaderError("field 'producers' must be a boolean", ctx);
        }
        run.producers = (*config)["producers"].GetBool();
    }
    if (const auto* worker = find_object(*config, "worker", ctx)) {
        parse_worker_overrides(run.worker, *worker);
    }
}

void parse_scenario_impl(ScenarioData& result, const rapidjson::Document& doc) {
    parse_world(result, doc);
    parse_zones(result, doc);
    parse_fences(result, doc);
    parse_animals(result, doc);
    result.waste = parse_pos_list(doc, "waste", "scenario");
    result.litter = parse_pos_list(doc, "litter", "scenario");
    parse_bins(result, doc);
    parse_staff(result, doc);
    parse_jobs(result, doc);
    parse_config(result, doc);
}

} // anonymous namespace

algo::WorkerConfig WorkerOverrides::apply(algo::WorkerConfig base) const {
    if (poll_interval) {
        base.poll_interval = *poll_interval;
    }
    if (wander_interval) {
        base.wander_interval = *wander_interval;
    }
    if (stuck_timeout) {
        base.stuck_timeout = *stuck_timeout;
    }
    if (unreachable_ttl) {
        base.unreachable_ttl = *unreachable_ttl;
    }
    if (speed) {
        base.speed = *speed;
    }
    if (wander_radius) {
        base.wander_radius = *wander_radius;
    }
    return base;
}

ScenarioData load_scenario(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_scenario_from_string(oss.str());
}

ScenarioData load_scenario_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "scenario");
    }

    ScenarioData result;
    parse_scenario_impl(result, doc);
    return result;
}

} // namespace staffsim::io
