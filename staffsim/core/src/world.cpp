#include <staffsim/core/world.hpp>
#include <staffsim/core/error.hpp>

#include <algorithm>
#include <utility>

namespace staffsim::core {

namespace {

// Animals start eating below this hunger level.
constexpr double EAT_THRESHOLD = 50.0;
// Food units an animal eats per second and hunger restored per unit.
constexpr double EAT_RATE = 25.0;
constexpr double HUNGER_PER_FOOD = 0.4;

std::string pos_string(GridPos pos) {
    return "(" + std::to_string(pos.x) + ", " + std::to_string(pos.y) + ")";
}

} // anonymous namespace

GridPos neighbor(GridPos pos, EdgeDirection edge) noexcept {
    switch (edge) {
    case EdgeDirection::North: return GridPos{pos.x, pos.y - 1};
    case EdgeDirection::South: return GridPos{pos.x, pos.y + 1};
    case EdgeDirection::East:  return GridPos{pos.x + 1, pos.y};
    case EdgeDirection::West:  return GridPos{pos.x - 1, pos.y};
    }
    return pos;
}

EdgeDirection opposite(EdgeDirection edge) noexcept {
    switch (edge) {
    case EdgeDirection::North: return EdgeDirection::South;
    case EdgeDirection::South: return EdgeDirection::North;
    case EdgeDirection::East:  return EdgeDirection::West;
    case EdgeDirection::West:  return EdgeDirection::East;
    }
    return edge;
}

std::string_view to_string(EdgeDirection edge) noexcept {
    switch (edge) {
    case EdgeDirection::North: return "north";
    case EdgeDirection::South: return "south";
    case EdgeDirection::East:  return "east";
    case EdgeDirection::West:  return "west";
    }
    return "unknown";
}

std::string_view to_string(FenceCondition condition) noexcept {
    switch (condition) {
    case FenceCondition::Good:        return "good";
    case FenceCondition::LightDamage: return "light_damage";
    case FenceCondition::Damaged:     return "damaged";
    case FenceCondition::Failed:      return "failed";
    }
    return "unknown";
}

std::string_view to_string(FoodType food) noexcept {
    switch (food) {
    case FoodType::Meat:       return "meat";
    case FoodType::Vegetables: return "vegetables";
    case FoodType::Fruit:      return "fruit";
    case FoodType::Hay:        return "hay";
    }
    return "unknown";
}

std::optional<EdgeDirection> parse_edge_direction(std::string_view name) noexcept {
    for (auto edge : {EdgeDirection::North, EdgeDirection::South,
                      EdgeDirection::East, EdgeDirection::West}) {
        if (to_string(edge) == name) {
            return edge;
        }
    }
    return std::nullopt;
}

std::optional<FenceCondition> parse_fence_condition(std::string_view name) noexcept {
    for (auto condition : {FenceCondition::Good, FenceCondition::LightDamage,
                           FenceCondition::Damaged, FenceCondition::Failed}) {
        if (to_string(condition) == name) {
            return condition;
        }
    }
    return std::nullopt;
}

std::optional<FoodType> parse_food_type(std::string_view name) noexcept {
    for (auto food : {FoodType::Meat, FoodType::Vegetables, FoodType::Fruit, FoodType::Hay}) {
        if (to_string(food) == name) {
            return food;
        }
    }
    return std::nullopt;
}

World::World(int32_t width, int32_t height)
    : width_(width)
    , height_(height) {
    if (width <= 0 || height <= 0) {
        throw OutOfRangeError("World dimensions must be positive");
    }
    auto cells = static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    terrain_.assign(cells, Terrain::Grass);
    paths_.assign(cells, false);
}

bool World::contains(GridPos pos) const noexcept {
    return pos.x >= 0 && pos.y >= 0 && pos.x < width_ && pos.y < height_;
}

std::size_t World::index(GridPos pos) const {
    check_tile(pos);
    return static_cast<std::size_t>(pos.y) * static_cast<std::size_t>(width_)
         + static_cast<std::size_t>(pos.x);
}

void World::check_tile(GridPos pos) const {
    if (!contains(pos)) {
        throw OutOfRangeError("Tile " + pos_string(pos) + " is outside the world");
    }
}

void World::set_terrain(GridPos pos, Terrain terrain) {
    terrain_[index(pos)] = terrain;
}

Terrain World::terrain(GridPos pos) const {
    return terrain_[index(pos)];
}

void World::set_path(GridPos pos, bool path) {
    paths_[index(pos)] = path;
}

bool World::has_path(GridPos pos) const {
    return paths_[index(pos)];
}

bool World::is_walkable(GridPos pos) const noexcept {
    return contains(pos) && terrain_[index(pos)] != Terrain::Water;
}

World::FenceKey World::canonical(GridPos tile, EdgeDirection edge) noexcept {
    if (edge == EdgeDirection::South || edge == EdgeDirection::East) {
        return FenceKey{neighbor(tile, edge), opposite(edge)};
    }
    return FenceKey{tile, edge};
}

void World::set_fence(GridPos tile, EdgeDirection edge, FenceCondition condition, bool gate) {
    if (!contains(tile)) {
        throw OutOfRangeError("Fence tile " + pos_string(tile) + " is outside the world");
    }
    fences_[canonical(tile, edge)] = Fence{tile, edge, condition, gate};
}

void World::remove_fence(GridPos tile, EdgeDirection edge) {
    fences_.erase(canonical(tile, edge));
}

const Fence* World::fence(GridPos tile, EdgeDirection edge) const {
    auto it = fences_.find(canonical(tile, edge));
    return (it != fences_.end()) ? &it->second : nullptr;
}

void World::set_fence_condition(GridPos tile, EdgeDirection edge, FenceCondition condition) {
    auto it = fences_.find(canonical(tile, edge));
    if (it == fences_.end()) {
        throw OutOfRangeError("No fence on the " + std::string(to_string(edge))
                              + " edge of " + pos_string(tile));
    }
    it->second.condition = condition;
}

std::vector<Fence> World::fences() const {
    std::vector<Fence> result;
    result.reserve(fences_.size());
    for (const auto& [key, fence] : fences_) {
        result.push_back(fence);
    }
    return result;
}

bool World::movement_blocked(GridPos from, GridPos to, bool may_pass_gates) const {
    for (auto edge : {EdgeDirection::North, EdgeDirection::South,
                      EdgeDirection::East, EdgeDirection::West}) {
        if (neighbor(from, edge) != to) {
            continue;
        }
        const Fence* f = fence(from, edge);
        if (f == nullptr) {
            return false;
        }
        return !(f->gate && may_pass_gates);
    }
    // Not orthogonally adjacent
    return true;
}

const Zone& World::add_zone(ZoneId id, std::string name, GridPos min, GridPos max,
                            FenceCondition condition, std::optional<Fence> gate) {
    if (zones_.count(id) != 0U) {
        throw OutOfRangeError("Zone " + std::to_string(id) + " already exists");
    }
    if (!contains(min) || !contains(max) || min.x > max.x || min.y > max.y) {
        throw OutOfRangeError("Zone " + std::to_string(id) + " rectangle is outside the world");
    }

    for (int32_t x = min.x; x <= max.x; ++x) {
        set_fence(GridPos{x, min.y}, EdgeDirection::North, condition);
        set_fence(GridPos{x, max.y}, EdgeDirection::South, condition);
    }
    for (int32_t y = min.y; y <= max.y; ++y) {
        set_fence(GridPos{min.x, y}, EdgeDirection::West, condition);
        set_fence(GridPos{max.x, y}, EdgeDirection::East, condition);
    }
    if (gate) {
        set_fence(gate->tile, gate->edge, gate->condition, true);
    }

    auto [it, inserted] = zones_.emplace(id, Zone{id, std::move(name), min, max});
    return it->second;
}

bool World::remove_zone(ZoneId id) {
    if (zones_.erase(id) == 0U) {
        return false;
    }
    std::erase_if(animals_, [id](const auto& entry) { return entry.second.zone == id; });
    return true;
}

const Zone* World::find_zone(ZoneId id) const {
    auto it = zones_.find(id);
    return (it != zones_.end()) ? &it->second : nullptr;
}

std::optional<ZoneId> World::zone_at(GridPos pos) const {
    for (const auto& [id, zone] : zones_) {
        if (zone.contains(pos)) {
            return id;
        }
    }
    return std::nullopt;
}

std::vector<ZoneId> World::zone_ids() const {
    std::vector<ZoneId> ids;
    ids.reserve(zones_.size());
    for (const auto& [id, zone] : zones_) {
        ids.push_back(id);
    }
    return ids;
}

uint64_t World::add_animal(ZoneId zone, FoodType preferred, double hunger, double hunger_decay) {
    if (zones_.count(zone) == 0U) {
        throw OutOfRangeError("Cannot add animal to unknown zone " + std::to_string(zone));
    }
    uint64_t id = next_animal_id_++;
    animals_.emplace(id, Animal{id, zone, preferred, std::clamp(hunger, 0.0, 100.0), hunger_decay});
    return id;
}

std::vector<const Animal*> World::animals_in_zone(ZoneId zone) const {
    std::vector<const Animal*> result;
    for (const auto& [id, animal] : animals_) {
        if (animal.zone == zone) {
            result.push_back(&animal);
        }
    }
    return result;
}

Animal& World::animal_mut(uint64_t id) {
    auto it = animals_.find(id);
    if (it == animals_.end()) {
        throw OutOfRangeError("Unknown animal " + std::to_string(id));
    }
    return it->second;
}

const Animal& World::animal(uint64_t id) const {
    auto it = animals_.find(id);
    if (it == animals_.end()) {
        throw OutOfRangeError("Unknown animal " + std::to_string(id));
    }
    return it->second;
}

void World::set_animal_hunger(uint64_t id, double hunger) {
    animal_mut(id).hunger = std::clamp(hunger, 0.0, 100.0);
}

void World::add_food(GridPos pos, FoodType type, double amount) {
    if (!contains(pos)) {
        throw OutOfRangeError("Food tile " + pos_string(pos) + " is outside the world");
    }
    auto [it, inserted] = food_.try_emplace(pos, FoodPile{type, 0.0});
    it->second.amount += amount;
}

double World::food_at(GridPos pos) const {
    auto it = food_.find(pos);
    return (it != food_.end()) ? it->second.amount : 0.0;
}

double World::food_in_zone(ZoneId zone) const {
    const Zone* z = find_zone(zone);
    if (z == nullptr) {
        return 0.0;
    }
    double total = 0.0;
    for (const auto& [pos, pile] : food_) {
        if (z->contains(pos)) {
            total += pile.amount;
        }
    }
    return total;
}

void World::add_waste(GridPos pos) {
    check_tile(pos);
    waste_.insert(pos);
}

bool World::clear_waste(GridPos pos) {
    return waste_.erase(pos) != 0U;
}

void World::add_litter(GridPos pos) {
    check_tile(pos);
    litter_.insert(pos);
}

bool World::clear_litter(GridPos pos) {
    return litter_.erase(pos) != 0U;
}

uint64_t World::add_bin(GridPos tile, double capacity, double fill_rate, double fill) {
    check_tile(tile);
    if (!(capacity > 0.0)) {
        throw OutOfRangeError("Bin capacity must be positive");
    }
    uint64_t id = next_bin_id_++;
    bins_.emplace(id, Bin{id, tile, std::clamp(fill, 0.0, capacity), capacity, fill_rate});
    return id;
}

Bin& World::bin_mut(uint64_t id) {
    auto it = bins_.find(id);
    if (it == bins_.end()) {
        throw OutOfRangeError("Unknown bin " + std::to_string(id));
    }
    return it->second;
}

const Bin& World::bin(uint64_t id) const {
    auto it = bins_.find(id);
    if (it == bins_.end()) {
        throw OutOfRangeError("Unknown bin " + std::to_string(id));
    }
    return it->second;
}

void World::empty_bin(uint64_t id) {
    bin_mut(id).fill = 0.0;
}

std::vector<const Bin*> World::bins() const {
    std::vector<const Bin*> result;
    result.reserve(bins_.size());
    for (const auto& [id, b] : bins_) {
        result.push_back(&b);
    }
    return result;
}

void World::advance(Duration dt) {
    double seconds = duration_to_seconds(dt);

    for (auto& [id, animal] : animals_) {
        animal.hunger = std::max(0.0, animal.hunger - animal.hunger_decay * seconds);
        if (animal.hunger >= EAT_THRESHOLD) {
            continue;
        }

        const Zone* zone = find_zone(animal.zone);
        if (zone == nullptr) {
            continue;
        }
        double appetite = EAT_RATE * seconds;
        for (auto& [pos, pile] : food_) {
            if (appetite <= 0.0) {
                break;
            }
            if (!zone->contains(pos) || pile.amount <= 0.0) {
                continue;
            }
            double eaten = std::min(pile.amount, appetite);
            pile.amount -= eaten;
            appetite -= eaten;
            animal.hunger = std::min(100.0, animal.hunger + eaten * HUNGER_PER_FOOD);
        }
    }
    std::erase_if(food_, [](const auto& entry) { return entry.second.amount <= 0.0; });

    for (auto& [id, b] : bins_) {
        b.fill = std::min(b.capacity, b.fill + b.fill_rate * seconds);
    }
}

} // namespace staffsim::core
