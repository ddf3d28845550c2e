#pragma once

#include <staffsim/core/types.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace staffsim::core {

/// @brief Identifier of a zone (an exhibit).
/// @ingroup core_world
using ZoneId = uint64_t;

/// @brief Ground type of a tile. Water is never walkable.
/// @ingroup core_world
enum class Terrain { Grass, Water };

/// @brief Side of a tile a fence runs along.
/// @ingroup core_world
enum class EdgeDirection { North, South, East, West };

/// @brief Wear level of a fence; anything but Good needs repair.
/// @ingroup core_world
enum class FenceCondition { Good, LightDamage, Damaged, Failed };

/// @brief Food an animal eats and a zookeeper places.
/// @ingroup core_world
enum class FoodType { Meat, Vegetables, Fruit, Hay };

/// @brief Tile adjacent to @p pos across @p edge (north is -y).
[[nodiscard]] GridPos neighbor(GridPos pos, EdgeDirection edge) noexcept;

/// @brief The same edge seen from the neighbouring tile.
[[nodiscard]] EdgeDirection opposite(EdgeDirection edge) noexcept;

/// @name Name conversions
/// Lower-case snake names used by scenario files and traces.
/// The parsers return std::nullopt for unknown names.
/// @{
[[nodiscard]] std::string_view to_string(EdgeDirection edge) noexcept;
[[nodiscard]] std::string_view to_string(FenceCondition condition) noexcept;
[[nodiscard]] std::string_view to_string(FoodType food) noexcept;
[[nodiscard]] std::optional<EdgeDirection> parse_edge_direction(std::string_view name) noexcept;
[[nodiscard]] std::optional<FenceCondition> parse_fence_condition(std::string_view name) noexcept;
[[nodiscard]] std::optional<FoodType> parse_food_type(std::string_view name) noexcept;
/// @}

/// @brief A fence segment along one tile edge.
/// @ingroup core_world
struct Fence {
    GridPos tile;               ///< Tile the fence was placed on.
    EdgeDirection edge;         ///< Edge of @ref tile it runs along.
    FenceCondition condition{FenceCondition::Good};
    bool gate{false};           ///< Gates let staff through.
};

/// @brief A rectangular fenced region (an exhibit).
/// @ingroup core_world
struct Zone {
    ZoneId id;
    std::string name;
    GridPos min;                ///< Inclusive top-left corner.
    GridPos max;                ///< Inclusive bottom-right corner.

    /// @brief True if @p pos lies inside the rectangle.
    [[nodiscard]] bool contains(GridPos pos) const noexcept {
        return pos.x >= min.x && pos.x <= max.x && pos.y >= min.y && pos.y <= max.y;
    }
};

/// @brief An animal living in a zone; hunger runs from 100 (fed) to 0.
/// @ingroup core_world
struct Animal {
    uint64_t id;
    ZoneId zone;
    FoodType preferred_food{FoodType::Meat};
    double hunger{100.0};
    double hunger_decay{0.5};   ///< Hunger lost per second.
};

/// @brief Food placed on a tile.
/// @ingroup core_world
struct FoodPile {
    FoodType type;
    double amount;
};

/// @brief A garbage bin that fills over time.
/// @ingroup core_world
struct Bin {
    uint64_t id;
    GridPos tile;
    double fill{0.0};
    double capacity{100.0};
    double fill_rate{0.0};      ///< Fill units gained per second.
};

/// @brief Minimal tile world the staff operate in.
///
/// Owns the grid (terrain and path tiles), fences, zones, animals, food
/// piles, waste markers, litter and bins. The job producers read it, the
/// path service walks it and job effects mutate it through plain setters.
/// Nothing here knows about jobs or workers.
///
/// Fences are stored under a canonical key, so the south edge of (x, y)
/// and the north edge of (x, y + 1) are the same fence.
///
/// @ingroup core_world
class World {
public:
    /// @brief Create an all-grass world.
    /// @throws OutOfRangeError if either dimension is not positive.
    World(int32_t width, int32_t height);

    [[nodiscard]] int32_t width() const noexcept { return width_; }
    [[nodiscard]] int32_t height() const noexcept { return height_; }

    /// @brief True if @p pos is inside the grid.
    [[nodiscard]] bool contains(GridPos pos) const noexcept;

    /// @name Tiles
    /// @{
    void set_terrain(GridPos pos, Terrain terrain);
    [[nodiscard]] Terrain terrain(GridPos pos) const;
    void set_path(GridPos pos, bool path);
    [[nodiscard]] bool has_path(GridPos pos) const;
    /// @brief Inside the grid and not water.
    [[nodiscard]] bool is_walkable(GridPos pos) const noexcept;
    /// @}

    /// @name Fences
    /// @{
    void set_fence(GridPos tile, EdgeDirection edge, FenceCondition condition, bool gate = false);
    void remove_fence(GridPos tile, EdgeDirection edge);
    [[nodiscard]] const Fence* fence(GridPos tile, EdgeDirection edge) const;
    /// @throws OutOfRangeError if no fence runs along that edge.
    void set_fence_condition(GridPos tile, EdgeDirection edge, FenceCondition condition);
    [[nodiscard]] std::vector<Fence> fences() const;

    /// @brief True if a step between two orthogonally adjacent tiles crosses
    ///        a fence the walker may not pass.
    [[nodiscard]] bool movement_blocked(GridPos from, GridPos to, bool may_pass_gates) const;
    /// @}

    /// @name Zones
    /// @{

    /// @brief Add a zone and fence its perimeter.
    /// @param gate Perimeter edge turned into a gate, if any.
    /// @throws OutOfRangeError if the id is taken or the rectangle leaves the grid.
    const Zone& add_zone(ZoneId id, std::string name, GridPos min, GridPos max,
                         FenceCondition condition = FenceCondition::Good,
                         std::optional<Fence> gate = std::nullopt);

    /// @brief Drop a zone together with its animals. Fences stay standing.
    /// @return False if the zone did not exist.
    bool remove_zone(ZoneId id);

    [[nodiscard]] const Zone* find_zone(ZoneId id) const;
    [[nodiscard]] std::optional<ZoneId> zone_at(GridPos pos) const;
    [[nodiscard]] std::vector<ZoneId> zone_ids() const;
    /// @}

    /// @name Animals and food
    /// @{

    /// @throws OutOfRangeError if the zone does not exist.
    uint64_t add_animal(ZoneId zone, FoodType preferred, double hunger = 100.0,
                        double hunger_decay = 0.5);
    [[nodiscard]] std::vector<const Animal*> animals_in_zone(ZoneId zone) const;
    [[nodiscard]] const Animal& animal(uint64_t id) const;
    void set_animal_hunger(uint64_t id, double hunger);

    void add_food(GridPos pos, FoodType type, double amount);
    [[nodiscard]] double food_at(GridPos pos) const;
    [[nodiscard]] double food_in_zone(ZoneId zone) const;
    /// @}

    /// @name Sanitation
    /// @{
    void add_waste(GridPos pos);
    bool clear_waste(GridPos pos);
    [[nodiscard]] const std::set<GridPos>& waste() const noexcept { return waste_; }

    void add_litter(GridPos pos);
    bool clear_litter(GridPos pos);
    [[nodiscard]] const std::set<GridPos>& litter() const noexcept { return litter_; }

    /// @throws OutOfRangeError if the tile is off the grid or capacity is not positive.
    uint64_t add_bin(GridPos tile, double capacity, double fill_rate = 0.0, double fill = 0.0);
    [[nodiscard]] const Bin& bin(uint64_t id) const;
    void empty_bin(uint64_t id);
    [[nodiscard]] std::vector<const Bin*> bins() const;
    /// @}

    /// @brief Advance world processes by @p dt: hunger decay, animals eating
    ///        food in their zone, bins filling up.
    void advance(Duration dt);

private:
    struct FenceKey {
        GridPos tile;
        EdgeDirection edge;
        auto operator<=>(const FenceKey&) const = default;
    };

    static FenceKey canonical(GridPos tile, EdgeDirection edge) noexcept;
    void check_tile(GridPos pos) const;
    [[nodiscard]] std::size_t index(GridPos pos) const;
    Animal& animal_mut(uint64_t id);
    Bin& bin_mut(uint64_t id);

    int32_t width_;
    int32_t height_;
    std::vector<Terrain> terrain_;
    std::vector<bool> paths_;

    std::map<FenceKey, Fence> fences_;
    std::map<ZoneId, Zone> zones_;
    std::map<uint64_t, Animal> animals_;
    std::map<GridPos, FoodPile> food_;
    std::set<GridPos> waste_;
    std::set<GridPos> litter_;
    std::map<uint64_t, Bin> bins_;

    uint64_t next_animal_id_{1};
    uint64_t next_bin_id_{1};
};

} // namespace staffsim::core
