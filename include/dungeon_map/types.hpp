#ifndef DUNGEON_MAP_TYPES_HPP_
#define DUNGEON_MAP_TYPES_HPP_

#include <dungeon_map/dungeon_map_export.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dungeon_map {

// ============================================================================
// Decode Errors
// ============================================================================

enum class decode_error {
    none,
    out_of_bounds,
    malformed_header,
    truncated_grid,
    malformed_object_list,
    invalid_argument,
    io_error,
    internal_error
};

[[nodiscard]] DUNGEON_MAP_EXPORT const char* to_string(decode_error err) noexcept;

// ============================================================================
// Decode Result
// ============================================================================

struct decode_result {
    bool ok = false;
    decode_error error = decode_error::none;
    std::string message;
    std::size_t offset = 0;  // byte offset of the failing structural check

    [[nodiscard]] static decode_result success() {
        return {true, decode_error::none, {}, 0};
    }

    [[nodiscard]] static decode_result failure(decode_error err, std::string msg = {},
                                               std::size_t at = 0) {
        return {false, err, std::move(msg), at};
    }

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Decode Options
// ============================================================================

struct decode_options {
    // Upper bound on the map count (0 = use the format's own limit)
    std::size_t max_maps = 0;

    // Object chains longer than this are cut and counted as broken
    std::size_t max_chain_length = 1024;
};

// ============================================================================
// Directions and Orientations
// ============================================================================

enum class direction : std::uint8_t {
    north = 0,
    east = 1,
    south = 2,
    west = 3
};

[[nodiscard]] DUNGEON_MAP_EXPORT const char* to_string(direction dir) noexcept;

// Facing codes are two bits wide in every supported layout
[[nodiscard]] constexpr direction direction_from_code(unsigned code) noexcept {
    return static_cast<direction>(code & 0x03);
}

enum class orientation : std::uint8_t {
    horizontal,  // west-east
    vertical     // north-south
};

enum class stairs_direction : std::uint8_t {
    down,
    up
};

[[nodiscard]] DUNGEON_MAP_EXPORT const char* to_string(orientation o) noexcept;
[[nodiscard]] DUNGEON_MAP_EXPORT const char* to_string(stairs_direction d) noexcept;

// ============================================================================
// Tiles
// ============================================================================

inline constexpr std::string_view unknown_tile_name = "unknown";

/**
 * Numeric tile kind with its legend name.
 * Codes missing from the legend keep their value, are named "unknown"
 * and report known == false.
 */
struct tile_code {
    std::uint8_t value = 0;
    std::string name{unknown_tile_name};
    bool known = false;

    bool operator==(const tile_code&) const = default;
};

struct tile_cell {
    tile_code code;
    std::uint8_t raw = 0;       // packed field as stored in the file
    bool has_objects = false;   // first-object list has an entry for this tile
    std::optional<orientation> door;
    std::optional<orientation> stairs;
    std::optional<stairs_direction> stairs_dir;

    bool operator==(const tile_cell&) const = default;
};

/**
 * A map's 32x32 floor plan.
 * Cells are stored row-major with the origin at the top-left corner,
 * x growing east and y growing south.
 */
class DUNGEON_MAP_EXPORT tile_grid {
public:
    static constexpr int size = 32;
    static constexpr std::size_t cell_count = static_cast<std::size_t>(size) * size;

    [[nodiscard]] static constexpr bool in_bounds(int x, int y) noexcept {
        return x >= 0 && x < size && y >= 0 && y < size;
    }

    [[nodiscard]] const tile_cell& at(int x, int y) const noexcept {
        return cells_[index_of(x, y)];
    }

    [[nodiscard]] tile_cell& at(int x, int y) noexcept {
        return cells_[index_of(x, y)];
    }

    [[nodiscard]] std::span<const tile_cell> cells() const noexcept { return cells_; }

    bool operator==(const tile_grid&) const = default;

private:
    [[nodiscard]] static constexpr std::size_t index_of(int x, int y) noexcept {
        return static_cast<std::size_t>(y) * size + static_cast<std::size_t>(x);
    }

    std::array<tile_cell, cell_count> cells_{};
};

// ============================================================================
// Sensors
// ============================================================================

enum class sensor_kind : std::uint8_t {
    pressure_plate,
    wall_button,
    other
};

[[nodiscard]] DUNGEON_MAP_EXPORT const char* to_string(sensor_kind kind) noexcept;

struct sensor {
    std::size_t map_index = 0;
    unsigned x = 0;
    unsigned y = 0;
    sensor_kind kind = sensor_kind::other;
    std::uint8_t type = 0;            // raw sensor type code
    direction facing = direction::north;
    bool position_valid = true;       // false when x or y lies outside 0..31
    std::size_t record = 0;           // index of the record in its sensor block
    std::optional<std::uint8_t> wall_decoration;
    bool fountain = false;

    bool operator==(const sensor&) const = default;
};

// ============================================================================
// Party Start
// ============================================================================

struct party_start {
    std::size_t map_index = 0;
    unsigned x = 0;
    unsigned y = 0;
    direction facing = direction::north;

    bool operator==(const party_start&) const = default;
};

// ============================================================================
// Decoded World
// ============================================================================

struct DUNGEON_MAP_EXPORT map_record {
    std::size_t index = 0;
    unsigned level = 0;
    unsigned width = tile_grid::size;
    unsigned height = tile_grid::size;
    tile_grid grid;
    std::vector<sensor> sensors;
    std::vector<std::uint8_t> wall_decorations;

    // Soft anomalies, kept as data rather than errors
    std::size_t unknown_cells = 0;
    std::size_t invalid_sensors = 0;
    std::size_t broken_chains = 0;

    [[nodiscard]] std::size_t count(sensor_kind kind) const noexcept;

    bool operator==(const map_record&) const = default;
};

/**
 * Everything decoded from one world file.
 * The world owns its strings and stays valid after the world_format
 * used to decode it is gone.
 */
struct DUNGEON_MAP_EXPORT decoded_world {
    std::string format_name;
    std::vector<map_record> maps;
    party_start party;
    std::vector<tile_code> legend;

    [[nodiscard]] std::size_t map_count() const noexcept { return maps.size(); }

    /**
     * Collect the sensors of every map in map order.
     */
    [[nodiscard]] std::vector<sensor> all_sensors() const;

    /**
     * Collect the sensors of one kind across all maps.
     */
    [[nodiscard]] std::vector<sensor> sensors_of(sensor_kind kind) const;

    [[nodiscard]] std::vector<sensor> fountains() const;

    bool operator==(const decoded_world&) const = default;
};

} // namespace dungeon_map

#endif // DUNGEON_MAP_TYPES_HPP_
