#ifndef DUNGEON_MAP_FORMAT_HPP_
#define DUNGEON_MAP_FORMAT_HPP_

#include <dungeon_map/dungeon_map_export.h>
#include <dungeon_map/types.hpp>

#include <array>
#include <bitset>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace dungeon_map {

// ============================================================================
// Format Description
// ============================================================================
//
// Every byte offset, field width and bit mask of a world file layout lives
// in one world_format value. Decoders never hard-code layout constants.
// All offsets are in bytes from the start of the file unless noted.

struct legend_entry {
    std::uint8_t code;
    std::string_view name;
};

struct header_layout {
    std::size_t map_count_offset = 0;
    unsigned map_count_width = 1;   // 1, 2 or 4 bytes
    std::size_t max_maps = 64;
};

struct map_table_layout {
    std::size_t base = 0;
    std::size_t stride = 0;

    // Offsets within one table entry
    std::size_t tile_offset_field = 0;
    unsigned tile_offset_width = 2;
    std::size_t sensor_offset_field = 0;
    unsigned sensor_offset_width = 0;   // 0 = sensors live in one shared block

    // Added to every tile offset read from the table
    std::size_t tile_data_base = 0;

    // Packed width/height/level word (DM1 style); absent = 32x32 maps
    std::optional<std::size_t> geometry_field;

    // Graphics count words preceding the decoration lists
    std::optional<std::size_t> graphics_field;
    std::optional<std::size_t> creature_field;
};

enum class cell_packing {
    byte,               // one cell per byte
    nibble_high_first,  // two cells per byte, high nibble first
    nibble_low_first    // two cells per byte, low nibble first
};

enum class grid_order {
    row_major,     // cell i at (i % width, i / width)
    column_major   // cell i at (i / height, i % height)
};

struct grid_layout {
    cell_packing packing = cell_packing::byte;
    grid_order order = grid_order::row_major;
    std::uint8_t code_shift = 0;
    std::uint8_t code_mask = 0xFF;

    // Bit flagging a tile that owns an object chain (0 = none)
    std::uint8_t object_flag_mask = 0;

    // Code written to cells outside a map narrower than 32x32
    std::uint8_t pad_code = 0;

    std::span<const legend_entry> legend;

    std::optional<std::uint8_t> wall_code;
    std::optional<std::uint8_t> door_code;
    std::optional<std::uint8_t> stairs_code;
    std::uint8_t orientation_bit = 3;     // doors and stairs: 0 horizontal, 1 vertical
    std::uint8_t stairs_up_bit = 2;       // stairs: 0 down, 1 up
};

enum class sensor_source {
    per_map_list,   // count-prefixed record list per map
    object_chains   // records reached through per-tile object chains
};

struct object_list {
    std::size_t offset = 0;
    std::size_t entry_size = 0;   // 0 = category has no list
};

using sensor_type_set = std::bitset<128>;

struct sensor_layout {
    sensor_source source = sensor_source::per_map_list;

    // Record shape (both sources)
    std::size_t record_size = 4;
    std::size_t type_field = 0;
    std::uint16_t type_mask = 0x7F;

    // Per-map list only
    unsigned count_width = 2;
    std::optional<std::uint8_t> facing_shift;
    std::size_t position_field = 2;
    std::uint8_t x_shift = 0;
    std::uint16_t x_mask = 0xFF;
    std::uint8_t y_shift = 8;
    std::uint16_t y_mask = 0xFF;

    // Object chains only
    std::size_t first_object_list_offset = 0;
    std::size_t object_list_size_offset = 0;  // header word holding the list length
    std::size_t record_base = 0;
    std::size_t record_count = 0;
    std::uint8_t sensor_category = 3;
    std::array<object_list, 16> object_lists{};
    std::size_t decoration_field = 4;
    std::uint8_t decoration_shift = 12;
    std::uint8_t fountain_decoration = 35;

    // Classification
    sensor_type_set pressure_plate_types;
    sensor_type_set wall_button_types;
    bool classify_by_surface = false;
};

enum class party_layout {
    packed_word,  // x bits 0-4, y bits 5-9, facing bits 10-11, map 0
    byte_fields   // map, x, y, facing as consecutive bytes
};

struct party_record_layout {
    party_layout layout = party_layout::byte_fields;
    std::size_t offset = 0;
};

struct world_format {
    std::string_view name;
    std::string_view description;
    header_layout header;
    map_table_layout map_table;
    grid_layout grid;
    sensor_layout sensors;
    party_record_layout party;
};

// ============================================================================
// Built-in Formats
// ============================================================================

/**
 * Dungeon Master 1, PC, uncompressed DUNGEON.DAT.
 */
[[nodiscard]] DUNGEON_MAP_EXPORT const world_format& dm1_pc_format() noexcept;

/**
 * Flat indexed layout: a map count, a table of absolute 32-bit
 * (tile grid, sensor list) offsets, byte-per-cell row-major 32x32 grids,
 * count-prefixed sensor lists and a four-byte party record.
 */
[[nodiscard]] DUNGEON_MAP_EXPORT const world_format& indexed_format() noexcept;

[[nodiscard]] DUNGEON_MAP_EXPORT std::span<const world_format* const> known_formats() noexcept;

/**
 * Find a built-in format by name.
 * @param name Format name (e.g., "dm1-pc")
 * @return Pointer to format if found, nullptr otherwise
 */
[[nodiscard]] DUNGEON_MAP_EXPORT const world_format* find_format(std::string_view name) noexcept;

/**
 * Map a code through the format's legend.
 * Codes missing from the legend come back with known == false.
 */
[[nodiscard]] DUNGEON_MAP_EXPORT tile_code lookup_tile(std::uint8_t code,
                                                       const grid_layout& layout);

} // namespace dungeon_map

#endif // DUNGEON_MAP_FORMAT_HPP_
