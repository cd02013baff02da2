#ifndef DUNGEON_MAP_SENSOR_SCANNER_HPP_
#define DUNGEON_MAP_SENSOR_SCANNER_HPP_

#include <dungeon_map/dungeon_map_export.h>
#include <dungeon_map/byte_source.hpp>
#include <dungeon_map/format.hpp>
#include <dungeon_map/offset_table.hpp>
#include <dungeon_map/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace dungeon_map {

// ============================================================================
// Sensor Classification
// ============================================================================

enum class tile_surface {
    unknown,
    floor,
    wall
};

/**
 * Classify a sensor type code.
 * When the layout classifies by surface and the surface is known, pressure
 * plates must sit on floor tiles and wall buttons on wall tiles. Otherwise
 * the type code alone decides, pressure plates first.
 */
[[nodiscard]] DUNGEON_MAP_EXPORT sensor_kind classify_sensor(unsigned type,
                                                             tile_surface surface,
                                                             const sensor_layout& layout) noexcept;

/**
 * Surface of a tile for classification purposes.
 */
[[nodiscard]] DUNGEON_MAP_EXPORT tile_surface surface_of(const tile_cell& cell,
                                                         const grid_layout& layout) noexcept;

// ============================================================================
// Per-Map Sensor Lists
// ============================================================================

/**
 * Decode a count-prefixed sensor list.
 * Sensors outside 0..31 are kept with position_valid == false.
 * @param source World file contents
 * @param offset Absolute offset of the list's count field
 * @param map_index Owning map
 * @param format Layout description
 * @param sensors Receives the decoded sensors in record order
 * @param grid Owning map's grid, used when classifying by surface (optional)
 * @return out_of_bounds if the list runs past the buffer
 */
[[nodiscard]] DUNGEON_MAP_EXPORT decode_result scan_sensor_list(const byte_source& source,
                                                                std::size_t offset,
                                                                std::size_t map_index,
                                                                const world_format& format,
                                                                std::vector<sensor>& sensors,
                                                                const tile_grid* grid = nullptr);

// ============================================================================
// Object Chains
// ============================================================================

/**
 * Global list of the first object id on every tile that owns objects.
 * Tiles consume ids in map order, then in column order within a map.
 */
struct first_object_list {
    std::vector<std::uint16_t> ids;
    std::size_t next = 0;

    [[nodiscard]] std::size_t remaining() const noexcept {
        return next < ids.size() ? ids.size() - next : 0;
    }
};

struct object_id {
    std::uint8_t position = 0;   // bits 14-15: corner or wall side on the tile
    std::uint8_t category = 0;   // bits 10-13
    std::uint16_t number = 0;    // bits 0-9: record index within the category

    static constexpr std::uint16_t end_of_chain = 0xFFFE;
    static constexpr std::uint16_t none = 0xFFFF;

    [[nodiscard]] static constexpr bool terminates(std::uint16_t raw) noexcept {
        return raw == end_of_chain || raw == none;
    }

    [[nodiscard]] static constexpr object_id unpack(std::uint16_t raw) noexcept {
        return {static_cast<std::uint8_t>((raw >> 14) & 0x03),
                static_cast<std::uint8_t>((raw >> 10) & 0x0F),
                static_cast<std::uint16_t>(raw & 0x03FF)};
    }
};

/**
 * Read the first-object list, dropping empty (0xFFFF) slots.
 */
[[nodiscard]] DUNGEON_MAP_EXPORT decode_result read_first_object_list(const byte_source& source,
                                                                      const world_format& format,
                                                                      first_object_list& list);

/**
 * Walk the object chains of one map and collect its sensors.
 * @param source World file contents
 * @param map_index Owning map
 * @param entry Map entry (for width and height)
 * @param grid Decoded grid; tiles with the object flag consume list ids
 * @param wall_decorations The map's wall decoration ids
 * @param list Shared first-object list, advanced past this map's tiles
 * @param format Layout description
 * @param options Decode options (max_chain_length)
 * @param sensors Receives the sensors in tile then chain order
 * @param broken_chains Incremented for every chain cut at max_chain_length
 */
[[nodiscard]] DUNGEON_MAP_EXPORT decode_result scan_object_chains(const byte_source& source,
                                                                  std::size_t map_index,
                                                                  const map_entry& entry,
                                                                  const tile_grid& grid,
                                                                  std::span<const std::uint8_t> wall_decorations,
                                                                  first_object_list& list,
                                                                  const world_format& format,
                                                                  const decode_options& options,
                                                                  std::vector<sensor>& sensors,
                                                                  std::size_t& broken_chains);

} // namespace dungeon_map

#endif // DUNGEON_MAP_SENSOR_SCANNER_HPP_
