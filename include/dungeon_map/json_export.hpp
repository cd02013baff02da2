#ifndef DUNGEON_MAP_JSON_EXPORT_HPP_
#define DUNGEON_MAP_JSON_EXPORT_HPP_

#include <dungeon_map/dungeon_map_export.h>
#include <dungeon_map/types.hpp>

#include <cstddef>
#include <filesystem>
#include <string>

namespace dungeon_map {

// ============================================================================
// JSON Export
// ============================================================================

/**
 * Serialize one map as a level document.
 * Keys: level, width, height, grid (32x32 tile names), door_orientation,
 * stairs_orientation and stairs_direction (32x32, null where the cell has
 * no such attribute or lies outside width x height).
 * @param world Decoded world
 * @param map_index Map to serialize
 * @param text Receives the JSON text, indented by 2
 * @return invalid_argument for a bad map index
 */
[[nodiscard]] DUNGEON_MAP_EXPORT decode_result level_to_json(const decoded_world& world,
                                                             std::size_t map_index,
                                                             std::string& text);

/**
 * Serialize the legend document.
 * Each legend code becomes a decimal key holding its tile name, followed by
 * starting_position, pressure_plates, buttons and fountains. Sensors whose
 * position lies outside the grid are left out.
 */
[[nodiscard]] DUNGEON_MAP_EXPORT std::string legend_to_json(const decoded_world& world);

/**
 * Write level_NN.json for every map and legend.json into a directory.
 * The directory is created when missing.
 * @return io_error when a file cannot be written
 */
[[nodiscard]] DUNGEON_MAP_EXPORT decode_result write_json(const decoded_world& world,
                                                          const std::filesystem::path& dir);

} // namespace dungeon_map

#endif // DUNGEON_MAP_JSON_EXPORT_HPP_
