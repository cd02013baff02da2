#ifndef DUNGEON_MAP_WORLD_HPP_
#define DUNGEON_MAP_WORLD_HPP_

#include <dungeon_map/dungeon_map_export.h>
#include <dungeon_map/byte_source.hpp>
#include <dungeon_map/format.hpp>
#include <dungeon_map/types.hpp>

#include <cstdint>
#include <span>

namespace dungeon_map {

// ============================================================================
// World Decoding
// ============================================================================

/**
 * Decode a whole world file.
 * Reads the offset table, then every map's grid and sensors in ascending
 * map order, then the party start. Stops at the first fatal failure; world
 * is left untouched unless the decode succeeds.
 * @param source World file contents
 * @param world Destination world
 * @param format Layout description
 * @param options Decode options
 * @return Decode result
 */
[[nodiscard]] DUNGEON_MAP_EXPORT decode_result decode_world(const byte_source& source,
                                                            decoded_world& world,
                                                            const world_format& format = dm1_pc_format(),
                                                            const decode_options& options = {});

/**
 * Decode a whole world file from raw bytes.
 * @param data Raw file data
 * @param world Destination world
 * @param format Layout description
 * @param options Decode options
 * @return Decode result
 */
[[nodiscard]] DUNGEON_MAP_EXPORT decode_result decode_world(std::span<const std::uint8_t> data,
                                                            decoded_world& world,
                                                            const world_format& format = dm1_pc_format(),
                                                            const decode_options& options = {});

} // namespace dungeon_map

#endif // DUNGEON_MAP_WORLD_HPP_
