#ifndef DUNGEON_MAP_DUNGEON_MAP_HPP_
#define DUNGEON_MAP_DUNGEON_MAP_HPP_

#include <dungeon_map/dungeon_map_export.h>
#include <dungeon_map/types.hpp>
#include <dungeon_map/byte_source.hpp>
#include <dungeon_map/format.hpp>
#include <dungeon_map/offset_table.hpp>
#include <dungeon_map/map_grid.hpp>
#include <dungeon_map/sensor_scanner.hpp>
#include <dungeon_map/party_locator.hpp>
#include <dungeon_map/world.hpp>
#include <dungeon_map/render.hpp>
#include <dungeon_map/json_export.hpp>

namespace dungeon_map {

// All public API is included via the headers above.
// See:
//   - types.hpp:          decode_error, decode_result, tiles, sensors, decoded_world
//   - byte_source.hpp:    bounds-checked little-endian reads
//   - format.hpp:         world_format layout descriptions (DM1 PC, indexed)
//   - offset_table.hpp:   header and per-map offset table
//   - map_grid.hpp:       32x32 tile grid decoding
//   - sensor_scanner.hpp: sensor lists, object chains, classification
//   - party_locator.hpp:  party start record
//   - world.hpp:          decode_world()
//   - render.hpp:         map rendering and PNG output
//   - json_export.hpp:    level and legend JSON documents

} // namespace dungeon_map

#endif // DUNGEON_MAP_DUNGEON_MAP_HPP_
