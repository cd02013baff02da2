#ifndef DUNGEON_MAP_PARTY_LOCATOR_HPP_
#define DUNGEON_MAP_PARTY_LOCATOR_HPP_

#include <dungeon_map/dungeon_map_export.h>
#include <dungeon_map/byte_source.hpp>
#include <dungeon_map/format.hpp>
#include <dungeon_map/types.hpp>

#include <cstddef>

namespace dungeon_map {

/**
 * Read the global party start record.
 * @param source World file contents
 * @param format Layout description
 * @param map_count Number of maps established by the offset table
 * @param party Receives map index, position and facing
 * @return malformed_header if the map index is >= map_count or a field is
 *         out of range
 */
[[nodiscard]] DUNGEON_MAP_EXPORT decode_result locate_party(const byte_source& source,
                                                            const world_format& format,
                                                            std::size_t map_count,
                                                            party_start& party);

} // namespace dungeon_map

#endif // DUNGEON_MAP_PARTY_LOCATOR_HPP_
