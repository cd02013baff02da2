#ifndef DUNGEON_MAP_MAP_GRID_HPP_
#define DUNGEON_MAP_MAP_GRID_HPP_

#include <dungeon_map/dungeon_map_export.h>
#include <dungeon_map/byte_source.hpp>
#include <dungeon_map/format.hpp>
#include <dungeon_map/offset_table.hpp>
#include <dungeon_map/types.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace dungeon_map {

// ============================================================================
// Map Grid Decoder
// ============================================================================

/**
 * Number of bytes the packed tile block of a width x height map occupies.
 */
[[nodiscard]] DUNGEON_MAP_EXPORT std::size_t packed_grid_size(unsigned width, unsigned height,
                                                              const grid_layout& layout) noexcept;

/**
 * Decode one map's packed tile block into a 32x32 grid.
 * Unknown codes are kept and flagged; cells outside width x height hold
 * the layout's pad code.
 * @param source World file contents
 * @param entry Map entry from the offset table
 * @param format Layout description
 * @param grid Receives the decoded cells
 * @return truncated_grid if the block runs past the end of the buffer
 */
[[nodiscard]] DUNGEON_MAP_EXPORT decode_result decode_map_grid(const byte_source& source,
                                                               const map_entry& entry,
                                                               const world_format& format,
                                                               tile_grid& grid);

/**
 * Read the wall decoration graphic ids stored after a map's tile block.
 * Leaves ids empty for formats without graphics counts.
 */
[[nodiscard]] DUNGEON_MAP_EXPORT decode_result read_wall_decorations(const byte_source& source,
                                                                     const map_entry& entry,
                                                                     const world_format& format,
                                                                     std::vector<std::uint8_t>& ids);

} // namespace dungeon_map

#endif // DUNGEON_MAP_MAP_GRID_HPP_
