#ifndef DUNGEON_MAP_OFFSET_TABLE_HPP_
#define DUNGEON_MAP_OFFSET_TABLE_HPP_

#include <dungeon_map/dungeon_map_export.h>
#include <dungeon_map/byte_source.hpp>
#include <dungeon_map/format.hpp>
#include <dungeon_map/types.hpp>

#include <cstddef>
#include <vector>

namespace dungeon_map {

// ============================================================================
// Offset Table
// ============================================================================

struct map_entry {
    std::size_t tile_offset = 0;     // absolute offset of the packed tile block
    std::size_t sensor_offset = 0;   // absolute offset of the sensor block
    unsigned width = tile_grid::size;
    unsigned height = tile_grid::size;
    unsigned level = 0;

    // Graphics counts; zero for formats that do not store them
    unsigned creature_graphics = 0;
    unsigned wall_graphics = 0;
    unsigned floor_graphics = 0;
    unsigned door_decorations = 0;

    bool operator==(const map_entry&) const = default;
};

struct offset_table {
    std::vector<map_entry> entries;

    [[nodiscard]] std::size_t map_count() const noexcept { return entries.size(); }
};

/**
 * Read the header map count and the per-map offset table.
 * @param source World file contents
 * @param format Layout description
 * @param table Receives one entry per map in file order
 * @param options Decode options (max_maps tightens the format limit)
 * @return malformed_header if the count or any offset is impossible,
 *         out_of_bounds if a header field lies past the buffer
 */
[[nodiscard]] DUNGEON_MAP_EXPORT decode_result read_offset_table(const byte_source& source,
                                                                 const world_format& format,
                                                                 offset_table& table,
                                                                 const decode_options& options = {});

} // namespace dungeon_map

#endif // DUNGEON_MAP_OFFSET_TABLE_HPP_
