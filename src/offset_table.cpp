#include <dungeon_map/offset_table.hpp>
#include "byte_io.hpp"
#include "decode_helpers.hpp"

#include <string>
#include <utility>

namespace dungeon_map {

namespace {

// DM1 map geometry word: bits 0-5 level, 6-10 width-1, 11-15 height-1
void decode_geometry(std::uint16_t word, map_entry& entry) {
    entry.level = bit_field(word, 0, 0x3F);
    entry.width = bit_field(word, 6, 0x1F) + 1;
    entry.height = bit_field(word, 11, 0x1F) + 1;
}

} // namespace

decode_result read_offset_table(const byte_source& source,
                                const world_format& format,
                                offset_table& table,
                                const decode_options& options) {
    return guarded_decode("offset table", format.header.map_count_offset, [&]() -> decode_result {
        const auto& header = format.header;
        const auto& layout = format.map_table;

        const std::size_t count = source.read_uint(header.map_count_offset, header.map_count_width);

        std::size_t limit = header.max_maps;
        if (options.max_maps > 0 && options.max_maps < limit) {
            limit = options.max_maps;
        }
        if (count > limit) {
            return malformed_header("map count " + std::to_string(count) +
                " exceeds limit of " + std::to_string(limit), header.map_count_offset);
        }

        // The table itself must fit in the file; this also bounds count by file size
        if (count > 0 && (layout.stride == 0 || !source.contains(layout.base, count * layout.stride))) {
            return malformed_header("map table of " + std::to_string(count) +
                " entries runs past end of file", layout.base);
        }

        offset_table result;
        result.entries.reserve(count);

        for (std::size_t i = 0; i < count; ++i) {
            const std::size_t entry_offset = layout.base + i * layout.stride;
            map_entry entry;

            const std::size_t tile_field = entry_offset + layout.tile_offset_field;
            entry.tile_offset = layout.tile_data_base +
                source.read_uint(tile_field, layout.tile_offset_width);
            if (entry.tile_offset >= source.size()) {
                return malformed_header("map " + std::to_string(i) + " tile offset " +
                    hex_offset(entry.tile_offset) + " lies outside the file", tile_field);
            }

            if (layout.sensor_offset_width > 0) {
                const std::size_t sensor_field = entry_offset + layout.sensor_offset_field;
                entry.sensor_offset = source.read_uint(sensor_field, layout.sensor_offset_width);
                if (entry.sensor_offset >= source.size()) {
                    return malformed_header("map " + std::to_string(i) + " sensor offset " +
                        hex_offset(entry.sensor_offset) + " lies outside the file", sensor_field);
                }
            } else {
                // Sensors share one block for the whole file
                entry.sensor_offset = format.sensors.record_base;
                if (entry.sensor_offset >= source.size()) {
                    return malformed_header("shared sensor block lies outside the file",
                        entry.sensor_offset);
                }
            }

            if (layout.geometry_field) {
                decode_geometry(source.read_u16le(entry_offset + *layout.geometry_field), entry);
            } else {
                entry.level = static_cast<unsigned>(i);
            }

            if (layout.graphics_field) {
                const std::uint16_t graphics = source.read_u16le(entry_offset + *layout.graphics_field);
                entry.wall_graphics = bit_field(graphics, 0, 0x0F);
                entry.floor_graphics = bit_field(graphics, 8, 0x0F);
            }

            if (layout.creature_field) {
                const std::uint16_t misc = source.read_u16le(entry_offset + *layout.creature_field);
                entry.door_decorations = bit_field(misc, 0, 0x0F);
                entry.creature_graphics = bit_field(misc, 4, 0x0F);
            }

            result.entries.push_back(entry);
        }

        table = std::move(result);
        return decode_result::success();
    });
}

} // namespace dungeon_map
