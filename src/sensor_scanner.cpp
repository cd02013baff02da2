#include <dungeon_map/sensor_scanner.hpp>
#include "byte_io.hpp"
#include "decode_helpers.hpp"

#include <string>
#include <utility>

namespace dungeon_map {

namespace {

bool in_set(const sensor_type_set& set, unsigned type) noexcept {
    return type < set.size() && set.test(type);
}

struct chain_walker {
    const byte_source& source;
    const sensor_layout& layout;
    std::span<const std::uint8_t> wall_decorations;
    std::size_t max_chain_length;

    // Follow one tile's chain and append every sensor found on it
    void walk(std::uint16_t first, std::size_t map_index, int x, int y, tile_surface surface,
              std::vector<sensor>& out, std::size_t& broken_chains) const {
        std::uint16_t raw = first;
        std::size_t steps = 0;

        while (!object_id::terminates(raw)) {
            if (steps++ >= max_chain_length) {
                ++broken_chains;
                break;
            }

            const auto id = object_id::unpack(raw);
            if (id.category == layout.sensor_category) {
                if (id.number >= layout.record_count) {
                    break;
                }
                out.push_back(read_sensor(id, map_index, x, y, surface));
            }

            const auto& next = layout.object_lists[id.category];
            if (next.entry_size == 0) {
                break;
            }
            raw = source.read_u16le(next.offset + static_cast<std::size_t>(id.number) * next.entry_size);
        }
    }

    sensor read_sensor(const object_id& id, std::size_t map_index, int x, int y,
                       tile_surface surface) const {
        const std::size_t record = layout.record_base +
            static_cast<std::size_t>(id.number) * layout.record_size;

        sensor s;
        s.map_index = map_index;
        s.x = static_cast<unsigned>(x);
        s.y = static_cast<unsigned>(y);
        s.record = id.number;
        s.type = static_cast<std::uint8_t>(source.read_u16le(record + layout.type_field) & layout.type_mask);
        s.facing = direction_from_code(id.position);
        s.kind = classify_sensor(s.type, surface, layout);

        // Type 0 wall sensors only display a decoration; ordinal 0 means none
        if (s.type == 0 && surface == tile_surface::wall) {
            const unsigned ordinal = bit_field(source.read_u16le(record + layout.decoration_field),
                                               layout.decoration_shift, 0x0F);
            if (ordinal > 0 && ordinal - 1 < wall_decorations.size()) {
                s.wall_decoration = wall_decorations[ordinal - 1];
                s.fountain = (*s.wall_decoration == layout.fountain_decoration);
            }
        }
        return s;
    }
};

} // namespace

sensor_kind classify_sensor(unsigned type, tile_surface surface, const sensor_layout& layout) noexcept {
    const bool plate = in_set(layout.pressure_plate_types, type);
    const bool button = in_set(layout.wall_button_types, type);

    if (layout.classify_by_surface && surface != tile_surface::unknown) {
        if (surface == tile_surface::floor && plate) return sensor_kind::pressure_plate;
        if (surface == tile_surface::wall && button) return sensor_kind::wall_button;
        return sensor_kind::other;
    }

    if (plate) return sensor_kind::pressure_plate;
    if (button) return sensor_kind::wall_button;
    return sensor_kind::other;
}

tile_surface surface_of(const tile_cell& cell, const grid_layout& layout) noexcept {
    if (!layout.wall_code) {
        return tile_surface::unknown;
    }
    return cell.code.value == *layout.wall_code ? tile_surface::wall : tile_surface::floor;
}

decode_result scan_sensor_list(const byte_source& source,
                               std::size_t offset,
                               std::size_t map_index,
                               const world_format& format,
                               std::vector<sensor>& sensors,
                               const tile_grid* grid) {
    return guarded_decode("sensor list", offset, [&]() -> decode_result {
        const auto& layout = format.sensors;

        const std::size_t count = source.read_uint(offset, layout.count_width);
        const std::size_t first = offset + layout.count_width;
        if (!source.contains(first, count * layout.record_size)) {
            return decode_result::failure(decode_error::out_of_bounds,
                "sensor list of " + std::to_string(count) + " records at " +
                hex_offset(offset) + " runs past end of file", offset);
        }

        std::vector<sensor> result;
        result.reserve(count);

        for (std::size_t i = 0; i < count; ++i) {
            const std::size_t record = first + i * layout.record_size;
            const std::uint16_t type_word = source.read_u16le(record + layout.type_field);
            const std::uint16_t position = source.read_u16le(record + layout.position_field);

            sensor s;
            s.map_index = map_index;
            s.record = i;
            s.type = static_cast<std::uint8_t>(type_word & layout.type_mask);
            if (layout.facing_shift) {
                s.facing = direction_from_code(bit_field(type_word, *layout.facing_shift, 0x03));
            }
            s.x = bit_field(position, layout.x_shift, layout.x_mask);
            s.y = bit_field(position, layout.y_shift, layout.y_mask);
            s.position_valid = tile_grid::in_bounds(static_cast<int>(s.x), static_cast<int>(s.y));

            tile_surface surface = tile_surface::unknown;
            if (grid && s.position_valid) {
                surface = surface_of(grid->at(static_cast<int>(s.x), static_cast<int>(s.y)), format.grid);
            }
            s.kind = classify_sensor(s.type, surface, layout);

            result.push_back(s);
        }

        sensors = std::move(result);
        return decode_result::success();
    });
}

decode_result read_first_object_list(const byte_source& source,
                                     const world_format& format,
                                     first_object_list& list) {
    return guarded_decode("first object list", format.sensors.first_object_list_offset, [&]() -> decode_result {
        const auto& layout = format.sensors;

        const std::size_t words = source.read_u16le(layout.object_list_size_offset);
        const std::size_t base = layout.first_object_list_offset;
        if (!source.contains(base, words * 2)) {
            return decode_result::failure(decode_error::malformed_object_list,
                "first object list of " + std::to_string(words) + " words at " +
                hex_offset(base) + " runs past end of file", base);
        }

        first_object_list result;
        result.ids.reserve(words);
        for (std::size_t i = 0; i < words; ++i) {
            const std::uint16_t id = source.read_u16le(base + i * 2);
            if (id != object_id::none) {
                result.ids.push_back(id);
            }
        }

        list = std::move(result);
        return decode_result::success();
    });
}

decode_result scan_object_chains(const byte_source& source,
                                 std::size_t map_index,
                                 const map_entry& entry,
                                 const tile_grid& grid,
                                 std::span<const std::uint8_t> wall_decorations,
                                 first_object_list& list,
                                 const world_format& format,
                                 const decode_options& options,
                                 std::vector<sensor>& sensors,
                                 std::size_t& broken_chains) {
    return guarded_decode("object chains", entry.tile_offset, [&]() -> decode_result {
        const chain_walker walker{source, format.sensors, wall_decorations, options.max_chain_length};

        std::vector<sensor> result;
        std::size_t cursor = list.next;
        std::size_t broken = 0;

        // Tiles claim list entries column by column
        for (unsigned x = 0; x < entry.width; ++x) {
            for (unsigned y = 0; y < entry.height; ++y) {
                const auto& cell = grid.at(static_cast<int>(x), static_cast<int>(y));
                if (!cell.has_objects || cursor >= list.ids.size()) {
                    continue;
                }
                walker.walk(list.ids[cursor++], map_index, static_cast<int>(x), static_cast<int>(y),
                            surface_of(cell, format.grid), result, broken);
            }
        }

        list.next = cursor;
        broken_chains += broken;
        sensors = std::move(result);
        return decode_result::success();
    });
}

} // namespace dungeon_map
