#include <dungeon_map/world.hpp>
#include <dungeon_map/map_grid.hpp>
#include <dungeon_map/offset_table.hpp>
#include <dungeon_map/party_locator.hpp>
#include <dungeon_map/sensor_scanner.hpp>
#include "decode_helpers.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace dungeon_map {

namespace {

decode_result decode_map(const byte_source& source,
                         std::size_t index,
                         const map_entry& entry,
                         const world_format& format,
                         const decode_options& options,
                         first_object_list& objects,
                         map_record& map) {
    map.index = index;
    map.level = entry.level;
    map.width = entry.width;
    map.height = entry.height;

    auto result = decode_map_grid(source, entry, format, map.grid);
    if (!result) return result;

    map.unknown_cells = static_cast<std::size_t>(std::count_if(
        map.grid.cells().begin(), map.grid.cells().end(),
        [](const tile_cell& cell) { return !cell.code.known; }));

    result = read_wall_decorations(source, entry, format, map.wall_decorations);
    if (!result) return result;

    switch (format.sensors.source) {
        case sensor_source::per_map_list:
            result = scan_sensor_list(source, entry.sensor_offset, index, format,
                                      map.sensors, &map.grid);
            break;
        case sensor_source::object_chains:
            result = scan_object_chains(source, index, entry, map.grid, map.wall_decorations,
                                        objects, format, options, map.sensors, map.broken_chains);
            break;
    }
    if (!result) return result;

    map.invalid_sensors = static_cast<std::size_t>(std::count_if(
        map.sensors.begin(), map.sensors.end(),
        [](const sensor& s) { return !s.position_valid; }));

    return decode_result::success();
}

} // namespace

decode_result decode_world(const byte_source& source,
                           decoded_world& world,
                           const world_format& format,
                           const decode_options& options) {
    if (source.empty()) {
        return decode_result::failure(decode_error::out_of_bounds, "world file is empty");
    }

    offset_table table;
    auto result = read_offset_table(source, format, table, options);
    if (!result) return result;

    first_object_list objects;
    if (format.sensors.source == sensor_source::object_chains) {
        result = read_first_object_list(source, format, objects);
        if (!result) return result;
    }

    decoded_world decoded;
    decoded.format_name = format.name;
    decoded.maps.resize(table.map_count());

    for (std::size_t i = 0; i < table.map_count(); ++i) {
        result = decode_map(source, i, table.entries[i], format, options, objects, decoded.maps[i]);
        if (!result) {
            result.message = "map " + std::to_string(i) + ": " + result.message;
            return result;
        }
    }

    // Every first-object entry must have been claimed by a flagged tile
    if (objects.remaining() > 0) {
        return decode_result::failure(decode_error::malformed_object_list,
            "first object list has " + std::to_string(objects.ids.size()) +
            " entries but only " + std::to_string(objects.next) + " tiles carry objects",
            format.sensors.first_object_list_offset);
    }

    result = locate_party(source, format, table.map_count(), decoded.party);
    if (!result) return result;

    // The party must start on a decoded map
    if (decoded.party.map_index >= decoded.maps.size()) {
        return malformed_header("party start map " + std::to_string(decoded.party.map_index) +
            " does not exist", format.party.offset);
    }

    decoded.legend.reserve(format.grid.legend.size());
    for (const auto& entry : format.grid.legend) {
        decoded.legend.push_back({entry.code, std::string(entry.name), true});
    }

    world = std::move(decoded);
    return decode_result::success();
}

decode_result decode_world(std::span<const std::uint8_t> data,
                           decoded_world& world,
                           const world_format& format,
                           const decode_options& options) {
    const byte_source source(data);
    return decode_world(source, world, format, options);
}

} // namespace dungeon_map
