#include <dungeon_map/types.hpp>

#include <algorithm>
#include <iterator>

namespace dungeon_map {

const char* to_string(decode_error err) noexcept {
    switch (err) {
        case decode_error::none:                  return "none";
        case decode_error::out_of_bounds:         return "out_of_bounds";
        case decode_error::malformed_header:      return "malformed_header";
        case decode_error::truncated_grid:        return "truncated_grid";
        case decode_error::malformed_object_list: return "malformed_object_list";
        case decode_error::invalid_argument:      return "invalid_argument";
        case decode_error::io_error:              return "io_error";
        case decode_error::internal_error:        return "internal_error";
    }
    return "unknown";
}

const char* to_string(direction dir) noexcept {
    switch (dir) {
        case direction::north: return "north";
        case direction::east:  return "east";
        case direction::south: return "south";
        case direction::west:  return "west";
    }
    return "unknown";
}

const char* to_string(orientation o) noexcept {
    switch (o) {
        case orientation::horizontal: return "horizontal";
        case orientation::vertical:   return "vertical";
    }
    return "unknown";
}

const char* to_string(stairs_direction d) noexcept {
    switch (d) {
        case stairs_direction::down: return "down";
        case stairs_direction::up:   return "up";
    }
    return "unknown";
}

const char* to_string(sensor_kind kind) noexcept {
    switch (kind) {
        case sensor_kind::pressure_plate: return "pressure_plate";
        case sensor_kind::wall_button:    return "wall_button";
        case sensor_kind::other:          return "other";
    }
    return "unknown";
}

std::size_t map_record::count(sensor_kind kind) const noexcept {
    return static_cast<std::size_t>(std::count_if(sensors.begin(), sensors.end(),
        [kind](const sensor& s) { return s.kind == kind; }));
}

std::vector<sensor> decoded_world::all_sensors() const {
    std::vector<sensor> result;
    for (const auto& map : maps) {
        result.insert(result.end(), map.sensors.begin(), map.sensors.end());
    }
    return result;
}

std::vector<sensor> decoded_world::sensors_of(sensor_kind kind) const {
    std::vector<sensor> result;
    for (const auto& map : maps) {
        std::copy_if(map.sensors.begin(), map.sensors.end(), std::back_inserter(result),
            [kind](const sensor& s) { return s.kind == kind; });
    }
    return result;
}

std::vector<sensor> decoded_world::fountains() const {
    std::vector<sensor> result;
    for (const auto& map : maps) {
        std::copy_if(map.sensors.begin(), map.sensors.end(), std::back_inserter(result),
            [](const sensor& s) { return s.fountain; });
    }
    return result;
}

} // namespace dungeon_map
