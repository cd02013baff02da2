#include <dungeon_map/json_export.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdio>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>

namespace dungeon_map {

namespace {

using json = nlohmann::ordered_json;

constexpr int json_indent = 2;

// 32x32 rows of one optional cell attribute; null outside the map's extent
template <typename Field>
json attribute_grid(const map_record& map, Field field) {
    json rows = json::array();
    for (int y = 0; y < tile_grid::size; ++y) {
        json row = json::array();
        for (int x = 0; x < tile_grid::size; ++x) {
            const bool inside = static_cast<unsigned>(x) < map.width && static_cast<unsigned>(y) < map.height;
            const auto& value = field(map.grid.at(x, y));
            row.push_back(inside && value ? json(to_string(*value)) : json(nullptr));
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

json sensor_position(const map_record& map, const sensor& s) {
    json out = json::object();
    out["level"] = map.level;
    out["x"] = s.x;
    out["y"] = s.y;
    return out;
}

bool write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    file.write(text.data(), static_cast<std::streamsize>(text.size()));
    return file.good();
}

} // namespace

decode_result level_to_json(const decoded_world& world, std::size_t map_index, std::string& text) {
    if (map_index >= world.maps.size()) {
        return decode_result::failure(decode_error::invalid_argument,
            "map " + std::to_string(map_index) + " does not exist");
    }

    const auto& map = world.maps[map_index];

    json grid = json::array();
    for (int y = 0; y < tile_grid::size; ++y) {
        json row = json::array();
        for (int x = 0; x < tile_grid::size; ++x) {
            row.emplace_back(map.grid.at(x, y).code.name);
        }
        grid.push_back(std::move(row));
    }

    json doc = json::object();
    doc["level"] = map.level;
    doc["width"] = map.width;
    doc["height"] = map.height;
    doc["grid"] = std::move(grid);
    doc["door_orientation"] = attribute_grid(map, [](const tile_cell& c) -> const auto& { return c.door; });
    doc["stairs_orientation"] = attribute_grid(map, [](const tile_cell& c) -> const auto& { return c.stairs; });
    doc["stairs_direction"] = attribute_grid(map, [](const tile_cell& c) -> const auto& { return c.stairs_dir; });

    text = doc.dump(json_indent);
    return decode_result::success();
}

std::string legend_to_json(const decoded_world& world) {
    json doc = json::object();
    for (const auto& code : world.legend) {
        doc[std::to_string(code.value)] = code.name;
    }

    json start = json::object();
    start["map"] = world.party.map_index;
    start["x"] = world.party.x;
    start["y"] = world.party.y;
    start["direction"] = to_string(world.party.facing);
    doc["starting_position"] = std::move(start);

    json plates = json::array();
    json buttons = json::array();
    json fountains = json::array();

    for (const auto& map : world.maps) {
        for (const auto& s : map.sensors) {
            if (!s.position_valid) continue;

            if (s.kind == sensor_kind::pressure_plate) {
                json entry = sensor_position(map, s);
                entry["type"] = s.type;
                plates.push_back(std::move(entry));
            } else if (s.kind == sensor_kind::wall_button) {
                json entry = sensor_position(map, s);
                entry["direction"] = to_string(s.facing);
                entry["type"] = s.type;
                buttons.push_back(std::move(entry));
            }

            if (s.fountain) {
                json entry = sensor_position(map, s);
                entry["direction"] = to_string(s.facing);
                fountains.push_back(std::move(entry));
            }
        }
    }

    doc["pressure_plates"] = std::move(plates);
    doc["buttons"] = std::move(buttons);
    doc["fountains"] = std::move(fountains);
    return doc.dump(json_indent);
}

decode_result write_json(const decoded_world& world, const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return decode_result::failure(decode_error::io_error,
            "cannot create " + dir.string() + ": " + ec.message());
    }

    for (std::size_t i = 0; i < world.maps.size(); ++i) {
        const auto& map = world.maps[i];
        std::string text;
        auto result = level_to_json(world, i, text);
        if (!result) return result;

        char name[32];
        std::snprintf(name, sizeof(name), "level_%02u.json", map.level);
        const auto path = dir / name;
        if (!write_text(path, text)) {
            return decode_result::failure(decode_error::io_error, "failed to write " + path.string());
        }
    }

    const auto path = dir / "legend.json";
    if (!write_text(path, legend_to_json(world))) {
        return decode_result::failure(decode_error::io_error, "failed to write " + path.string());
    }
    return decode_result::success();
}

} // namespace dungeon_map
