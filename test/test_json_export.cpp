#include <doctest/doctest.h>
#include <dungeon_map/json_export.hpp>
#include <dungeon_map/world.hpp>

#include "helpers/world_builder.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace test_helpers;
using json = nlohmann::ordered_json;

namespace {

// One 10x8 DM1 map on level 2 with a plate, a fountain, a button, a door and stairs
dungeon_map::decoded_world dm1_json_world() {
    dm1_map map(10, 8, 2);
    map.set(2, 3, dm1_tile(dm1_floor, dm1_objects_flag));
    map.set(5, 0, dm1_tile(dm1_wall, dm1_objects_flag));
    map.set(6, 1, dm1_tile(dm1_wall, dm1_objects_flag));
    map.set(1, 1, dm1_tile(dm1_door, dm1_vertical_flag));
    map.set(3, 4, dm1_tile(dm1_stairs, dm1_up_flag));
    map.wall_decorations = {35};

    dm1_builder builder;
    builder.add_map(map);
    builder.set_party(2, 3, 1);
    builder.set_first_objects({sensor_ref(0), sensor_ref(1, 2), sensor_ref(2, 1)});
    builder.set_sensor(0, 1);
    builder.set_sensor(1, 0, dungeon_map::object_id::end_of_chain, 1);
    builder.set_sensor(2, 3);
    const auto bytes = builder.build();

    dungeon_map::decoded_world world;
    REQUIRE(dungeon_map::decode_world(bytes, world).ok);
    return world;
}

json read_json_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    REQUIRE(file.good());
    return json::parse(file);
}

} // namespace

TEST_CASE("JSON: level document") {
    const auto world = dm1_json_world();

    std::string text;
    REQUIRE(dungeon_map::level_to_json(world, 0, text).ok);
    const auto doc = json::parse(text);

    CHECK(doc["level"] == 2);
    CHECK(doc["width"] == 10);
    CHECK(doc["height"] == 8);

    SUBCASE("keys in document order") {
        std::vector<std::string> keys;
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            keys.push_back(it.key());
        }
        const std::vector<std::string> expected = {"level", "width", "height", "grid",
                                                   "door_orientation", "stairs_orientation",
                                                   "stairs_direction"};
        CHECK(keys == expected);
    }

    SUBCASE("grid is 32 rows of 32 names indexed [y][x]") {
        const auto& grid = doc["grid"];
        REQUIRE(grid.size() == 32);
        CHECK(grid[0].size() == 32);
        CHECK(grid[3][2] == "floor");
        CHECK(grid[0][5] == "wall");
        CHECK(grid[1][1] == "door");
        CHECK(grid[4][3] == "stairs");
        CHECK(grid[20][20] == "wall");
    }

    SUBCASE("door and stairs attributes") {
        CHECK(doc["door_orientation"][1][1] == "vertical");
        CHECK(doc["door_orientation"][3][2].is_null());
        CHECK(doc["stairs_orientation"][4][3] == "horizontal");
        CHECK(doc["stairs_direction"][4][3] == "up");
        CHECK(doc["stairs_direction"][1][1].is_null());
    }

    SUBCASE("cells outside the map extent are null") {
        CHECK(doc["door_orientation"][20][20].is_null());
        CHECK(doc["stairs_orientation"][7][10].is_null());
    }
}

TEST_CASE("JSON: level document for a missing map") {
    const auto world = dm1_json_world();

    std::string text = "untouched";
    auto result = dungeon_map::level_to_json(world, 1, text);
    CHECK(result.error == dungeon_map::decode_error::invalid_argument);
    CHECK(text == "untouched");
}

TEST_CASE("JSON: legend document") {
    const auto world = dm1_json_world();
    const auto doc = json::parse(dungeon_map::legend_to_json(world));

    SUBCASE("tile codes come first as decimal keys") {
        CHECK(doc.begin().key() == "0");
        CHECK(doc["0"] == "wall");
        CHECK(doc["4"] == "door");
        CHECK(doc["6"] == "trick_wall");
        CHECK(doc["7"] == "empty");
    }

    SUBCASE("starting position") {
        const auto& start = doc["starting_position"];
        CHECK(start["map"] == 0);
        CHECK(start["x"] == 2);
        CHECK(start["y"] == 3);
        CHECK(start["direction"] == "east");
    }

    SUBCASE("pressure plates") {
        const auto& plates = doc["pressure_plates"];
        REQUIRE(plates.size() == 1);
        CHECK((plates[0] == json{{"level", 2}, {"x", 2}, {"y", 3}, {"type", 1}}));
    }

    SUBCASE("buttons carry their direction") {
        const auto& buttons = doc["buttons"];
        REQUIRE(buttons.size() == 1);
        CHECK((buttons[0] == json{{"level", 2}, {"x", 6}, {"y", 1}, {"direction", "east"}, {"type", 3}}));
    }

    SUBCASE("fountains") {
        const auto& fountains = doc["fountains"];
        REQUIRE(fountains.size() == 1);
        CHECK((fountains[0] == json{{"level", 2}, {"x", 5}, {"y", 0}, {"direction", "south"}}));
    }
}

TEST_CASE("JSON: sensors outside the grid are left out") {
    indexed_map map;
    map.sensors.push_back({0x01, 0, 4, 4});
    map.sensors.push_back({0x02, 0, 40, 4});
    map.sensors.push_back({0x41, 3, 4, 99});
    const auto bytes = build_indexed_world({map});

    dungeon_map::decoded_world world;
    REQUIRE(dungeon_map::decode_world(bytes, world, dungeon_map::indexed_format()).ok);
    const auto doc = json::parse(dungeon_map::legend_to_json(world));

    REQUIRE(doc["pressure_plates"].size() == 1);
    CHECK(doc["pressure_plates"][0]["x"] == 4);
    CHECK(doc["buttons"].empty());
    CHECK(doc["0"] == "empty floor");
}

TEST_CASE("JSON: files written to a directory") {
    const auto world = dm1_json_world();
    const auto dir = std::filesystem::temp_directory_path() / "dungeon_map_json_test";
    std::filesystem::remove_all(dir);

    REQUIRE(dungeon_map::write_json(world, dir).ok);

    const auto level = read_json_file(dir / "level_02.json");
    CHECK(level["level"] == 2);
    CHECK(level["grid"][1][1] == "door");

    const auto legend = read_json_file(dir / "legend.json");
    CHECK(legend["starting_position"]["direction"] == "east");
    CHECK(legend["fountains"].size() == 1);

    std::filesystem::remove_all(dir);
}
