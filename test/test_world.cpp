#include <doctest/doctest.h>
#include <dungeon_map/world.hpp>

#include "helpers/world_builder.hpp"

#include <cstdint>
#include <string>
#include <vector>

using namespace test_helpers;

namespace {

std::vector<std::uint8_t> two_map_indexed_world() {
    indexed_map first;
    first.set(0, 0, indexed_wall);
    first.set(6, 6, 0x40);
    first.sensors.push_back({0x01, 0, 5, 10});
    first.sensors.push_back({0x43, 1, 0, 0});

    indexed_map second;
    second.set(12, 3, indexed_pit);
    second.sensors.push_back({0x02, 0, 31, 31});
    second.sensors.push_back({0x03, 0, 1, 200});

    return build_indexed_world({first, second}, {1, 4, 5, 2});
}

// Two DM1 maps whose flagged tiles share the global first-object list
dm1_builder dm1_world() {
    dm1_map first(10, 8, 0);
    first.set(2, 3, dm1_tile(dm1_floor, dm1_objects_flag));
    first.set(5, 0, dm1_tile(dm1_wall, dm1_objects_flag));
    first.wall_decorations = {35};

    dm1_map second(16, 16, 1);
    second.set(7, 7, dm1_tile(dm1_floor, dm1_objects_flag));

    dm1_builder builder;
    builder.add_map(first);
    builder.add_map(second);
    builder.set_party(2, 3, 1);
    builder.set_first_objects({sensor_ref(0), sensor_ref(1, 2), sensor_ref(2)});
    builder.set_sensor(0, 1);
    builder.set_sensor(1, 0, dungeon_map::object_id::end_of_chain, 1);
    builder.set_sensor(2, 4);
    return builder;
}

// Decode with a legend and format name that die when this returns
dungeon_map::decoded_world decode_with_scoped_legend(const std::vector<std::uint8_t>& bytes) {
    const std::vector<std::string> names = {"open flagstone corridor", "solid granite wall block"};
    const std::vector<dungeon_map::legend_entry> legend = {
        {indexed_floor, names[0]},
        {indexed_wall, names[1]},
    };
    const std::string format_name = "indexed-with-custom-legend";

    auto format = dungeon_map::indexed_format();
    format.name = format_name;
    format.grid.legend = legend;

    dungeon_map::decoded_world world;
    REQUIRE(dungeon_map::decode_world(bytes, world, format).ok);
    return world;
}

} // namespace

TEST_CASE("World: indexed file") {
    const auto bytes = two_map_indexed_world();
    dungeon_map::decoded_world world;
    auto result = dungeon_map::decode_world(bytes, world, dungeon_map::indexed_format());

    REQUIRE(result.ok);
    CHECK(world.format_name == "indexed");
    REQUIRE(world.map_count() == 2);

    SUBCASE("maps in file order") {
        CHECK(world.maps[0].index == 0);
        CHECK(world.maps[1].index == 1);
        CHECK(world.maps[0].grid.at(0, 0).code.name == "wall");
        CHECK(world.maps[1].grid.at(12, 3).code.name == "pit");
    }

    SUBCASE("sensors per map") {
        const auto& plate = world.maps[0].sensors[0];
        CHECK(plate.map_index == 0);
        CHECK(plate.x == 5);
        CHECK(plate.y == 10);
        CHECK(plate.kind == dungeon_map::sensor_kind::pressure_plate);

        CHECK(world.maps[0].count(dungeon_map::sensor_kind::wall_button) == 1);
        CHECK(world.maps[1].count(dungeon_map::sensor_kind::pressure_plate) == 2);
        CHECK(world.maps[1].sensors[0].map_index == 1);
        CHECK(world.all_sensors().size() == 4);
        CHECK(world.sensors_of(dungeon_map::sensor_kind::pressure_plate).size() == 3);
    }

    SUBCASE("soft anomalies are counted") {
        CHECK(world.maps[0].unknown_cells == 1);
        CHECK(world.maps[0].invalid_sensors == 0);
        CHECK(world.maps[1].invalid_sensors == 1);
        CHECK_FALSE(world.maps[1].sensors[1].position_valid);
    }

    SUBCASE("party start") {
        CHECK(world.party.map_index == 1);
        CHECK(world.party.x == 4);
        CHECK(world.party.y == 5);
        CHECK(world.party.facing == dungeon_map::direction::south);
        CHECK(world.party.map_index < world.maps.size());
    }

    SUBCASE("legend") {
        REQUIRE(world.legend.size() == 7);
        CHECK(world.legend[0].value == 0x00);
        CHECK(world.legend[0].name == "empty floor");
        CHECK(world.legend[0].known);
    }

    SUBCASE("grid and sensor invariants") {
        for (const auto& map : world.maps) {
            CHECK(map.grid.cells().size() == dungeon_map::tile_grid::cell_count);
            for (const auto& s : map.sensors) {
                CHECK((s.position_valid == (s.x < 32 && s.y < 32)));
            }
        }
    }
}

TEST_CASE("World: names outlive the format they were decoded with") {
    const auto world = decode_with_scoped_legend(two_map_indexed_world());

    CHECK(world.format_name == "indexed-with-custom-legend");
    REQUIRE(world.legend.size() == 2);
    CHECK(world.legend[0].name == "open flagstone corridor");
    CHECK(world.legend[1].name == "solid granite wall block");
    CHECK(world.maps[0].grid.at(0, 0).code.name == "solid granite wall block");
    CHECK(world.maps[0].grid.at(1, 0).code.name == "open flagstone corridor");
    CHECK(world.maps[1].grid.at(12, 3).code.name == dungeon_map::unknown_tile_name);
}

TEST_CASE("World: decoding is repeatable") {
    const auto bytes = two_map_indexed_world();
    const dungeon_map::byte_source source(bytes);

    dungeon_map::decoded_world first;
    dungeon_map::decoded_world second;
    REQUIRE(dungeon_map::decode_world(source, first, dungeon_map::indexed_format()).ok);
    REQUIRE(dungeon_map::decode_world(source, second, dungeon_map::indexed_format()).ok);
    CHECK(first == second);
}

TEST_CASE("World: failures") {
    dungeon_map::decoded_world world;

    SUBCASE("empty file") {
        auto result = dungeon_map::decode_world(std::vector<std::uint8_t>{}, world, dungeon_map::indexed_format());
        CHECK(result.error == dungeon_map::decode_error::out_of_bounds);
    }

    SUBCASE("truncated in the second map's grid") {
        auto bytes = two_map_indexed_world();
        const std::size_t second_grid = indexed_tile_offset(bytes, 1);
        bytes.resize(second_grid + 100);

        auto result = dungeon_map::decode_world(bytes, world, dungeon_map::indexed_format());
        CHECK(result.error == dungeon_map::decode_error::truncated_grid);
        CHECK(result.offset == second_grid);
        CHECK(result.message.rfind("map 1: ", 0) == 0);
    }

    SUBCASE("party on a missing map") {
        auto bytes = two_map_indexed_world();
        bytes[0x02] = 2;

        auto result = dungeon_map::decode_world(bytes, world, dungeon_map::indexed_format());
        CHECK(result.error == dungeon_map::decode_error::malformed_header);
    }

    CHECK(world.maps.empty());
}

TEST_CASE("World: failed decode keeps the previous world") {
    const auto bytes = two_map_indexed_world();
    dungeon_map::decoded_world world;
    REQUIRE(dungeon_map::decode_world(bytes, world, dungeon_map::indexed_format()).ok);
    const auto before = world;

    std::vector<std::uint8_t> cut(bytes.begin(), bytes.begin() + 600);
    auto result = dungeon_map::decode_world(cut, world, dungeon_map::indexed_format());

    CHECK_FALSE(result.ok);
    CHECK(world == before);
}

TEST_CASE("World: DM1 file") {
    const auto bytes = dm1_world().build();
    dungeon_map::decoded_world world;
    auto result = dungeon_map::decode_world(bytes, world);

    REQUIRE(result.ok);
    CHECK(world.format_name == "dm1-pc");
    REQUIRE(world.map_count() == 2);

    CHECK(world.maps[0].width == 10);
    CHECK(world.maps[0].height == 8);
    CHECK(world.maps[1].level == 1);
    CHECK(world.maps[0].grid.at(20, 20).code.name == "wall");
    CHECK(world.maps[0].wall_decorations == std::vector<std::uint8_t>{35});

    SUBCASE("first-object ids are claimed in map then column order") {
        REQUIRE(world.maps[0].sensors.size() == 2);
        CHECK(world.maps[0].sensors[0].x == 2);
        CHECK(world.maps[0].sensors[0].kind == dungeon_map::sensor_kind::pressure_plate);
        CHECK(world.maps[0].sensors[1].x == 5);
        CHECK(world.maps[0].sensors[1].fountain);

        REQUIRE(world.maps[1].sensors.size() == 1);
        CHECK(world.maps[1].sensors[0].map_index == 1);
        CHECK(world.maps[1].sensors[0].x == 7);
        CHECK(world.maps[1].sensors[0].record == 2);
    }

    SUBCASE("fountains across the world") {
        const auto fountains = world.fountains();
        REQUIRE(fountains.size() == 1);
        CHECK(fountains[0].y == 0);
    }

    SUBCASE("party on map 0") {
        CHECK(world.party.map_index == 0);
        CHECK(world.party.x == 2);
        CHECK(world.party.y == 3);
        CHECK(world.party.facing == dungeon_map::direction::east);
    }

    SUBCASE("legend") {
        CHECK(world.legend.size() == 8);
        CHECK(world.legend[7].name == "empty");
    }
}

TEST_CASE("World: DM1 first-object list longer than the flagged tiles") {
    auto builder = dm1_world();
    builder.set_first_objects({sensor_ref(0), sensor_ref(1, 2), sensor_ref(2), sensor_ref(3)});
    builder.set_sensor(3, 1);
    const auto bytes = builder.build();

    dungeon_map::decoded_world world;
    auto result = dungeon_map::decode_world(bytes, world);
    CHECK(result.error == dungeon_map::decode_error::malformed_object_list);
}

TEST_CASE("World: DM1 map count above the limit") {
    auto bytes = dm1_world().build();
    bytes[0x04] = 65;

    dungeon_map::decoded_world world;
    auto result = dungeon_map::decode_world(bytes, world);
    CHECK(result.error == dungeon_map::decode_error::malformed_header);
}
