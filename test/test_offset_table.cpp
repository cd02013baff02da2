#include <doctest/doctest.h>
#include <dungeon_map/offset_table.hpp>

#include "helpers/world_builder.hpp"

#include <cstdint>
#include <utility>
#include <vector>

using test_helpers::byte_writer;

namespace {

// Indexed header with raw (tile, sensor) offsets and a file of `size` bytes
dungeon_map::byte_source indexed_table(const std::vector<std::pair<std::uint32_t, std::uint32_t>>& entries,
                                       std::size_t size) {
    byte_writer out(size);
    out.u16(0x00, static_cast<std::uint16_t>(entries.size()));
    for (std::size_t i = 0; i < entries.size(); ++i) {
        out.u32(0x08 + i * 8, entries[i].first);
        out.u32(0x08 + i * 8 + 4, entries[i].second);
    }
    return dungeon_map::byte_source(out.bytes());
}

} // namespace

TEST_CASE("Offset table: indexed entries in file order") {
    const auto source = indexed_table({{64, 4160}, {4192, 8288}}, 8400);

    dungeon_map::offset_table table;
    auto result = dungeon_map::read_offset_table(source, dungeon_map::indexed_format(), table);

    REQUIRE(result.ok);
    REQUIRE(table.map_count() == 2);
    CHECK(table.entries[0].tile_offset == 64);
    CHECK(table.entries[0].sensor_offset == 4160);
    CHECK(table.entries[1].tile_offset == 4192);
    CHECK(table.entries[1].sensor_offset == 8288);

    SUBCASE("formats without geometry use full-size maps numbered by index") {
        CHECK(table.entries[0].width == 32);
        CHECK(table.entries[0].height == 32);
        CHECK(table.entries[1].level == 1);
    }
}

TEST_CASE("Offset table: empty table") {
    const auto source = indexed_table({}, 8);

    dungeon_map::offset_table table;
    auto result = dungeon_map::read_offset_table(source, dungeon_map::indexed_format(), table);

    REQUIRE(result.ok);
    CHECK(table.map_count() == 0);
}

TEST_CASE("Offset table: impossible headers") {
    dungeon_map::offset_table table;

    SUBCASE("count above the format limit") {
        byte_writer out(0x1000);
        out.u16(0x00, 65);
        const dungeon_map::byte_source source(out.bytes());

        auto result = dungeon_map::read_offset_table(source, dungeon_map::indexed_format(), table);
        CHECK_FALSE(result.ok);
        CHECK(result.error == dungeon_map::decode_error::malformed_header);
        CHECK(result.offset == 0x00);
    }

    SUBCASE("count above the caller's limit") {
        const auto source = indexed_table({{64, 1100}, {64, 1100}, {64, 1100}}, 1200);
        dungeon_map::decode_options options;
        options.max_maps = 2;

        auto result = dungeon_map::read_offset_table(source, dungeon_map::indexed_format(), table, options);
        CHECK(result.error == dungeon_map::decode_error::malformed_header);
    }

    SUBCASE("table larger than the file") {
        byte_writer out(0x20);
        out.u16(0x00, 10);
        const dungeon_map::byte_source source(out.bytes());

        auto result = dungeon_map::read_offset_table(source, dungeon_map::indexed_format(), table);
        CHECK(result.error == dungeon_map::decode_error::malformed_header);
        CHECK(result.offset == 0x08);
    }

    SUBCASE("tile offset outside the file") {
        const auto source = indexed_table({{5000, 100}}, 200);

        auto result = dungeon_map::read_offset_table(source, dungeon_map::indexed_format(), table);
        CHECK(result.error == dungeon_map::decode_error::malformed_header);
        CHECK(result.offset == 0x08);
    }

    SUBCASE("sensor offset outside the file") {
        const auto source = indexed_table({{100, 200}}, 200);

        auto result = dungeon_map::read_offset_table(source, dungeon_map::indexed_format(), table);
        CHECK(result.error == dungeon_map::decode_error::malformed_header);
        CHECK(result.offset == 0x0C);
    }

    SUBCASE("header field past the buffer") {
        const dungeon_map::byte_source source(std::vector<std::uint8_t>{0x01});

        auto result = dungeon_map::read_offset_table(source, dungeon_map::indexed_format(), table);
        CHECK(result.error == dungeon_map::decode_error::out_of_bounds);
    }
}

TEST_CASE("Offset table: DM1 geometry and graphics counts") {
    test_helpers::dm1_builder builder;
    test_helpers::dm1_map first(20, 10, 3);
    first.creature_graphics = {7};
    first.wall_decorations = {4, 35};
    builder.add_map(first);
    builder.add_map(test_helpers::dm1_map(32, 32, 4));

    const dungeon_map::byte_source source(builder.build());
    dungeon_map::offset_table table;
    auto result = dungeon_map::read_offset_table(source, dungeon_map::dm1_pc_format(), table);

    REQUIRE(result.ok);
    REQUIRE(table.map_count() == 2);

    const auto& entry = table.entries[0];
    CHECK(entry.tile_offset == test_helpers::dm1_tile_data_base);
    CHECK(entry.width == 20);
    CHECK(entry.height == 10);
    CHECK(entry.level == 3);
    CHECK(entry.creature_graphics == 1);
    CHECK(entry.wall_graphics == 2);

    // Sensors share one record block
    CHECK(entry.sensor_offset == test_helpers::dm1_sensor_records);

    CHECK(table.entries[1].tile_offset == test_helpers::dm1_tile_data_base + 200 + 1 + 2);
    CHECK(table.entries[1].level == 4);
}

TEST_CASE("Offset table: unsupported count width reports the count field") {
    auto format = dungeon_map::dm1_pc_format();
    format.header.map_count_width = 3;

    const auto bytes = test_helpers::dm1_builder().build();
    const dungeon_map::byte_source source(bytes);

    dungeon_map::offset_table table;
    auto result = dungeon_map::read_offset_table(source, format, table);

    CHECK_FALSE(result.ok);
    CHECK(result.error == dungeon_map::decode_error::invalid_argument);
    CHECK(result.offset == format.header.map_count_offset);
    CHECK(result.offset != 0);
}
