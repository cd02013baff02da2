#include <doctest/doctest.h>
#include <dungeon_map/party_locator.hpp>

#include "helpers/world_builder.hpp"

#include <cstdint>
#include <vector>

using namespace test_helpers;

namespace {

dungeon_map::byte_source indexed_party_record(std::uint8_t map, std::uint8_t x, std::uint8_t y, std::uint8_t facing) {
    byte_writer out(8);
    out.u8(0x02, map);
    out.u8(0x03, x);
    out.u8(0x04, y);
    out.u8(0x05, facing);
    return dungeon_map::byte_source(out.bytes());
}

} // namespace

TEST_CASE("Party: indexed byte fields") {
    const auto source = indexed_party_record(1, 7, 9, 3);

    dungeon_map::party_start party;
    auto result = dungeon_map::locate_party(source, dungeon_map::indexed_format(), 2, party);

    REQUIRE(result.ok);
    CHECK(party.map_index == 1);
    CHECK(party.x == 7);
    CHECK(party.y == 9);
    CHECK(party.facing == dungeon_map::direction::west);
}

TEST_CASE("Party: invalid records") {
    dungeon_map::party_start party;
    party.x = 99;

    SUBCASE("map index beyond the map count") {
        const auto source = indexed_party_record(2, 0, 0, 0);
        auto result = dungeon_map::locate_party(source, dungeon_map::indexed_format(), 2, party);
        CHECK(result.error == dungeon_map::decode_error::malformed_header);
    }

    SUBCASE("facing is not a direction") {
        const auto source = indexed_party_record(0, 0, 0, 4);
        auto result = dungeon_map::locate_party(source, dungeon_map::indexed_format(), 1, party);
        CHECK(result.error == dungeon_map::decode_error::malformed_header);
        CHECK(result.offset == 0x05);
    }

    SUBCASE("position outside the grid") {
        const auto source = indexed_party_record(0, 32, 0, 0);
        auto result = dungeon_map::locate_party(source, dungeon_map::indexed_format(), 1, party);
        CHECK(result.error == dungeon_map::decode_error::malformed_header);
    }

    SUBCASE("record past the end of the file") {
        const dungeon_map::byte_source source(std::vector<std::uint8_t>{0, 0, 0, 0});
        auto result = dungeon_map::locate_party(source, dungeon_map::indexed_format(), 1, party);
        CHECK(result.error == dungeon_map::decode_error::out_of_bounds);
    }

    // Failed lookups leave the destination alone
    CHECK(party.x == 99);
}

TEST_CASE("Party: DM1 packed word") {
    dm1_builder builder;
    builder.add_map(dm1_map(32, 32, 0));
    builder.set_party(10, 20, 2);
    const dungeon_map::byte_source source(builder.build());

    dungeon_map::party_start party;
    auto result = dungeon_map::locate_party(source, dungeon_map::dm1_pc_format(), 1, party);

    REQUIRE(result.ok);
    CHECK(party.map_index == 0);
    CHECK(party.x == 10);
    CHECK(party.y == 20);
    CHECK(party.facing == dungeon_map::direction::south);

    SUBCASE("no maps to start on") {
        result = dungeon_map::locate_party(source, dungeon_map::dm1_pc_format(), 0, party);
        CHECK(result.error == dungeon_map::decode_error::malformed_header);
    }
}
