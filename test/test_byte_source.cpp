#include <doctest/doctest.h>
#include <dungeon_map/byte_source.hpp>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <vector>

TEST_CASE("Byte source: little-endian reads") {
    const std::vector<std::uint8_t> data = {0x34, 0x12, 0x78, 0x56, 0xBC, 0x9A};
    const dungeon_map::byte_source source(data);

    CHECK(source.size() == 6);
    CHECK_FALSE(source.empty());
    CHECK(source.read_u8(0) == 0x34);
    CHECK(source.read_u16le(0) == 0x1234);
    CHECK(source.read_u16le(1) == 0x7812);
    CHECK(source.read_u32le(0) == 0x56781234u);
    CHECK(source.read_u32le(2) == 0x9ABC5678u);

    SUBCASE("read_uint dispatches on width") {
        CHECK(source.read_uint(4, 1) == 0xBC);
        CHECK(source.read_uint(4, 2) == 0x9ABC);
        CHECK(source.read_uint(0, 4) == 0x56781234u);
    }

    SUBCASE("unsupported width is rejected") {
        CHECK_THROWS_AS((void)source.read_uint(0, 3), std::invalid_argument);
        try {
            (void)source.read_uint(2, 8);
            FAIL("read_uint accepted width 8");
        } catch (const dungeon_map::field_width_error& e) {
            CHECK(e.offset() == 2);
            CHECK(e.width() == 8);
        }
    }
}

TEST_CASE("Byte source: reads past the end throw") {
    const dungeon_map::byte_source source(std::vector<std::uint8_t>{1, 2, 3});

    CHECK_THROWS_AS((void)source.read_u8(3), dungeon_map::out_of_bounds_error);
    CHECK_THROWS_AS((void)source.read_u16le(2), dungeon_map::out_of_bounds_error);
    CHECK_THROWS_AS((void)source.read_u32le(0), dungeon_map::out_of_bounds_error);

    try {
        (void)source.read_u16le(2);
        FAIL("expected out_of_bounds_error");
    } catch (const dungeon_map::out_of_bounds_error& e) {
        CHECK(e.offset() == 2);
        CHECK(e.width() == 2);
    }
}

TEST_CASE("Byte source: range checks") {
    const dungeon_map::byte_source source(std::vector<std::uint8_t>(16, 0));

    CHECK(source.contains(0, 16));
    CHECK(source.contains(16, 0));
    CHECK_FALSE(source.contains(0, 17));
    CHECK_FALSE(source.contains(17, 0));
    CHECK_FALSE(source.contains(8, std::numeric_limits<std::size_t>::max()));
    CHECK_FALSE(source.contains(std::numeric_limits<std::size_t>::max(), 2));
}

TEST_CASE("Byte source: empty buffer") {
    const dungeon_map::byte_source source;

    CHECK(source.empty());
    CHECK(source.contains(0, 0));
    CHECK_THROWS_AS((void)source.read_u8(0), dungeon_map::out_of_bounds_error);
}
