#include <dungeon_map/byte_source.hpp>
#include "byte_io.hpp"

#include <string>
#include <utility>

namespace dungeon_map {

namespace {

std::string describe_overrun(std::size_t offset, std::size_t width, std::size_t size) {
    return "read of " + std::to_string(width) + " bytes at offset " + std::to_string(offset) +
           " exceeds buffer of " + std::to_string(size) + " bytes";
}

} // namespace

out_of_bounds_error::out_of_bounds_error(std::size_t offset, std::size_t width, std::size_t size)
    : std::out_of_range(describe_overrun(offset, width, size)),
      offset_(offset),
      width_(width) {}

field_width_error::field_width_error(std::size_t offset, unsigned width)
    : std::invalid_argument("unsupported field width " + std::to_string(width) +
                            " at offset " + std::to_string(offset)),
      offset_(offset),
      width_(width) {}

byte_source::byte_source(std::vector<std::uint8_t> bytes) noexcept
    : bytes_(std::move(bytes)) {}

byte_source::byte_source(std::span<const std::uint8_t> bytes)
    : bytes_(bytes.begin(), bytes.end()) {}

bool byte_source::contains(std::size_t offset, std::size_t length) const noexcept {
    // Written to avoid overflow in offset + length
    return offset <= bytes_.size() && length <= bytes_.size() - offset;
}

void byte_source::require(std::size_t offset, std::size_t width) const {
    if (!contains(offset, width)) {
        throw out_of_bounds_error(offset, width, bytes_.size());
    }
}

std::uint8_t byte_source::read_u8(std::size_t offset) const {
    require(offset, 1);
    return bytes_[offset];
}

std::uint16_t byte_source::read_u16le(std::size_t offset) const {
    require(offset, 2);
    return read_le16(bytes_.data() + offset);
}

std::uint32_t byte_source::read_u32le(std::size_t offset) const {
    require(offset, 4);
    return read_le32(bytes_.data() + offset);
}

std::uint32_t byte_source::read_uint(std::size_t offset, unsigned width) const {
    switch (width) {
        case 1: return read_u8(offset);
        case 2: return read_u16le(offset);
        case 4: return read_u32le(offset);
        default:
            throw field_width_error(offset, width);
    }
}

} // namespace dungeon_map
