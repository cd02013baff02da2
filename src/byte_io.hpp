#pragma once

#include <cstdint>

namespace dungeon_map {

// Little-endian readers (callers check bounds)
inline std::uint16_t read_le16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>(p[0]) |
           (static_cast<std::uint16_t>(p[1]) << 8);
}

inline std::uint32_t read_le32(const std::uint8_t* p) {
    return static_cast<std::uint32_t>(p[0]) |
           (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) |
           (static_cast<std::uint32_t>(p[3]) << 24);
}

// Extract a masked bit field from a packed word
inline unsigned bit_field(std::uint32_t value, unsigned shift, std::uint32_t mask) {
    return static_cast<unsigned>((value >> shift) & mask);
}

} // namespace dungeon_map
