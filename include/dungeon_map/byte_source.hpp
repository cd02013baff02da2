#ifndef DUNGEON_MAP_BYTE_SOURCE_HPP_
#define DUNGEON_MAP_BYTE_SOURCE_HPP_

#include <dungeon_map/dungeon_map_export.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <vector>

namespace dungeon_map {

/**
 * Thrown by byte_source when a read would cross the end of the buffer.
 */
class DUNGEON_MAP_EXPORT out_of_bounds_error : public std::out_of_range {
public:
    out_of_bounds_error(std::size_t offset, std::size_t width, std::size_t size);

    [[nodiscard]] std::size_t offset() const noexcept { return offset_; }
    [[nodiscard]] std::size_t width() const noexcept { return width_; }

private:
    std::size_t offset_;
    std::size_t width_;
};

/**
 * Thrown by byte_source::read_uint for a field width other than 1, 2 or 4.
 */
class DUNGEON_MAP_EXPORT field_width_error : public std::invalid_argument {
public:
    field_width_error(std::size_t offset, unsigned width);

    [[nodiscard]] std::size_t offset() const noexcept { return offset_; }
    [[nodiscard]] unsigned width() const noexcept { return width_; }

private:
    std::size_t offset_;
    unsigned width_;
};

// ============================================================================
// Byte Source
// ============================================================================

/**
 * Immutable world file contents with bounds-checked little-endian reads.
 */
class DUNGEON_MAP_EXPORT byte_source {
public:
    byte_source() = default;
    explicit byte_source(std::vector<std::uint8_t> bytes) noexcept;
    explicit byte_source(std::span<const std::uint8_t> bytes);

    [[nodiscard]] std::size_t size() const noexcept { return bytes_.size(); }
    [[nodiscard]] bool empty() const noexcept { return bytes_.empty(); }
    [[nodiscard]] std::span<const std::uint8_t> bytes() const noexcept { return bytes_; }

    /**
     * Check that [offset, offset + length) lies inside the buffer.
     */
    [[nodiscard]] bool contains(std::size_t offset, std::size_t length) const noexcept;

    /**
     * Read an unsigned little-endian value.
     * @throws out_of_bounds_error if offset + width > size()
     */
    [[nodiscard]] std::uint8_t read_u8(std::size_t offset) const;
    [[nodiscard]] std::uint16_t read_u16le(std::size_t offset) const;
    [[nodiscard]] std::uint32_t read_u32le(std::size_t offset) const;

    /**
     * Read a 1, 2 or 4 byte unsigned little-endian value.
     * @throws field_width_error for any other width
     */
    [[nodiscard]] std::uint32_t read_uint(std::size_t offset, unsigned width) const;

private:
    void require(std::size_t offset, std::size_t width) const;

    std::vector<std::uint8_t> bytes_;
};

} // namespace dungeon_map

#endif // DUNGEON_MAP_BYTE_SOURCE_HPP_
