#ifndef DUNGEON_MAP_RENDER_HPP_
#define DUNGEON_MAP_RENDER_HPP_

#include <dungeon_map/dungeon_map_export.h>
#include <dungeon_map/types.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dungeon_map {

// ============================================================================
// RGBA Image
// ============================================================================

/**
 * Simple RGBA8888 image, 4 bytes per pixel, rows packed without padding.
 */
class DUNGEON_MAP_EXPORT rgba_image {
public:
    rgba_image() = default;

    /**
     * Resize and clear to transparent black.
     * @return false on invalid or oversized dimensions
     */
    bool set_size(int width, int height);

    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] std::span<const std::uint8_t> pixels() const noexcept { return pixels_; }
    [[nodiscard]] std::span<std::uint8_t> mutable_pixels() noexcept { return pixels_; }

    [[nodiscard]] std::array<std::uint8_t, 4> pixel(int x, int y) const noexcept;
    void set_pixel(int x, int y, std::array<std::uint8_t, 4> rgba) noexcept;

    /**
     * Fill a rectangle, clipped to the image.
     */
    void fill(int x, int y, int w, int h, std::array<std::uint8_t, 4> rgba) noexcept;

    /**
     * Alpha-blend src onto this image with its top-left corner at (x, y).
     */
    void blend(const rgba_image& src, int x, int y) noexcept;

    /**
     * Copy of the image rotated clockwise by quarter_turns * 90 degrees.
     */
    [[nodiscard]] rgba_image rotated(int quarter_turns) const;

private:
    std::vector<std::uint8_t> pixels_;
    int width_ = 0;
    int height_ = 0;
};

// ============================================================================
// Tile Assets
// ============================================================================

/**
 * PNG tile artwork: one image per legend name plus sensor overlays.
 * All base tiles share the size of the first one loaded.
 */
class DUNGEON_MAP_EXPORT tileset {
public:
    static constexpr std::string_view pressure_plate_asset = "pressure_plate.png";
    static constexpr std::string_view button_asset = "button.png";

    /**
     * Load "<name>.png" for every legend entry, then the overlay icons.
     * @param dir Directory holding the PNG assets
     * @param legend Tile kinds to load
     * @param tiles Destination tileset
     * @return io_error if a base tile is missing or unreadable,
     *         invalid_argument if tile sizes disagree
     */
    [[nodiscard]] static decode_result load(const std::filesystem::path& dir,
                                            std::span<const tile_code> legend,
                                            tileset& tiles);

    /**
     * Add a base tile image. The first tile fixes the tile size.
     * @return false if the size differs from earlier tiles
     */
    bool add_tile(std::string_view name, rgba_image image);

    void set_pressure_plate(rgba_image image) { pressure_plate_ = std::move(image); }
    void set_button(rgba_image image) { button_ = std::move(image); }

    [[nodiscard]] int tile_width() const noexcept { return tile_width_; }
    [[nodiscard]] int tile_height() const noexcept { return tile_height_; }

    [[nodiscard]] const rgba_image* tile(std::string_view name) const noexcept;
    [[nodiscard]] const rgba_image* pressure_plate() const noexcept;
    [[nodiscard]] const rgba_image* button() const noexcept;

private:
    std::map<std::string, rgba_image, std::less<>> tiles_;
    rgba_image pressure_plate_;
    rgba_image button_;
    int tile_width_ = 0;
    int tile_height_ = 0;
};

// ============================================================================
// Map Rendering
// ============================================================================

struct render_options {
    int tile_size = 16;        // pixels per cell when no tileset is given
    bool draw_sensors = true;
    bool draw_party = true;
};

/**
 * Flat colour used for a tile kind when no artwork is available.
 */
[[nodiscard]] DUNGEON_MAP_EXPORT std::array<std::uint8_t, 4> tile_color(const tile_code& code) noexcept;

/**
 * Render one decoded map.
 * @param world Decoded world
 * @param map_index Map to draw
 * @param image Destination image (32 * tile size square)
 * @param options Render options
 * @param tiles Optional tile artwork; flat colours are used when null
 * @return invalid_argument for a bad map index or tile size
 */
[[nodiscard]] DUNGEON_MAP_EXPORT decode_result render_map(const decoded_world& world,
                                                          std::size_t map_index,
                                                          rgba_image& image,
                                                          const render_options& options = {},
                                                          const tileset* tiles = nullptr);

// ============================================================================
// PNG Encoding
// ============================================================================

/**
 * Encode an image to PNG format.
 * @return PNG-encoded data, or empty vector on failure
 */
[[nodiscard]] DUNGEON_MAP_EXPORT std::vector<std::uint8_t> encode_png(const rgba_image& image);

/**
 * Save an image to a PNG file.
 * @return true on success
 */
[[nodiscard]] DUNGEON_MAP_EXPORT bool save_png(const rgba_image& image,
                                               const std::filesystem::path& path);

/**
 * Decode PNG data into an RGBA image.
 */
[[nodiscard]] DUNGEON_MAP_EXPORT decode_result decode_png(std::span<const std::uint8_t> data,
                                                          rgba_image& image);

} // namespace dungeon_map

#endif // DUNGEON_MAP_RENDER_HPP_
