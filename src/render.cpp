#include <dungeon_map/render.hpp>
#include <lodepng.h>

#include <algorithm>
#include <fstream>
#include <limits>
#include <new>
#include <string>

namespace dungeon_map {

namespace {

using rgba = std::array<std::uint8_t, 4>;

constexpr rgba PLATE_COLOR = {230, 140, 30, 255};
constexpr rgba BUTTON_COLOR = {250, 220, 40, 255};
constexpr rgba PARTY_COLOR = {40, 200, 230, 255};
constexpr rgba DOOR_BAR_COLOR = {90, 50, 20, 255};
constexpr rgba UNKNOWN_COLOR = {255, 0, 255, 255};
constexpr rgba FALLBACK_COLOR = {128, 128, 128, 255};

struct named_color {
    std::string_view name;
    rgba color;
};

// Covers the names used by every built-in legend
constexpr named_color TILE_COLORS[] = {
    {"wall",        {60, 60, 70, 255}},
    {"floor",       {200, 195, 180, 255}},
    {"empty floor", {200, 195, 180, 255}},
    {"empty",       {170, 165, 150, 255}},
    {"pit",         {25, 20, 20, 255}},
    {"stairs",      {120, 170, 90, 255}},
    {"door",        {150, 95, 45, 255}},
    {"teleporter",  {80, 110, 220, 255}},
    {"trick_wall",  {110, 90, 130, 255}},
    {"trick wall",  {110, 90, 130, 255}},
};

constexpr std::size_t MAX_IMAGE_BYTES = 256ULL * 1024ULL * 1024ULL;

int quarter_turns_for(direction facing) {
    return static_cast<int>(facing);
}

// Bar along the tile edge the button faces
void draw_button_marker(rgba_image& image, int px, int py, int size, direction facing) {
    const int thick = std::max(1, size / 5);
    switch (facing) {
        case direction::north: image.fill(px, py, size, thick, BUTTON_COLOR); break;
        case direction::east:  image.fill(px + size - thick, py, thick, size, BUTTON_COLOR); break;
        case direction::south: image.fill(px, py + size - thick, size, thick, BUTTON_COLOR); break;
        case direction::west:  image.fill(px, py, thick, size, BUTTON_COLOR); break;
    }
}

void draw_party_marker(rgba_image& image, int px, int py, int size, direction facing) {
    const int body = std::max(1, size / 3);
    const int cx = px + (size - body) / 2;
    const int cy = py + (size - body) / 2;
    image.fill(cx, cy, body, body, PARTY_COLOR);

    // Notch towards the facing direction
    const int notch = std::max(1, body / 2);
    switch (facing) {
        case direction::north: image.fill(cx + (body - notch) / 2, cy - notch, notch, notch, PARTY_COLOR); break;
        case direction::east:  image.fill(cx + body, cy + (body - notch) / 2, notch, notch, PARTY_COLOR); break;
        case direction::south: image.fill(cx + (body - notch) / 2, cy + body, notch, notch, PARTY_COLOR); break;
        case direction::west:  image.fill(cx - notch, cy + (body - notch) / 2, notch, notch, PARTY_COLOR); break;
    }
}

void draw_centered(rgba_image& image, const rgba_image& icon, int px, int py, int size) {
    image.blend(icon, px + (size - icon.width()) / 2, py + (size - icon.height()) / 2);
}

} // namespace

// ============================================================================
// RGBA Image
// ============================================================================

bool rgba_image::set_size(int width, int height) {
    if (width <= 0 || height <= 0) {
        return false;
    }

    const std::size_t w = static_cast<std::size_t>(width);
    const std::size_t h = static_cast<std::size_t>(height);
    if (w > MAX_IMAGE_BYTES / 4 / h) {
        return false;
    }

    try {
        pixels_.assign(w * h * 4, 0);
    } catch (const std::bad_alloc&) {
        return false;
    }

    width_ = width;
    height_ = height;
    return true;
}

std::array<std::uint8_t, 4> rgba_image::pixel(int x, int y) const noexcept {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) {
        return {0, 0, 0, 0};
    }
    const std::size_t offset = (static_cast<std::size_t>(y) * width_ + x) * 4;
    return {pixels_[offset], pixels_[offset + 1], pixels_[offset + 2], pixels_[offset + 3]};
}

void rgba_image::set_pixel(int x, int y, std::array<std::uint8_t, 4> color) noexcept {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) {
        return;
    }
    const std::size_t offset = (static_cast<std::size_t>(y) * width_ + x) * 4;
    std::copy(color.begin(), color.end(), pixels_.begin() + static_cast<std::ptrdiff_t>(offset));
}

void rgba_image::fill(int x, int y, int w, int h, std::array<std::uint8_t, 4> color) noexcept {
    const int x0 = std::max(x, 0);
    const int y0 = std::max(y, 0);
    const int x1 = std::min(x + w, width_);
    const int y1 = std::min(y + h, height_);
    for (int py = y0; py < y1; ++py) {
        for (int px = x0; px < x1; ++px) {
            set_pixel(px, py, color);
        }
    }
}

void rgba_image::blend(const rgba_image& src, int x, int y) noexcept {
    for (int sy = 0; sy < src.height(); ++sy) {
        for (int sx = 0; sx < src.width(); ++sx) {
            const int dx = x + sx;
            const int dy = y + sy;
            if (dx < 0 || dx >= width_ || dy < 0 || dy >= height_) {
                continue;
            }

            const auto s = src.pixel(sx, sy);
            const unsigned sa = s[3];
            if (sa == 0) continue;
            if (sa == 255) {
                set_pixel(dx, dy, s);
                continue;
            }

            // Porter-Duff "over" in 8-bit fixed point
            const auto d = pixel(dx, dy);
            const unsigned inv = 255 - sa;
            const unsigned out_a = sa + (d[3] * inv + 127) / 255;
            std::array<std::uint8_t, 4> out{};
            for (int c = 0; c < 3; ++c) {
                const unsigned premul = s[c] * sa + (d[c] * d[3] * inv + 127) / 255;
                out[c] = static_cast<std::uint8_t>(out_a ? std::min(255u, (premul + out_a / 2) / out_a) : 0);
            }
            out[3] = static_cast<std::uint8_t>(out_a);
            set_pixel(dx, dy, out);
        }
    }
}

rgba_image rgba_image::rotated(int quarter_turns) const {
    const int turns = ((quarter_turns % 4) + 4) % 4;
    if (turns == 0 || width_ == 0 || height_ == 0) {
        return *this;
    }

    rgba_image out;
    if (turns == 2) {
        out.set_size(width_, height_);
    } else {
        out.set_size(height_, width_);
    }

    for (int y = 0; y < height_; ++y) {
        for (int x = 0; x < width_; ++x) {
            const auto p = pixel(x, y);
            switch (turns) {
                case 1: out.set_pixel(height_ - 1 - y, x, p); break;
                case 2: out.set_pixel(width_ - 1 - x, height_ - 1 - y, p); break;
                case 3: out.set_pixel(y, width_ - 1 - x, p); break;
                default: break;
            }
        }
    }
    return out;
}

// ============================================================================
// Tile Assets
// ============================================================================

bool tileset::add_tile(std::string_view name, rgba_image image) {
    if (tiles_.empty()) {
        tile_width_ = image.width();
        tile_height_ = image.height();
    } else if (image.width() != tile_width_ || image.height() != tile_height_) {
        return false;
    }
    tiles_.insert_or_assign(std::string(name), std::move(image));
    return true;
}

const rgba_image* tileset::tile(std::string_view name) const noexcept {
    const auto it = tiles_.find(name);
    return it != tiles_.end() ? &it->second : nullptr;
}

const rgba_image* tileset::pressure_plate() const noexcept {
    return pressure_plate_.width() > 0 ? &pressure_plate_ : nullptr;
}

const rgba_image* tileset::button() const noexcept {
    return button_.width() > 0 ? &button_ : nullptr;
}

decode_result tileset::load(const std::filesystem::path& dir,
                            std::span<const tile_code> legend,
                            tileset& tiles) {
    tileset result;

    auto load_png = [](const std::filesystem::path& path, rgba_image& image) -> decode_result {
        std::vector<unsigned char> buffer;
        const unsigned error = lodepng::load_file(buffer, path.string());
        if (error) {
            return decode_result::failure(decode_error::io_error,
                "cannot read " + path.string() + ": " + lodepng_error_text(error));
        }
        return decode_png(buffer, image);
    };

    for (const auto& code : legend) {
        const auto path = dir / (std::string(code.name) + ".png");
        if (!std::filesystem::is_regular_file(path)) {
            return decode_result::failure(decode_error::io_error,
                "base tile asset " + path.filename().string() + " not found in " + dir.string());
        }

        rgba_image image;
        auto loaded = load_png(path, image);
        if (!loaded) return loaded;

        if (!result.add_tile(code.name, std::move(image))) {
            return decode_result::failure(decode_error::invalid_argument,
                "tile " + path.filename().string() + " is not " +
                std::to_string(result.tile_width()) + "x" + std::to_string(result.tile_height()));
        }
    }

    // Overlay icons are optional
    const auto plate_path = dir / pressure_plate_asset;
    if (std::filesystem::is_regular_file(plate_path)) {
        rgba_image image;
        auto loaded = load_png(plate_path, image);
        if (!loaded) return loaded;
        result.set_pressure_plate(std::move(image));
    }

    const auto button_path = dir / button_asset;
    if (std::filesystem::is_regular_file(button_path)) {
        rgba_image image;
        auto loaded = load_png(button_path, image);
        if (!loaded) return loaded;
        result.set_button(std::move(image));
    }

    tiles = std::move(result);
    return decode_result::success();
}

// ============================================================================
// Map Rendering
// ============================================================================

std::array<std::uint8_t, 4> tile_color(const tile_code& code) noexcept {
    if (!code.known) {
        return UNKNOWN_COLOR;
    }
    for (const auto& entry : TILE_COLORS) {
        if (entry.name == code.name) {
            return entry.color;
        }
    }
    return FALLBACK_COLOR;
}

decode_result render_map(const decoded_world& world,
                         std::size_t map_index,
                         rgba_image& image,
                         const render_options& options,
                         const tileset* tiles) {
    if (map_index >= world.maps.size()) {
        return decode_result::failure(decode_error::invalid_argument,
            "map " + std::to_string(map_index) + " does not exist");
    }

    const bool use_assets = tiles && tiles->tile_width() > 0;
    if (use_assets && tiles->tile_width() != tiles->tile_height()) {
        return decode_result::failure(decode_error::invalid_argument, "tile assets must be square");
    }

    const int size = use_assets ? tiles->tile_width() : options.tile_size;
    if (size <= 0 || size > 256) {
        return decode_result::failure(decode_error::invalid_argument,
            "tile size " + std::to_string(size) + " outside 1..256");
    }

    rgba_image canvas;
    if (!canvas.set_size(tile_grid::size * size, tile_grid::size * size)) {
        return decode_result::failure(decode_error::internal_error, "failed to allocate image");
    }

    const auto& map = world.maps[map_index];

    for (int y = 0; y < tile_grid::size; ++y) {
        for (int x = 0; x < tile_grid::size; ++x) {
            const auto& cell = map.grid.at(x, y);
            const int px = x * size;
            const int py = y * size;

            if (use_assets) {
                const rgba_image* base = tiles->tile(cell.code.name);
                if (!base) base = tiles->tile("wall");
                if (!base) {
                    return decode_result::failure(decode_error::invalid_argument,
                        "no tile asset for '" + std::string(cell.code.name) + "'");
                }
                if (cell.door == orientation::vertical) {
                    canvas.blend(base->rotated(1), px, py);
                } else {
                    canvas.blend(*base, px, py);
                }
                continue;
            }

            canvas.fill(px, py, size, size, tile_color(cell.code));
            if (cell.door) {
                const int bar = std::max(1, size / 4);
                if (*cell.door == orientation::horizontal) {
                    canvas.fill(px, py + (size - bar) / 2, size, bar, DOOR_BAR_COLOR);
                } else {
                    canvas.fill(px + (size - bar) / 2, py, bar, size, DOOR_BAR_COLOR);
                }
            }
        }
    }

    if (options.draw_sensors) {
        for (const auto& s : map.sensors) {
            if (!s.position_valid || s.kind == sensor_kind::other) {
                continue;
            }
            const int px = static_cast<int>(s.x) * size;
            const int py = static_cast<int>(s.y) * size;

            if (s.kind == sensor_kind::pressure_plate) {
                if (use_assets && tiles->pressure_plate()) {
                    draw_centered(canvas, *tiles->pressure_plate(), px, py, size);
                } else if (!use_assets) {
                    const int plate = std::max(1, size / 2);
                    canvas.fill(px + (size - plate) / 2, py + (size - plate) / 2, plate, plate, PLATE_COLOR);
                }
            } else {
                if (use_assets && tiles->button()) {
                    draw_centered(canvas, tiles->button()->rotated(quarter_turns_for(s.facing)), px, py, size);
                } else if (!use_assets) {
                    draw_button_marker(canvas, px, py, size, s.facing);
                }
            }
        }
    }

    if (options.draw_party && world.party.map_index == map_index) {
        draw_party_marker(canvas, static_cast<int>(world.party.x) * size,
                          static_cast<int>(world.party.y) * size, size, world.party.facing);
    }

    image = std::move(canvas);
    return decode_result::success();
}

// ============================================================================
// PNG Encoding
// ============================================================================

std::vector<std::uint8_t> encode_png(const rgba_image& image) {
    if (image.width() <= 0 || image.height() <= 0) {
        return {};
    }

    const std::vector<unsigned char> pixels(image.pixels().begin(), image.pixels().end());
    std::vector<unsigned char> png_data;
    const unsigned error = lodepng::encode(png_data, pixels,
                                           static_cast<unsigned>(image.width()),
                                           static_cast<unsigned>(image.height()));
    if (error) {
        return {};
    }

    return png_data;
}

bool save_png(const rgba_image& image, const std::filesystem::path& path) {
    auto png_data = encode_png(image);
    if (png_data.empty()) {
        return false;
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }

    file.write(reinterpret_cast<const char*>(png_data.data()),
               static_cast<std::streamsize>(png_data.size()));

    return file.good();
}

decode_result decode_png(std::span<const std::uint8_t> data, rgba_image& image) {
    unsigned width = 0;
    unsigned height = 0;
    std::vector<unsigned char> pixels;

    const unsigned error = lodepng::decode(pixels, width, height, data.data(), data.size());
    if (error) {
        return decode_result::failure(decode_error::invalid_argument,
            std::string("PNG decode error: ") + lodepng_error_text(error));
    }

    constexpr auto max_int = static_cast<unsigned>(std::numeric_limits<int>::max());
    if (width > max_int || height > max_int) {
        return decode_result::failure(decode_error::invalid_argument,
            "PNG dimensions exceed maximum supported size");
    }

    rgba_image result;
    if (!result.set_size(static_cast<int>(width), static_cast<int>(height))) {
        return decode_result::failure(decode_error::internal_error, "failed to allocate image");
    }
    std::copy(pixels.begin(), pixels.end(), result.mutable_pixels().begin());

    image = std::move(result);
    return decode_result::success();
}

} // namespace dungeon_map
