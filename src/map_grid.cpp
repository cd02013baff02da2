#include <dungeon_map/map_grid.hpp>
#include "byte_io.hpp"
#include "decode_helpers.hpp"

#include <string>

namespace dungeon_map {

namespace {

// Extract the packed field of cell `index` from the tile block
std::uint8_t cell_field(std::span<const std::uint8_t> block, std::size_t index, cell_packing packing) {
    switch (packing) {
        case cell_packing::byte:
            return block[index];
        case cell_packing::nibble_high_first: {
            const std::uint8_t byte = block[index / 2];
            return (index % 2) ? (byte & 0x0F) : (byte >> 4);
        }
        case cell_packing::nibble_low_first: {
            const std::uint8_t byte = block[index / 2];
            return (index % 2) ? (byte >> 4) : (byte & 0x0F);
        }
    }
    return 0;
}

tile_cell make_cell(std::uint8_t raw, const grid_layout& layout) {
    tile_cell cell;
    cell.raw = raw;

    const auto code = static_cast<std::uint8_t>(bit_field(raw, layout.code_shift, layout.code_mask));
    cell.code = lookup_tile(code, layout);

    if (layout.object_flag_mask != 0) {
        cell.has_objects = (raw & layout.object_flag_mask) != 0;
    }

    const auto orient = bit_field(raw, layout.orientation_bit, 1) ? orientation::vertical
                                                                   : orientation::horizontal;
    if (layout.door_code && code == *layout.door_code) {
        cell.door = orient;
    }
    if (layout.stairs_code && code == *layout.stairs_code) {
        cell.stairs = orient;
        cell.stairs_dir = bit_field(raw, layout.stairs_up_bit, 1) ? stairs_direction::up
                                                                  : stairs_direction::down;
    }

    return cell;
}

} // namespace

std::size_t packed_grid_size(unsigned width, unsigned height, const grid_layout& layout) noexcept {
    const std::size_t cells = static_cast<std::size_t>(width) * height;
    return layout.packing == cell_packing::byte ? cells : (cells + 1) / 2;
}

decode_result decode_map_grid(const byte_source& source,
                              const map_entry& entry,
                              const world_format& format,
                              tile_grid& grid) {
    const auto& layout = format.grid;

    if (entry.width == 0 || entry.height == 0 ||
        entry.width > static_cast<unsigned>(tile_grid::size) ||
        entry.height > static_cast<unsigned>(tile_grid::size)) {
        return malformed_header("map size " + std::to_string(entry.width) + "x" +
            std::to_string(entry.height) + " outside 1..32", entry.tile_offset);
    }

    const std::size_t block_size = packed_grid_size(entry.width, entry.height, layout);
    if (!source.contains(entry.tile_offset, block_size)) {
        return decode_result::failure(decode_error::truncated_grid,
            "map grid needs " + std::to_string(block_size) + " bytes at " +
            hex_offset(entry.tile_offset) + " but the file has " +
            std::to_string(source.size()) + " bytes", entry.tile_offset);
    }

    const auto block = source.bytes().subspan(entry.tile_offset, block_size);

    // Cells a smaller map does not cover read as the pad code
    const tile_cell pad = make_cell(static_cast<std::uint8_t>(layout.pad_code << layout.code_shift), layout);
    for (int y = 0; y < tile_grid::size; ++y) {
        for (int x = 0; x < tile_grid::size; ++x) {
            grid.at(x, y) = pad;
        }
    }

    const std::size_t cells = static_cast<std::size_t>(entry.width) * entry.height;
    for (std::size_t i = 0; i < cells; ++i) {
        int x = 0;
        int y = 0;
        if (layout.order == grid_order::row_major) {
            x = static_cast<int>(i % entry.width);
            y = static_cast<int>(i / entry.width);
        } else {
            x = static_cast<int>(i / entry.height);
            y = static_cast<int>(i % entry.height);
        }
        grid.at(x, y) = make_cell(cell_field(block, i, layout.packing), layout);
    }

    return decode_result::success();
}

decode_result read_wall_decorations(const byte_source& source,
                                    const map_entry& entry,
                                    const world_format& format,
                                    std::vector<std::uint8_t>& ids) {
    ids.clear();
    if (!format.map_table.graphics_field || entry.wall_graphics == 0) {
        return decode_result::success();
    }

    // Creature graphics ids come first, then the wall decoration ids
    const std::size_t offset = entry.tile_offset +
        packed_grid_size(entry.width, entry.height, format.grid) + entry.creature_graphics;

    if (!source.contains(offset, entry.wall_graphics)) {
        return decode_result::failure(decode_error::out_of_bounds,
            "wall decoration list at " + hex_offset(offset) + " runs past end of file", offset);
    }

    const auto list = source.bytes().subspan(offset, entry.wall_graphics);
    ids.assign(list.begin(), list.end());
    return decode_result::success();
}

} // namespace dungeon_map
