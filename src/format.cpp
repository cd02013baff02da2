#include <dungeon_map/format.hpp>

#include <array>
#include <initializer_list>
#include <string>

namespace dungeon_map {

namespace {

constexpr legend_entry DM1_LEGEND[] = {
    {0, "wall"},
    {1, "floor"},
    {2, "pit"},
    {3, "stairs"},
    {4, "door"},
    {5, "teleporter"},
    {6, "trick_wall"},
    {7, "empty"},
};

constexpr legend_entry INDEXED_LEGEND[] = {
    {0x00, "empty floor"},
    {0x01, "wall"},
    {0x02, "door"},
    {0x03, "pit"},
    {0x04, "stairs"},
    {0x05, "teleporter"},
    {0x06, "trick wall"},
};

// DUNGEON.DAT (PC) layout
constexpr std::size_t DM1_MAP_COUNT_OFFSET = 0x04;
constexpr std::size_t DM1_PARTY_OFFSET = 0x08;
constexpr std::size_t DM1_OBJECT_LIST_SIZE_OFFSET = 0x0A;
constexpr std::size_t DM1_MAP_TABLE_BASE = 0x2C;
constexpr std::size_t DM1_MAP_TABLE_STRIDE = 16;
constexpr std::size_t DM1_FIRST_OBJECT_LIST = 0x043E;
constexpr std::size_t DM1_TILE_DATA_BASE = 0x5250;
constexpr std::size_t DM1_SENSOR_RECORDS = 0x27D4;
constexpr std::size_t DM1_SENSOR_COUNT = 684;

// Next-object lists by object category: (offset, entry size)
constexpr std::array<object_list, 16> DM1_OBJECT_LISTS = {{
    {0x1F06, 4},   //  0: doors
    {0x21AE, 6},   //  1: teleporters
    {0x25E0, 4},   //  2: texts
    {0x27D4, 8},   //  3: sensors
    {0x3D34, 16},  //  4: creatures
    {0x4894, 4},   //  5: weapons
    {0x4A40, 4},   //  6: clothes
    {0x4C24, 4},   //  7: scrolls
    {0x4CB0, 4},   //  8: potions
    {0x4D90, 8},   //  9: containers
    {0x4DF0, 4},   // 10: miscellaneous
    // 11-15: projectiles and clouds are never stored in the file
}};

sensor_type_set type_set(std::initializer_list<unsigned> types) {
    sensor_type_set set;
    for (unsigned t : types) {
        set.set(t);
    }
    return set;
}

world_format make_dm1_pc() {
    world_format f;
    f.name = "dm1-pc";
    f.description = "Dungeon Master 1, PC, uncompressed DUNGEON.DAT";

    f.header.map_count_offset = DM1_MAP_COUNT_OFFSET;
    f.header.map_count_width = 1;
    f.header.max_maps = 64;

    f.map_table.base = DM1_MAP_TABLE_BASE;
    f.map_table.stride = DM1_MAP_TABLE_STRIDE;
    f.map_table.tile_offset_field = 0x00;
    f.map_table.tile_offset_width = 2;
    f.map_table.sensor_offset_width = 0;
    f.map_table.tile_data_base = DM1_TILE_DATA_BASE;
    f.map_table.geometry_field = 0x08;
    f.map_table.graphics_field = 0x0A;
    f.map_table.creature_field = 0x0C;

    f.grid.packing = cell_packing::byte;
    f.grid.order = grid_order::column_major;
    f.grid.code_shift = 5;
    f.grid.code_mask = 0x07;
    f.grid.object_flag_mask = 0x10;
    f.grid.pad_code = 0;
    f.grid.legend = DM1_LEGEND;
    f.grid.wall_code = 0;
    f.grid.door_code = 4;
    f.grid.stairs_code = 3;

    f.sensors.source = sensor_source::object_chains;
    f.sensors.record_size = 8;
    f.sensors.type_field = 2;
    f.sensors.type_mask = 0x7F;
    f.sensors.first_object_list_offset = DM1_FIRST_OBJECT_LIST;
    f.sensors.object_list_size_offset = DM1_OBJECT_LIST_SIZE_OFFSET;
    f.sensors.record_base = DM1_SENSOR_RECORDS;
    f.sensors.record_count = DM1_SENSOR_COUNT;
    f.sensors.sensor_category = 3;
    f.sensors.object_lists = DM1_OBJECT_LISTS;
    f.sensors.decoration_field = 4;
    f.sensors.decoration_shift = 12;
    f.sensors.fountain_decoration = 35;
    f.sensors.pressure_plate_types = type_set({1, 2, 3, 4, 7});
    f.sensors.wall_button_types = type_set({1, 2, 3, 4});
    f.sensors.classify_by_surface = true;

    f.party.layout = party_layout::packed_word;
    f.party.offset = DM1_PARTY_OFFSET;
    return f;
}

world_format make_indexed() {
    world_format f;
    f.name = "indexed";
    f.description = "Flat indexed layout with per-map sensor lists";

    f.header.map_count_offset = 0x00;
    f.header.map_count_width = 2;
    f.header.max_maps = 64;

    // 0x02: map, x, y, facing; 0x06-0x07 reserved
    f.party.layout = party_layout::byte_fields;
    f.party.offset = 0x02;

    f.map_table.base = 0x08;
    f.map_table.stride = 8;
    f.map_table.tile_offset_field = 0;
    f.map_table.tile_offset_width = 4;
    f.map_table.sensor_offset_field = 4;
    f.map_table.sensor_offset_width = 4;
    f.map_table.tile_data_base = 0;

    f.grid.packing = cell_packing::byte;
    f.grid.order = grid_order::row_major;
    f.grid.code_shift = 0;
    f.grid.code_mask = 0xFF;
    f.grid.pad_code = 0x00;
    f.grid.legend = INDEXED_LEGEND;
    f.grid.wall_code = 0x01;

    // Record: type word (bits 0-6 type, bits 14-15 facing), x byte, y byte
    f.sensors.source = sensor_source::per_map_list;
    f.sensors.count_width = 2;
    f.sensors.record_size = 4;
    f.sensors.type_field = 0;
    f.sensors.type_mask = 0x7F;
    f.sensors.facing_shift = 14;
    f.sensors.position_field = 2;
    f.sensors.x_shift = 0;
    f.sensors.x_mask = 0xFF;
    f.sensors.y_shift = 8;
    f.sensors.y_mask = 0xFF;
    // Bit 6 of the type marks wall-mounted sensors
    f.sensors.pressure_plate_types = type_set({1, 2, 3, 4, 7});
    f.sensors.wall_button_types = type_set({0x41, 0x42, 0x43, 0x44});
    f.sensors.classify_by_surface = false;
    return f;
}

} // namespace

const world_format& dm1_pc_format() noexcept {
    static const world_format format = make_dm1_pc();
    return format;
}

const world_format& indexed_format() noexcept {
    static const world_format format = make_indexed();
    return format;
}

std::span<const world_format* const> known_formats() noexcept {
    static const world_format* const formats[] = {&dm1_pc_format(), &indexed_format()};
    return formats;
}

const world_format* find_format(std::string_view name) noexcept {
    for (const auto* format : known_formats()) {
        if (format->name == name) {
            return format;
        }
    }
    return nullptr;
}

tile_code lookup_tile(std::uint8_t code, const grid_layout& layout) {
    for (const auto& entry : layout.legend) {
        if (entry.code == code) {
            return {code, std::string(entry.name), true};
        }
    }
    return {code, std::string(unknown_tile_name), false};
}

} // namespace dungeon_map
