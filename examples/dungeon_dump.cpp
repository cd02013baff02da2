#include <dungeon_map/dungeon_map.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace {

struct cli_options {
    const dungeon_map::world_format* format = &dungeon_map::dm1_pc_format();
    bool ascii = false;
    bool json = false;
    int tile_size = 16;
    std::filesystem::path assets_dir;
    std::filesystem::path input_path;
    std::filesystem::path output_dir;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <world_file> [output_dir]\n";
    std::cerr << "Decodes a dungeon world file and renders one PNG per map.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -f, --format <name>   World file layout (default: dm1-pc)\n";
    std::cerr << "  -a, --ascii           Print every map as text\n";
    std::cerr << "  -j, --json            Also write level_NN.json and legend.json to output_dir\n";
    std::cerr << "  -t, --tile-size <n>   Pixels per cell for flat rendering (default: 16)\n";
    std::cerr << "      --assets <dir>    Render with PNG tile assets from <dir>\n";
    std::cerr << "  -l, --list            List available formats\n";
    std::cerr << "  -h, --help            Show this help\n";
}

void list_formats() {
    std::cout << "Available formats:\n";
    for (const auto* format : dungeon_map::known_formats()) {
        std::cout << "  " << format->name << " (" << format->description << ")\n";
    }
}

std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return {};
    }

    const auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
    file.read(reinterpret_cast<char*>(data.data()), size);

    return data;
}

char tile_char(const dungeon_map::tile_code& code) {
    if (!code.known) return '?';
    if (code.name == "wall") return '#';
    if (code.name == "floor" || code.name == "empty floor") return '.';
    if (code.name == "empty") return ' ';
    if (code.name == "pit") return 'O';
    if (code.name == "stairs") return '>';
    if (code.name == "door") return 'D';
    if (code.name == "teleporter") return 'T';
    if (code.name == "trick_wall" || code.name == "trick wall") return 'W';
    return '+';
}

void print_ascii(const dungeon_map::decoded_world& world, const dungeon_map::map_record& map) {
    std::vector<std::string> rows(dungeon_map::tile_grid::size);
    for (int y = 0; y < dungeon_map::tile_grid::size; ++y) {
        for (int x = 0; x < dungeon_map::tile_grid::size; ++x) {
            rows[y] += tile_char(map.grid.at(x, y).code);
        }
    }

    for (const auto& s : map.sensors) {
        if (!s.position_valid) continue;
        if (s.kind == dungeon_map::sensor_kind::pressure_plate) {
            rows[s.y][s.x] = 'P';
        } else if (s.kind == dungeon_map::sensor_kind::wall_button) {
            rows[s.y][s.x] = 'B';
        }
    }

    if (world.party.map_index == map.index) {
        rows[world.party.y][world.party.x] = '@';
    }

    for (const auto& row : rows) {
        std::cout << "  " << row << "\n";
    }
}

void print_summary(const dungeon_map::decoded_world& world, bool ascii) {
    std::cout << "Format: " << world.format_name << "\n";
    std::cout << "Maps: " << world.map_count() << "\n";

    for (const auto& map : world.maps) {
        std::cout << "Map " << map.index << ": level " << map.level
                  << ", " << map.width << "x" << map.height
                  << ", " << map.count(dungeon_map::sensor_kind::pressure_plate) << " pressure plates"
                  << ", " << map.count(dungeon_map::sensor_kind::wall_button) << " wall buttons"
                  << ", " << map.sensors.size() << " sensors\n";

        if (map.unknown_cells > 0) {
            std::cout << "  warning: " << map.unknown_cells << " cells with unknown tile codes\n";
        }
        if (map.invalid_sensors > 0) {
            std::cout << "  warning: " << map.invalid_sensors << " sensors outside the grid\n";
        }
        if (map.broken_chains > 0) {
            std::cout << "  warning: " << map.broken_chains << " object chains cut short\n";
        }

        for (const auto& s : map.sensors) {
            if (s.fountain) {
                std::cout << "  fountain at (" << s.x << ", " << s.y << ")\n";
            }
        }

        if (ascii) {
            print_ascii(world, map);
        }
    }

    std::cout << "Party: map " << world.party.map_index
              << " at (" << world.party.x << ", " << world.party.y << ")"
              << " facing " << dungeon_map::to_string(world.party.facing) << "\n";

    std::cout << "Legend:\n";
    for (const auto& code : world.legend) {
        std::cout << "  " << static_cast<unsigned>(code.value) << " = " << code.name << "\n";
    }
}

// Returns 0 to continue, otherwise the exit code + 1
int parse_args(int argc, char* argv[], cli_options& options) {
    std::vector<const char*> positional;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            return 1;
        }
        if (std::strcmp(arg, "-l") == 0 || std::strcmp(arg, "--list") == 0) {
            list_formats();
            return 1;
        }
        if (std::strcmp(arg, "-a") == 0 || std::strcmp(arg, "--ascii") == 0) {
            options.ascii = true;
            continue;
        }
        if (std::strcmp(arg, "-j") == 0 || std::strcmp(arg, "--json") == 0) {
            options.json = true;
            continue;
        }

        const bool takes_value =
            std::strcmp(arg, "-f") == 0 || std::strcmp(arg, "--format") == 0 ||
            std::strcmp(arg, "-t") == 0 || std::strcmp(arg, "--tile-size") == 0 ||
            std::strcmp(arg, "--assets") == 0;
        if (takes_value) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " needs a value\n";
                return 2;
            }
            const char* value = argv[++i];

            if (arg[1] == 'f' || std::strcmp(arg, "--format") == 0) {
                options.format = dungeon_map::find_format(value);
                if (!options.format) {
                    std::cerr << "Error: Unknown format: " << value << "\n";
                    return 2;
                }
            } else if (arg[1] == 't' || std::strcmp(arg, "--tile-size") == 0) {
                char* end = nullptr;
                const long size = std::strtol(value, &end, 10);
                if (end == value || *end != '\0' || size <= 0 || size > 256) {
                    std::cerr << "Error: Invalid tile size: " << value << "\n";
                    return 2;
                }
                options.tile_size = static_cast<int>(size);
            } else {
                options.assets_dir = value;
            }
            continue;
        }

        if (arg[0] == '-' && arg[1] != '\0') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return 2;
        }
        positional.push_back(arg);
    }

    if (positional.empty() || positional.size() > 2) {
        print_usage(argv[0]);
        return 2;
    }

    options.input_path = positional[0];
    if (positional.size() == 2) {
        options.output_dir = positional[1];
    }
    if (options.json && options.output_dir.empty()) {
        std::cerr << "Error: --json needs an output_dir\n";
        return 2;
    }
    return 0;
}

bool render_all(const dungeon_map::decoded_world& world, const cli_options& options) {
    std::error_code ec;
    std::filesystem::create_directories(options.output_dir, ec);
    if (ec) {
        std::cerr << "Error: Cannot create " << options.output_dir << ": " << ec.message() << "\n";
        return false;
    }

    dungeon_map::tileset tiles;
    if (!options.assets_dir.empty()) {
        auto loaded = dungeon_map::tileset::load(options.assets_dir, world.legend, tiles);
        if (!loaded) {
            std::cerr << "Error: Failed to load assets: " << loaded.message << "\n";
            return false;
        }
    }

    dungeon_map::render_options render;
    render.tile_size = options.tile_size;

    for (const auto& map : world.maps) {
        dungeon_map::rgba_image image;
        auto result = dungeon_map::render_map(world, map.index, image, render,
                                              options.assets_dir.empty() ? nullptr : &tiles);
        if (!result) {
            std::cerr << "Error: Failed to render map " << map.index << ": " << result.message << "\n";
            return false;
        }

        char name[32];
        std::snprintf(name, sizeof(name), "level_%02u.png", map.level);
        const auto output_path = options.output_dir / name;

        if (!dungeon_map::save_png(image, output_path)) {
            std::cerr << "Error: Failed to save: " << output_path << "\n";
            return false;
        }

        std::cout << "Saved: " << output_path << "\n";
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    cli_options options;
    if (const int status = parse_args(argc, argv, options); status != 0) {
        return status - 1;
    }

    if (!std::filesystem::exists(options.input_path)) {
        std::cerr << "Error: File not found: " << options.input_path << "\n";
        return 1;
    }

    auto data = read_file(options.input_path);
    if (data.empty()) {
        std::cerr << "Error: Failed to read file: " << options.input_path << "\n";
        return 1;
    }

    const dungeon_map::byte_source source(std::move(data));
    dungeon_map::decoded_world world;
    auto result = dungeon_map::decode_world(source, world, *options.format);
    if (!result) {
        std::cerr << "Error: Failed to decode (" << dungeon_map::to_string(result.error)
                  << "): " << result.message << "\n";
        return 1;
    }

    print_summary(world, options.ascii);

    if (!options.output_dir.empty() && !render_all(world, options)) {
        return 1;
    }

    if (options.json) {
        auto written = dungeon_map::write_json(world, options.output_dir);
        if (!written) {
            std::cerr << "Error: Failed to write JSON: " << written.message << "\n";
            return 1;
        }
        std::cout << "Saved: " << world.map_count() << " level files and legend.json to "
                  << options.output_dir << "\n";
    }

    return 0;
}
