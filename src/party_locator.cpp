#include <dungeon_map/party_locator.hpp>
#include "byte_io.hpp"
#include "decode_helpers.hpp"

#include <string>

namespace dungeon_map {

decode_result locate_party(const byte_source& source,
                           const world_format& format,
                           std::size_t map_count,
                           party_start& party) {
    return guarded_decode("party start", format.party.offset, [&]() -> decode_result {
        const std::size_t offset = format.party.offset;
        party_start result;

        switch (format.party.layout) {
            case party_layout::packed_word: {
                // The packed word carries no map index: the party starts on map 0
                const std::uint16_t word = source.read_u16le(offset);
                result.x = bit_field(word, 0, 0x1F);
                result.y = bit_field(word, 5, 0x1F);
                result.facing = direction_from_code(bit_field(word, 10, 0x03));
                result.map_index = 0;
                break;
            }
            case party_layout::byte_fields: {
                result.map_index = source.read_u8(offset);
                result.x = source.read_u8(offset + 1);
                result.y = source.read_u8(offset + 2);
                const std::uint8_t facing = source.read_u8(offset + 3);
                if (facing > 3) {
                    return malformed_header("party facing code " + std::to_string(facing) +
                        " is not a direction", offset + 3);
                }
                result.facing = direction_from_code(facing);
                if (!tile_grid::in_bounds(static_cast<int>(result.x), static_cast<int>(result.y))) {
                    return malformed_header("party start (" + std::to_string(result.x) + ", " +
                        std::to_string(result.y) + ") lies outside the map", offset + 1);
                }
                break;
            }
        }

        if (result.map_index >= map_count) {
            return malformed_header("party start map " + std::to_string(result.map_index) +
                " does not exist (" + std::to_string(map_count) + " maps)", offset);
        }

        party = result;
        return decode_result::success();
    });
}

} // namespace dungeon_map
