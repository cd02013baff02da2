#pragma once

#include <dungeon_map/byte_source.hpp>
#include <dungeon_map/types.hpp>

#include <cstddef>
#include <cstdio>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace dungeon_map {

// Format a byte offset as 0x-prefixed hex for error messages
inline std::string hex_offset(std::size_t offset) {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "0x%zX", offset);
    return buf;
}

inline decode_result malformed_header(std::string msg, std::size_t offset) {
    return decode_result::failure(decode_error::malformed_header,
        std::move(msg) + " (at " + hex_offset(offset) + ")", offset);
}

// Run a decoding step, converting read failures into a decode_result.
// Failures that carry no offset of their own report `at`, the start of the
// structure being read.
template <typename Fn>
decode_result guarded_decode(const char* what, std::size_t at, Fn&& fn) {
    try {
        return fn();
    } catch (const out_of_bounds_error& e) {
        return decode_result::failure(decode_error::out_of_bounds,
            std::string(what) + ": " + e.what(), e.offset());
    } catch (const field_width_error& e) {
        return decode_result::failure(decode_error::invalid_argument,
            std::string(what) + ": " + e.what(), e.offset());
    } catch (const std::invalid_argument& e) {
        return decode_result::failure(decode_error::invalid_argument,
            std::string(what) + ": " + e.what() + " (at " + hex_offset(at) + ")", at);
    } catch (const std::exception& e) {
        return decode_result::failure(decode_error::internal_error,
            std::string(what) + ": " + e.what() + " (at " + hex_offset(at) + ")", at);
    }
}

} // namespace dungeon_map
