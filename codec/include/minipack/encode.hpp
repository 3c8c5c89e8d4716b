/**
 * MiniPack - Primitive and container-length writers.
 *
 * Every writer returns the marker it emitted. Minimal-width writers pick the
 * smallest representation; explicit-width writers always use the named one.
 * Non-negative signed values are written through the unsigned family.
 */
#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include "minipack/error.hpp"
#include "minipack/integer.hpp"
#include "minipack/io.hpp"
#include "minipack/marker.hpp"

namespace minipack
{

    Result<Marker> write_marker(ByteSink &sink, Marker marker);

    Result<Marker> write_nil(ByteSink &sink);
    Result<Marker> write_bool(ByteSink &sink, bool value);

    // Explicit widths. write_pfix accepts 0..127 and write_nfix -32..-1, anything else is OutOfRange.
    Result<Marker> write_pfix(ByteSink &sink, std::uint8_t value);
    Result<Marker> write_nfix(ByteSink &sink, std::int8_t value);
    Result<Marker> write_u8(ByteSink &sink, std::uint8_t value);
    Result<Marker> write_u16(ByteSink &sink, std::uint16_t value);
    Result<Marker> write_u32(ByteSink &sink, std::uint32_t value);
    Result<Marker> write_u64(ByteSink &sink, std::uint64_t value);
    Result<Marker> write_i8(ByteSink &sink, std::int8_t value);
    Result<Marker> write_i16(ByteSink &sink, std::int16_t value);
    Result<Marker> write_i32(ByteSink &sink, std::int32_t value);
    Result<Marker> write_i64(ByteSink &sink, std::int64_t value);

    // Minimal widths.
    Result<Marker> write_uint(ByteSink &sink, std::uint64_t value);
    Result<Marker> write_sint(ByteSink &sink, std::int64_t value);
    Result<Marker> write_integer(ByteSink &sink, Integer value);

    Result<Marker> write_f32(ByteSink &sink, float value);
    Result<Marker> write_f64(ByteSink &sink, double value);

    Result<Marker> write_str_len(ByteSink &sink, std::uint32_t len);
    Result<Marker> write_bin_len(ByteSink &sink, std::uint32_t len);
    Result<Marker> write_array_len(ByteSink &sink, std::uint32_t len);
    /// `len` counts key/value pairs.
    Result<Marker> write_map_len(ByteSink &sink, std::uint32_t len);
    /// Writes the ext marker, its length field when it has one, and the type byte.
    Result<Marker> write_ext_meta(ByteSink &sink, std::uint32_t len, std::int8_t type);

    // Payloads longer than 2^32-1 bytes fail with LengthOverflow before anything is written.
    Result<Marker> write_str(ByteSink &sink, std::string_view value);
    Result<Marker> write_bin(ByteSink &sink, std::span<const std::uint8_t> data);
    Result<Marker> write_ext(ByteSink &sink, std::int8_t type, std::span<const std::uint8_t> data);

} // namespace minipack
