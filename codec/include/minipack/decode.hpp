/**
 * MiniPack - Primitive and container-length readers.
 *
 * Typed readers consume exactly one marker and fail with TypeMismatch (carrying
 * the observed marker) when it is not the expected one. End of input anywhere
 * in a value yields InsufficientData.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "minipack/error.hpp"
#include "minipack/integer.hpp"
#include "minipack/io.hpp"
#include "minipack/marker.hpp"

namespace minipack
{

    struct ExtMeta
    {
        std::int8_t type{};
        std::uint32_t size{};
    };

    template <std::size_t N>
    struct FixExt
    {
        std::int8_t type{};
        std::array<std::uint8_t, N> data{};
    };

    Result<Marker> read_marker(ByteSource &source);

    Result<void> read_nil(ByteSource &source);
    Result<bool> read_bool(ByteSource &source);

    // Strict readers: the marker must be exactly the named width.
    Result<std::uint8_t> read_pfix(ByteSource &source);
    Result<std::int8_t> read_nfix(ByteSource &source);
    Result<std::uint8_t> read_u8(ByteSource &source);
    Result<std::uint16_t> read_u16(ByteSource &source);
    Result<std::uint32_t> read_u32(ByteSource &source);
    Result<std::uint64_t> read_u64(ByteSource &source);
    Result<std::int8_t> read_i8(ByteSource &source);
    Result<std::int16_t> read_i16(ByteSource &source);
    Result<std::int32_t> read_i32(ByteSource &source);
    Result<std::int64_t> read_i64(ByteSource &source);
    Result<float> read_f32(ByteSource &source);
    Result<double> read_f64(ByteSource &source);

    /// Accepts any integer-family marker.
    Result<Integer> read_integer(ByteSource &source);

    /// Accepts any integer-family marker and fails with OutOfRange when the value does not fit T.
    template <std::integral T>
    Result<T> read_int(ByteSource &source)
    {
        auto value = read_integer(source);
        if (!value)
        {
            return std::move(value).error();
        }
        const auto narrowed = value->as<T>();
        if (!narrowed)
        {
            return Error::make(ErrorCode::OutOfRange, value->to_string() + " does not fit the requested integer width");
        }
        return *narrowed;
    }

    /// Integer marker payload decoding after the marker has been read.
    Result<Integer> read_integer_payload(ByteSource &source, Marker marker);

    Result<std::uint32_t> read_str_len(ByteSource &source);
    Result<std::uint32_t> read_bin_len(ByteSource &source);
    Result<std::uint32_t> read_array_len(ByteSource &source);
    /// Number of key/value pairs.
    Result<std::uint32_t> read_map_len(ByteSource &source);
    Result<ExtMeta> read_ext_meta(ByteSource &source);

    /// Length carried by a Str/Bin/Ext/Array/Map marker, inline or in the field that follows it.
    /// Any other marker fails with TypeMismatch.
    Result<std::uint32_t> read_len_field(ByteSource &source, Marker marker);

    // String payloads are validated as UTF-8; failures carry the raw bytes and the offset.
    Result<std::string> read_str(ByteSource &source);
    /// Copies the payload into `scratch` and returns a view of it. Fails with BufferTooSmall when it does not fit.
    Result<std::string_view> read_str_into(ByteSource &source, std::span<char> scratch);
    /// View into the source's backing storage, valid as long as that storage.
    Result<std::string_view> read_str_ref(BorrowSource &source);

    Result<std::vector<std::uint8_t>> read_bin(ByteSource &source);
    Result<std::span<const std::uint8_t>> read_bin_ref(BorrowSource &source);

    /// Reads exactly `size` payload bytes, growing the buffer as data arrives.
    Result<std::vector<std::uint8_t>> read_payload(ByteSource &source, std::uint32_t size);
    Result<std::string> read_str_payload(ByteSource &source, std::uint32_t size);

    Result<FixExt<1>> read_fixext1(ByteSource &source);
    Result<FixExt<2>> read_fixext2(ByteSource &source);
    Result<FixExt<4>> read_fixext4(ByteSource &source);
    Result<FixExt<8>> read_fixext8(ByteSource &source);
    Result<FixExt<16>> read_fixext16(ByteSource &source);

} // namespace minipack
