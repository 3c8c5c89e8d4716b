#include "minipack/encode.hpp"

#include <array>
#include <bit>
#include <limits>

#include "wire.hpp"

namespace minipack
{

    namespace
    {
        constexpr std::uint64_t kMaxLen = std::numeric_limits<std::uint32_t>::max();

        Result<Marker> write_with_field(ByteSink &sink, Marker marker, std::uint64_t field, std::size_t width)
        {
            std::array<std::uint8_t, 9> buffer{};
            buffer[0] = marker.to_byte();
            wire::store_be(field, std::span<std::uint8_t>(buffer).subspan(1, width));
            if (auto outcome = sink.write_all(std::span<const std::uint8_t>(buffer.data(), 1 + width)); !outcome)
            {
                return std::move(outcome).error();
            }
            return marker;
        }

        Result<std::uint32_t> checked_len(std::size_t size)
        {
            if (size > kMaxLen)
            {
                return Error::make(ErrorCode::LengthOverflow,
                                   "payload of " + std::to_string(size) + " bytes does not fit a 32-bit length");
            }
            return static_cast<std::uint32_t>(size);
        }

        Result<Marker> write_sized(ByteSink &sink, std::uint32_t len, Marker m8, Marker m16, Marker m32)
        {
            if (len <= std::numeric_limits<std::uint8_t>::max())
            {
                return write_with_field(sink, m8, len, 1);
            }
            if (len <= std::numeric_limits<std::uint16_t>::max())
            {
                return write_with_field(sink, m16, len, 2);
            }
            return write_with_field(sink, m32, len, 4);
        }

        Result<Marker> write_ext_len(ByteSink &sink, std::uint32_t len)
        {
            switch (len)
            {
            case 1:
                return write_with_field(sink, Marker::Kind::FixExt1, 0, 0);
            case 2:
                return write_with_field(sink, Marker::Kind::FixExt2, 0, 0);
            case 4:
                return write_with_field(sink, Marker::Kind::FixExt4, 0, 0);
            case 8:
                return write_with_field(sink, Marker::Kind::FixExt8, 0, 0);
            case 16:
                return write_with_field(sink, Marker::Kind::FixExt16, 0, 0);
            default:
                return write_sized(sink, len, Marker::Kind::Ext8, Marker::Kind::Ext16, Marker::Kind::Ext32);
            }
        }
    } // namespace

    Result<Marker> write_marker(ByteSink &sink, Marker marker)
    {
        return write_with_field(sink, marker, 0, 0);
    }

    Result<Marker> write_nil(ByteSink &sink)
    {
        return write_marker(sink, Marker::Kind::Null);
    }

    Result<Marker> write_bool(ByteSink &sink, bool value)
    {
        return write_marker(sink, value ? Marker::Kind::True : Marker::Kind::False);
    }

    Result<Marker> write_pfix(ByteSink &sink, std::uint8_t value)
    {
        if (value > 0x7f)
        {
            return Error::make(ErrorCode::OutOfRange, std::to_string(value) + " is not a positive fixnum");
        }
        return write_marker(sink, Marker::fix_pos(value));
    }

    Result<Marker> write_nfix(ByteSink &sink, std::int8_t value)
    {
        if (value < -32 || value >= 0)
        {
            return Error::make(ErrorCode::OutOfRange, std::to_string(value) + " is not a negative fixnum");
        }
        return write_marker(sink, Marker::fix_neg(value));
    }

    Result<Marker> write_u8(ByteSink &sink, std::uint8_t value)
    {
        return write_with_field(sink, Marker::Kind::U8, value, 1);
    }

    Result<Marker> write_u16(ByteSink &sink, std::uint16_t value)
    {
        return write_with_field(sink, Marker::Kind::U16, value, 2);
    }

    Result<Marker> write_u32(ByteSink &sink, std::uint32_t value)
    {
        return write_with_field(sink, Marker::Kind::U32, value, 4);
    }

    Result<Marker> write_u64(ByteSink &sink, std::uint64_t value)
    {
        return write_with_field(sink, Marker::Kind::U64, value, 8);
    }

    Result<Marker> write_i8(ByteSink &sink, std::int8_t value)
    {
        return write_with_field(sink, Marker::Kind::I8, static_cast<std::uint8_t>(value), 1);
    }

    Result<Marker> write_i16(ByteSink &sink, std::int16_t value)
    {
        return write_with_field(sink, Marker::Kind::I16, static_cast<std::uint16_t>(value), 2);
    }

    Result<Marker> write_i32(ByteSink &sink, std::int32_t value)
    {
        return write_with_field(sink, Marker::Kind::I32, static_cast<std::uint32_t>(value), 4);
    }

    Result<Marker> write_i64(ByteSink &sink, std::int64_t value)
    {
        return write_with_field(sink, Marker::Kind::I64, static_cast<std::uint64_t>(value), 8);
    }

    Result<Marker> write_uint(ByteSink &sink, std::uint64_t value)
    {
        if (value <= 0x7f)
        {
            return write_marker(sink, Marker::fix_pos(static_cast<std::uint8_t>(value)));
        }
        if (value <= std::numeric_limits<std::uint8_t>::max())
        {
            return write_u8(sink, static_cast<std::uint8_t>(value));
        }
        if (value <= std::numeric_limits<std::uint16_t>::max())
        {
            return write_u16(sink, static_cast<std::uint16_t>(value));
        }
        if (value <= std::numeric_limits<std::uint32_t>::max())
        {
            return write_u32(sink, static_cast<std::uint32_t>(value));
        }
        return write_u64(sink, value);
    }

    Result<Marker> write_sint(ByteSink &sink, std::int64_t value)
    {
        if (value >= 0)
        {
            return write_uint(sink, static_cast<std::uint64_t>(value));
        }
        if (value >= -32)
        {
            return write_marker(sink, Marker::fix_neg(static_cast<std::int8_t>(value)));
        }
        if (value >= std::numeric_limits<std::int8_t>::min())
        {
            return write_i8(sink, static_cast<std::int8_t>(value));
        }
        if (value >= std::numeric_limits<std::int16_t>::min())
        {
            return write_i16(sink, static_cast<std::int16_t>(value));
        }
        if (value >= std::numeric_limits<std::int32_t>::min())
        {
            return write_i32(sink, static_cast<std::int32_t>(value));
        }
        return write_i64(sink, value);
    }

    Result<Marker> write_integer(ByteSink &sink, Integer value)
    {
        if (value.is_negative())
        {
            return write_sint(sink, *value.as_i64());
        }
        return write_uint(sink, *value.as_u64());
    }

    Result<Marker> write_f32(ByteSink &sink, float value)
    {
        return write_with_field(sink, Marker::Kind::F32, std::bit_cast<std::uint32_t>(value), 4);
    }

    Result<Marker> write_f64(ByteSink &sink, double value)
    {
        return write_with_field(sink, Marker::Kind::F64, std::bit_cast<std::uint64_t>(value), 8);
    }

    Result<Marker> write_str_len(ByteSink &sink, std::uint32_t len)
    {
        if (len <= Marker::kFixStrMax)
        {
            return write_marker(sink, Marker::fix_str(static_cast<std::uint8_t>(len)));
        }
        return write_sized(sink, len, Marker::Kind::Str8, Marker::Kind::Str16, Marker::Kind::Str32);
    }

    Result<Marker> write_bin_len(ByteSink &sink, std::uint32_t len)
    {
        return write_sized(sink, len, Marker::Kind::Bin8, Marker::Kind::Bin16, Marker::Kind::Bin32);
    }

    Result<Marker> write_array_len(ByteSink &sink, std::uint32_t len)
    {
        if (len <= Marker::kFixArrayMax)
        {
            return write_marker(sink, Marker::fix_array(static_cast<std::uint8_t>(len)));
        }
        if (len <= std::numeric_limits<std::uint16_t>::max())
        {
            return write_with_field(sink, Marker::Kind::Array16, len, 2);
        }
        return write_with_field(sink, Marker::Kind::Array32, len, 4);
    }

    Result<Marker> write_map_len(ByteSink &sink, std::uint32_t len)
    {
        if (len <= Marker::kFixMapMax)
        {
            return write_marker(sink, Marker::fix_map(static_cast<std::uint8_t>(len)));
        }
        if (len <= std::numeric_limits<std::uint16_t>::max())
        {
            return write_with_field(sink, Marker::Kind::Map16, len, 2);
        }
        return write_with_field(sink, Marker::Kind::Map32, len, 4);
    }

    Result<Marker> write_ext_meta(ByteSink &sink, std::uint32_t len, std::int8_t type)
    {
        auto marker = write_ext_len(sink, len);
        if (!marker)
        {
            return marker;
        }
        const auto type_byte = static_cast<std::uint8_t>(type);
        if (auto outcome = sink.write_all(std::span<const std::uint8_t>(&type_byte, 1)); !outcome)
        {
            return std::move(outcome).error();
        }
        return marker;
    }

    Result<Marker> write_str(ByteSink &sink, std::string_view value)
    {
        const auto len = checked_len(value.size());
        if (!len)
        {
            return len.error();
        }
        auto marker = write_str_len(sink, *len);
        if (!marker)
        {
            return marker;
        }
        const auto bytes = std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(value.data()),
                                                         value.size());
        if (auto outcome = sink.write_all(bytes); !outcome)
        {
            return std::move(outcome).error();
        }
        return marker;
    }

    Result<Marker> write_bin(ByteSink &sink, std::span<const std::uint8_t> data)
    {
        const auto len = checked_len(data.size());
        if (!len)
        {
            return len.error();
        }
        auto marker = write_bin_len(sink, *len);
        if (!marker)
        {
            return marker;
        }
        if (auto outcome = sink.write_all(data); !outcome)
        {
            return std::move(outcome).error();
        }
        return marker;
    }

    Result<Marker> write_ext(ByteSink &sink, std::int8_t type, std::span<const std::uint8_t> data)
    {
        const auto len = checked_len(data.size());
        if (!len)
        {
            return len.error();
        }
        auto marker = write_ext_meta(sink, *len, type);
        if (!marker)
        {
            return marker;
        }
        if (auto outcome = sink.write_all(data); !outcome)
        {
            return std::move(outcome).error();
        }
        return marker;
    }

} // namespace minipack
