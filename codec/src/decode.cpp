#include "minipack/decode.hpp"

#include <algorithm>
#include <bit>
#include <initializer_list>
#include <type_traits>

#include "wire.hpp"

namespace minipack
{

    namespace
    {
        constexpr std::size_t kReadBlock = 64 * 1024;

        Result<std::uint64_t> read_field(ByteSource &source, std::size_t width)
        {
            std::array<std::uint8_t, 8> buffer{};
            const auto bytes = std::span<std::uint8_t>(buffer).first(width);
            if (auto outcome = source.read_exact(bytes); !outcome)
            {
                return std::move(outcome).error();
            }
            return wire::load_be(bytes);
        }

        Result<void> expect(ByteSource &source, Marker::Kind kind)
        {
            auto marker = read_marker(source);
            if (!marker)
            {
                return std::move(marker).error();
            }
            if (marker->kind() != kind)
            {
                return Error::type_mismatch(*marker);
            }
            return {};
        }

        template <typename T>
        Result<T> read_fixed(ByteSource &source, Marker::Kind kind)
        {
            if (auto outcome = expect(source, kind); !outcome)
            {
                return std::move(outcome).error();
            }
            auto field = read_field(source, sizeof(T));
            if (!field)
            {
                return std::move(field).error();
            }
            using Unsigned = std::make_unsigned_t<T>;
            return static_cast<T>(static_cast<Unsigned>(*field));
        }

        Result<std::uint32_t> read_len_of(ByteSource &source, std::initializer_list<Marker::Kind> accepted)
        {
            auto marker = read_marker(source);
            if (!marker)
            {
                return std::move(marker).error();
            }
            if (std::find(accepted.begin(), accepted.end(), marker->kind()) == accepted.end())
            {
                return Error::type_mismatch(*marker);
            }
            return read_len_field(source, *marker);
        }

        Result<void> validate_utf8(std::span<const std::uint8_t> bytes)
        {
            if (const auto offset = wire::find_invalid_utf8(bytes))
            {
                return Error::invalid_utf8(std::vector<std::uint8_t>(bytes.begin(), bytes.end()), *offset);
            }
            return {};
        }

        template <std::size_t N>
        Result<FixExt<N>> read_fixext(ByteSource &source, Marker::Kind kind)
        {
            if (auto outcome = expect(source, kind); !outcome)
            {
                return std::move(outcome).error();
            }
            std::array<std::uint8_t, N + 1> buffer{};
            if (auto outcome = source.read_exact(buffer); !outcome)
            {
                return std::move(outcome).error();
            }
            FixExt<N> ext;
            ext.type = static_cast<std::int8_t>(buffer[0]);
            std::copy(buffer.begin() + 1, buffer.end(), ext.data.begin());
            return ext;
        }
    } // namespace

    Result<Marker> read_marker(ByteSource &source)
    {
        std::uint8_t byte = 0;
        if (auto outcome = source.read_exact(std::span<std::uint8_t>(&byte, 1)); !outcome)
        {
            return std::move(outcome).error();
        }
        return Marker::from_byte(byte);
    }

    Result<void> read_nil(ByteSource &source)
    {
        return expect(source, Marker::Kind::Null);
    }

    Result<bool> read_bool(ByteSource &source)
    {
        auto marker = read_marker(source);
        if (!marker)
        {
            return std::move(marker).error();
        }
        switch (marker->kind())
        {
        case Marker::Kind::True:
            return true;
        case Marker::Kind::False:
            return false;
        default:
            return Error::type_mismatch(*marker);
        }
    }

    Result<std::uint8_t> read_pfix(ByteSource &source)
    {
        auto marker = read_marker(source);
        if (!marker)
        {
            return std::move(marker).error();
        }
        if (marker->kind() != Marker::Kind::FixPos)
        {
            return Error::type_mismatch(*marker);
        }
        return marker->fix_value();
    }

    Result<std::int8_t> read_nfix(ByteSource &source)
    {
        auto marker = read_marker(source);
        if (!marker)
        {
            return std::move(marker).error();
        }
        if (marker->kind() != Marker::Kind::FixNeg)
        {
            return Error::type_mismatch(*marker);
        }
        return marker->fix_neg_value();
    }

    Result<std::uint8_t> read_u8(ByteSource &source)
    {
        return read_fixed<std::uint8_t>(source, Marker::Kind::U8);
    }

    Result<std::uint16_t> read_u16(ByteSource &source)
    {
        return read_fixed<std::uint16_t>(source, Marker::Kind::U16);
    }

    Result<std::uint32_t> read_u32(ByteSource &source)
    {
        return read_fixed<std::uint32_t>(source, Marker::Kind::U32);
    }

    Result<std::uint64_t> read_u64(ByteSource &source)
    {
        return read_fixed<std::uint64_t>(source, Marker::Kind::U64);
    }

    Result<std::int8_t> read_i8(ByteSource &source)
    {
        return read_fixed<std::int8_t>(source, Marker::Kind::I8);
    }

    Result<std::int16_t> read_i16(ByteSource &source)
    {
        return read_fixed<std::int16_t>(source, Marker::Kind::I16);
    }

    Result<std::int32_t> read_i32(ByteSource &source)
    {
        return read_fixed<std::int32_t>(source, Marker::Kind::I32);
    }

    Result<std::int64_t> read_i64(ByteSource &source)
    {
        return read_fixed<std::int64_t>(source, Marker::Kind::I64);
    }

    Result<float> read_f32(ByteSource &source)
    {
        auto bits = read_fixed<std::uint32_t>(source, Marker::Kind::F32);
        if (!bits)
        {
            return std::move(bits).error();
        }
        return std::bit_cast<float>(*bits);
    }

    Result<double> read_f64(ByteSource &source)
    {
        auto bits = read_fixed<std::uint64_t>(source, Marker::Kind::F64);
        if (!bits)
        {
            return std::move(bits).error();
        }
        return std::bit_cast<double>(*bits);
    }

    Result<Integer> read_integer(ByteSource &source)
    {
        auto marker = read_marker(source);
        if (!marker)
        {
            return std::move(marker).error();
        }
        return read_integer_payload(source, *marker);
    }

    Result<Integer> read_integer_payload(ByteSource &source, Marker marker)
    {
        std::size_t width = 0;
        bool is_signed = false;
        switch (marker.kind())
        {
        case Marker::Kind::FixPos:
            return Integer(marker.fix_value());
        case Marker::Kind::FixNeg:
            return Integer(marker.fix_neg_value());
        case Marker::Kind::U8:
            width = 1;
            break;
        case Marker::Kind::U16:
            width = 2;
            break;
        case Marker::Kind::U32:
            width = 4;
            break;
        case Marker::Kind::U64:
            width = 8;
            break;
        case Marker::Kind::I8:
            width = 1;
            is_signed = true;
            break;
        case Marker::Kind::I16:
            width = 2;
            is_signed = true;
            break;
        case Marker::Kind::I32:
            width = 4;
            is_signed = true;
            break;
        case Marker::Kind::I64:
            width = 8;
            is_signed = true;
            break;
        default:
            return Error::type_mismatch(marker);
        }

        auto field = read_field(source, width);
        if (!field)
        {
            return std::move(field).error();
        }
        if (!is_signed)
        {
            return Integer(*field);
        }
        // Sign-extend from the field width.
        const auto shift = 64 - 8 * width;
        const auto value = static_cast<std::int64_t>(*field << shift) >> shift;
        return Integer(value);
    }

    Result<std::uint32_t> read_len_field(ByteSource &source, Marker marker)
    {
        std::size_t width = 0;
        switch (marker.kind())
        {
        case Marker::Kind::FixStr:
        case Marker::Kind::FixArray:
        case Marker::Kind::FixMap:
            return static_cast<std::uint32_t>(marker.fix_value());
        case Marker::Kind::FixExt1:
            return 1u;
        case Marker::Kind::FixExt2:
            return 2u;
        case Marker::Kind::FixExt4:
            return 4u;
        case Marker::Kind::FixExt8:
            return 8u;
        case Marker::Kind::FixExt16:
            return 16u;
        case Marker::Kind::Str8:
        case Marker::Kind::Bin8:
        case Marker::Kind::Ext8:
            width = 1;
            break;
        case Marker::Kind::Str16:
        case Marker::Kind::Bin16:
        case Marker::Kind::Ext16:
        case Marker::Kind::Array16:
        case Marker::Kind::Map16:
            width = 2;
            break;
        case Marker::Kind::Str32:
        case Marker::Kind::Bin32:
        case Marker::Kind::Ext32:
        case Marker::Kind::Array32:
        case Marker::Kind::Map32:
            width = 4;
            break;
        default:
            return Error::type_mismatch(marker);
        }
        auto field = read_field(source, width);
        if (!field)
        {
            return std::move(field).error();
        }
        return static_cast<std::uint32_t>(*field);
    }

    Result<std::uint32_t> read_str_len(ByteSource &source)
    {
        return read_len_of(source, {Marker::Kind::FixStr, Marker::Kind::Str8, Marker::Kind::Str16, Marker::Kind::Str32});
    }

    Result<std::uint32_t> read_bin_len(ByteSource &source)
    {
        return read_len_of(source, {Marker::Kind::Bin8, Marker::Kind::Bin16, Marker::Kind::Bin32});
    }

    Result<std::uint32_t> read_array_len(ByteSource &source)
    {
        return read_len_of(source, {Marker::Kind::FixArray, Marker::Kind::Array16, Marker::Kind::Array32});
    }

    Result<std::uint32_t> read_map_len(ByteSource &source)
    {
        return read_len_of(source, {Marker::Kind::FixMap, Marker::Kind::Map16, Marker::Kind::Map32});
    }

    Result<ExtMeta> read_ext_meta(ByteSource &source)
    {
        auto size = read_len_of(source, {Marker::Kind::FixExt1, Marker::Kind::FixExt2, Marker::Kind::FixExt4,
                                         Marker::Kind::FixExt8, Marker::Kind::FixExt16, Marker::Kind::Ext8,
                                         Marker::Kind::Ext16, Marker::Kind::Ext32});
        if (!size)
        {
            return std::move(size).error();
        }
        auto type = read_field(source, 1);
        if (!type)
        {
            return std::move(type).error();
        }
        return ExtMeta{
            .type = static_cast<std::int8_t>(static_cast<std::uint8_t>(*type)),
            .size = *size,
        };
    }

    Result<std::vector<std::uint8_t>> read_payload(ByteSource &source, std::uint32_t size)
    {
        std::vector<std::uint8_t> bytes;
        bytes.reserve(std::min<std::size_t>(size, kReadBlock));
        while (bytes.size() < size)
        {
            const auto offset = bytes.size();
            const auto block = std::min<std::size_t>(size - offset, kReadBlock);
            bytes.resize(offset + block);
            if (auto outcome = source.read_exact(std::span<std::uint8_t>(bytes).subspan(offset, block)); !outcome)
            {
                return std::move(outcome).error();
            }
        }
        return bytes;
    }

    Result<std::string> read_str_payload(ByteSource &source, std::uint32_t size)
    {
        auto bytes = read_payload(source, size);
        if (!bytes)
        {
            return std::move(bytes).error();
        }
        if (const auto offset = wire::find_invalid_utf8(*bytes))
        {
            return Error::invalid_utf8(std::move(*bytes), *offset);
        }
        return std::string(bytes->begin(), bytes->end());
    }

    Result<std::string> read_str(ByteSource &source)
    {
        auto len = read_str_len(source);
        if (!len)
        {
            return std::move(len).error();
        }
        return read_str_payload(source, *len);
    }

    Result<std::string_view> read_str_into(ByteSource &source, std::span<char> scratch)
    {
        auto len = read_str_len(source);
        if (!len)
        {
            return std::move(len).error();
        }
        if (*len > scratch.size())
        {
            return Error::make(ErrorCode::BufferTooSmall, "string of " + std::to_string(*len) +
                                                              " bytes does not fit a buffer of " +
                                                              std::to_string(scratch.size()));
        }
        const auto bytes = std::span<std::uint8_t>(reinterpret_cast<std::uint8_t *>(scratch.data()), *len);
        if (auto outcome = source.read_exact(bytes); !outcome)
        {
            return std::move(outcome).error();
        }
        if (auto outcome = validate_utf8(bytes); !outcome)
        {
            return std::move(outcome).error();
        }
        return std::string_view(scratch.data(), *len);
    }

    Result<std::string_view> read_str_ref(BorrowSource &source)
    {
        auto len = read_str_len(source);
        if (!len)
        {
            return std::move(len).error();
        }
        auto bytes = source.borrow(*len);
        if (!bytes)
        {
            return std::move(bytes).error();
        }
        if (auto outcome = validate_utf8(*bytes); !outcome)
        {
            return std::move(outcome).error();
        }
        return std::string_view(reinterpret_cast<const char *>(bytes->data()), bytes->size());
    }

    Result<std::vector<std::uint8_t>> read_bin(ByteSource &source)
    {
        auto len = read_bin_len(source);
        if (!len)
        {
            return std::move(len).error();
        }
        return read_payload(source, *len);
    }

    Result<std::span<const std::uint8_t>> read_bin_ref(BorrowSource &source)
    {
        auto len = read_bin_len(source);
        if (!len)
        {
            return std::move(len).error();
        }
        return source.borrow(*len);
    }

    Result<FixExt<1>> read_fixext1(ByteSource &source)
    {
        return read_fixext<1>(source, Marker::Kind::FixExt1);
    }

    Result<FixExt<2>> read_fixext2(ByteSource &source)
    {
        return read_fixext<2>(source, Marker::Kind::FixExt2);
    }

    Result<FixExt<4>> read_fixext4(ByteSource &source)
    {
        return read_fixext<4>(source, Marker::Kind::FixExt4);
    }

    Result<FixExt<8>> read_fixext8(ByteSource &source)
    {
        return read_fixext<8>(source, Marker::Kind::FixExt8);
    }

    Result<FixExt<16>> read_fixext16(ByteSource &source)
    {
        return read_fixext<16>(source, Marker::Kind::FixExt16);
    }

} // namespace minipack
