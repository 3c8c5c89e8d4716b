/**
 * MiniPack - MessagePack lead-byte model.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace minipack
{

    class Marker
    {
    public:
        enum class Kind : std::uint8_t
        {
            FixPos,
            FixNeg,
            FixMap,
            FixArray,
            FixStr,
            Null,
            Reserved,
            False,
            True,
            Bin8,
            Bin16,
            Bin32,
            Ext8,
            Ext16,
            Ext32,
            F32,
            F64,
            U8,
            U16,
            U32,
            U64,
            I8,
            I16,
            I32,
            I64,
            FixExt1,
            FixExt2,
            FixExt4,
            FixExt8,
            FixExt16,
            Str8,
            Str16,
            Str32,
            Array16,
            Array32,
            Map16,
            Map32
        };

        static constexpr std::uint8_t kFixStrMax = 0x1f;
        static constexpr std::uint8_t kFixArrayMax = 0x0f;
        static constexpr std::uint8_t kFixMapMax = 0x0f;

        constexpr Marker(Kind kind) noexcept : kind_(kind) {}

        // Inline values are masked into the range the lead byte can carry.
        static constexpr Marker fix_pos(std::uint8_t value) noexcept
        {
            return Marker(Kind::FixPos, static_cast<std::uint8_t>(value & 0x7f));
        }

        static constexpr Marker fix_neg(std::int8_t value) noexcept
        {
            return Marker(Kind::FixNeg, static_cast<std::uint8_t>(static_cast<std::uint8_t>(value) | 0xe0));
        }

        static constexpr Marker fix_map(std::uint8_t len) noexcept
        {
            return Marker(Kind::FixMap, static_cast<std::uint8_t>(len & kFixMapMax));
        }

        static constexpr Marker fix_array(std::uint8_t len) noexcept
        {
            return Marker(Kind::FixArray, static_cast<std::uint8_t>(len & kFixArrayMax));
        }

        static constexpr Marker fix_str(std::uint8_t len) noexcept
        {
            return Marker(Kind::FixStr, static_cast<std::uint8_t>(len & kFixStrMax));
        }

        static constexpr Marker from_byte(std::uint8_t byte) noexcept
        {
            if (byte <= 0x7f)
            {
                return fix_pos(byte);
            }
            if (byte <= 0x8f)
            {
                return fix_map(byte);
            }
            if (byte <= 0x9f)
            {
                return fix_array(byte);
            }
            if (byte <= 0xbf)
            {
                return fix_str(byte);
            }
            if (byte >= 0xe0)
            {
                return Marker(Kind::FixNeg, byte);
            }
            switch (byte)
            {
            case 0xc0:
                return Kind::Null;
            case 0xc1:
                return Kind::Reserved;
            case 0xc2:
                return Kind::False;
            case 0xc3:
                return Kind::True;
            case 0xc4:
                return Kind::Bin8;
            case 0xc5:
                return Kind::Bin16;
            case 0xc6:
                return Kind::Bin32;
            case 0xc7:
                return Kind::Ext8;
            case 0xc8:
                return Kind::Ext16;
            case 0xc9:
                return Kind::Ext32;
            case 0xca:
                return Kind::F32;
            case 0xcb:
                return Kind::F64;
            case 0xcc:
                return Kind::U8;
            case 0xcd:
                return Kind::U16;
            case 0xce:
                return Kind::U32;
            case 0xcf:
                return Kind::U64;
            case 0xd0:
                return Kind::I8;
            case 0xd1:
                return Kind::I16;
            case 0xd2:
                return Kind::I32;
            case 0xd3:
                return Kind::I64;
            case 0xd4:
                return Kind::FixExt1;
            case 0xd5:
                return Kind::FixExt2;
            case 0xd6:
                return Kind::FixExt4;
            case 0xd7:
                return Kind::FixExt8;
            case 0xd8:
                return Kind::FixExt16;
            case 0xd9:
                return Kind::Str8;
            case 0xda:
                return Kind::Str16;
            case 0xdb:
                return Kind::Str32;
            case 0xdc:
                return Kind::Array16;
            case 0xdd:
                return Kind::Array32;
            case 0xde:
                return Kind::Map16;
            default:
                return Kind::Map32;
            }
        }

        constexpr std::uint8_t to_byte() const noexcept
        {
            switch (kind_)
            {
            case Kind::FixPos:
                return value_;
            case Kind::FixNeg:
                return value_;
            case Kind::FixMap:
                return static_cast<std::uint8_t>(0x80 | value_);
            case Kind::FixArray:
                return static_cast<std::uint8_t>(0x90 | value_);
            case Kind::FixStr:
                return static_cast<std::uint8_t>(0xa0 | value_);
            case Kind::Null:
                return 0xc0;
            case Kind::Reserved:
                return 0xc1;
            case Kind::False:
                return 0xc2;
            case Kind::True:
                return 0xc3;
            case Kind::Bin8:
                return 0xc4;
            case Kind::Bin16:
                return 0xc5;
            case Kind::Bin32:
                return 0xc6;
            case Kind::Ext8:
                return 0xc7;
            case Kind::Ext16:
                return 0xc8;
            case Kind::Ext32:
                return 0xc9;
            case Kind::F32:
                return 0xca;
            case Kind::F64:
                return 0xcb;
            case Kind::U8:
                return 0xcc;
            case Kind::U16:
                return 0xcd;
            case Kind::U32:
                return 0xce;
            case Kind::U64:
                return 0xcf;
            case Kind::I8:
                return 0xd0;
            case Kind::I16:
                return 0xd1;
            case Kind::I32:
                return 0xd2;
            case Kind::I64:
                return 0xd3;
            case Kind::FixExt1:
                return 0xd4;
            case Kind::FixExt2:
                return 0xd5;
            case Kind::FixExt4:
                return 0xd6;
            case Kind::FixExt8:
                return 0xd7;
            case Kind::FixExt16:
                return 0xd8;
            case Kind::Str8:
                return 0xd9;
            case Kind::Str16:
                return 0xda;
            case Kind::Str32:
                return 0xdb;
            case Kind::Array16:
                return 0xdc;
            case Kind::Array32:
                return 0xdd;
            case Kind::Map16:
                return 0xde;
            case Kind::Map32:
                return 0xdf;
            }
            return 0xc1;
        }

        constexpr Kind kind() const noexcept
        {
            return kind_;
        }

        // Value of a FixPos marker, or the length carried by FixMap/FixArray/FixStr.
        constexpr std::uint8_t fix_value() const noexcept
        {
            return value_;
        }

        constexpr std::int8_t fix_neg_value() const noexcept
        {
            return static_cast<std::int8_t>(value_);
        }

        friend constexpr bool operator==(const Marker &lhs, const Marker &rhs) noexcept = default;

    private:
        constexpr Marker(Kind kind, std::uint8_t value) noexcept : kind_(kind), value_(value) {}

        Kind kind_;
        std::uint8_t value_{0};
    };

    std::string_view to_string(Marker::Kind kind) noexcept;

    /// Renders the marker with its inline value, e.g. `FixArray(3)`.
    std::string to_string(Marker marker);

} // namespace minipack
