#include "minipack/marker.hpp"

#include <array>

namespace minipack
{

    namespace
    {
        struct KindName
        {
            Marker::Kind kind;
            std::string_view name;
        };

        constexpr std::array<KindName, 37> kKindNames{{
            {Marker::Kind::FixPos, "FixPos"},
            {Marker::Kind::FixNeg, "FixNeg"},
            {Marker::Kind::FixMap, "FixMap"},
            {Marker::Kind::FixArray, "FixArray"},
            {Marker::Kind::FixStr, "FixStr"},
            {Marker::Kind::Null, "Null"},
            {Marker::Kind::Reserved, "Reserved"},
            {Marker::Kind::False, "False"},
            {Marker::Kind::True, "True"},
            {Marker::Kind::Bin8, "Bin8"},
            {Marker::Kind::Bin16, "Bin16"},
            {Marker::Kind::Bin32, "Bin32"},
            {Marker::Kind::Ext8, "Ext8"},
            {Marker::Kind::Ext16, "Ext16"},
            {Marker::Kind::Ext32, "Ext32"},
            {Marker::Kind::F32, "F32"},
            {Marker::Kind::F64, "F64"},
            {Marker::Kind::U8, "U8"},
            {Marker::Kind::U16, "U16"},
            {Marker::Kind::U32, "U32"},
            {Marker::Kind::U64, "U64"},
            {Marker::Kind::I8, "I8"},
            {Marker::Kind::I16, "I16"},
            {Marker::Kind::I32, "I32"},
            {Marker::Kind::I64, "I64"},
            {Marker::Kind::FixExt1, "FixExt1"},
            {Marker::Kind::FixExt2, "FixExt2"},
            {Marker::Kind::FixExt4, "FixExt4"},
            {Marker::Kind::FixExt8, "FixExt8"},
            {Marker::Kind::FixExt16, "FixExt16"},
            {Marker::Kind::Str8, "Str8"},
            {Marker::Kind::Str16, "Str16"},
            {Marker::Kind::Str32, "Str32"},
            {Marker::Kind::Array16, "Array16"},
            {Marker::Kind::Array32, "Array32"},
            {Marker::Kind::Map16, "Map16"},
            {Marker::Kind::Map32, "Map32"},
        }};
    } // namespace

    std::string_view to_string(Marker::Kind kind) noexcept
    {
        for (const auto &entry : kKindNames)
        {
            if (entry.kind == kind)
            {
                return entry.name;
            }
        }
        return "Unknown";
    }

    std::string to_string(Marker marker)
    {
        std::string text(to_string(marker.kind()));
        switch (marker.kind())
        {
        case Marker::Kind::FixPos:
        case Marker::Kind::FixMap:
        case Marker::Kind::FixArray:
        case Marker::Kind::FixStr:
            text += "(" + std::to_string(marker.fix_value()) + ")";
            break;
        case Marker::Kind::FixNeg:
            text += "(" + std::to_string(static_cast<int>(marker.fix_neg_value())) + ")";
            break;
        default:
            break;
        }
        return text;
    }

} // namespace minipack
