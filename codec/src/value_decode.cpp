#include "minipack/value_codec.hpp"

#include <algorithm>
#include <array>
#include <bit>

#include "minipack/decode.hpp"
#include "wire.hpp"

namespace minipack
{

    namespace
    {
        // Declared lengths are not trusted for pre-allocation beyond this many elements.
        constexpr std::uint32_t kReserveCap = 4096;

        Result<std::uint64_t> read_payload_field(ByteSource &source, std::size_t width)
        {
            std::array<std::uint8_t, 8> buffer{};
            const auto bytes = std::span<std::uint8_t>(buffer).first(width);
            if (auto outcome = source.read_exact(bytes); !outcome)
            {
                return std::move(outcome).error();
            }
            return wire::load_be(bytes);
        }

        struct OwnedTrees
        {
            using Tree = Value;
            using Source = ByteSource;

            static Result<Tree> string(Source &source, std::uint32_t len)
            {
                auto text = read_str_payload(source, len);
                if (!text)
                {
                    return std::move(text).error();
                }
                return Value(std::move(*text));
            }

            static Result<Tree> binary(Source &source, std::uint32_t len)
            {
                auto bytes = read_payload(source, len);
                if (!bytes)
                {
                    return std::move(bytes).error();
                }
                return Value(std::move(*bytes));
            }

            static Result<Tree> ext(Source &source, std::int8_t type, std::uint32_t len)
            {
                auto bytes = read_payload(source, len);
                if (!bytes)
                {
                    return std::move(bytes).error();
                }
                return Value(Ext{type, std::move(*bytes)});
            }
        };

        struct BorrowedTrees
        {
            using Tree = ValueRef;
            using Source = BorrowSource;

            static Result<Tree> string(Source &source, std::uint32_t len)
            {
                auto bytes = source.borrow(len);
                if (!bytes)
                {
                    return std::move(bytes).error();
                }
                if (const auto offset = wire::find_invalid_utf8(*bytes))
                {
                    return Error::invalid_utf8(std::vector<std::uint8_t>(bytes->begin(), bytes->end()), *offset);
                }
                return ValueRef(std::string_view(reinterpret_cast<const char *>(bytes->data()), bytes->size()));
            }

            static Result<Tree> binary(Source &source, std::uint32_t len)
            {
                auto bytes = source.borrow(len);
                if (!bytes)
                {
                    return std::move(bytes).error();
                }
                return ValueRef(BinaryRef{*bytes});
            }

            static Result<Tree> ext(Source &source, std::int8_t type, std::uint32_t len)
            {
                auto bytes = source.borrow(len);
                if (!bytes)
                {
                    return std::move(bytes).error();
                }
                return ValueRef(ExtRef{type, *bytes});
            }
        };

        template <typename Trees>
        class TreeReader
        {
        public:
            using Tree = typename Trees::Tree;

            TreeReader(typename Trees::Source &source, const Limits &limits) : source_(source), limits_(limits) {}

            // `depth` counts the containers enclosing the value about to be read.
            Result<Tree> read(std::size_t depth)
            {
                auto marker = read_marker(source_);
                if (!marker)
                {
                    return std::move(marker).error();
                }

                switch (marker->kind())
                {
                case Marker::Kind::Null:
                    return Tree(Nil{});
                case Marker::Kind::True:
                    return Tree(true);
                case Marker::Kind::False:
                    return Tree(false);
                case Marker::Kind::Reserved:
                    return Error::invalid_marker(*marker);
                case Marker::Kind::FixPos:
                case Marker::Kind::FixNeg:
                case Marker::Kind::U8:
                case Marker::Kind::U16:
                case Marker::Kind::U32:
                case Marker::Kind::U64:
                case Marker::Kind::I8:
                case Marker::Kind::I16:
                case Marker::Kind::I32:
                case Marker::Kind::I64:
                {
                    auto value = read_integer_payload(source_, *marker);
                    if (!value)
                    {
                        return std::move(value).error();
                    }
                    return Tree(*value);
                }
                case Marker::Kind::F32:
                {
                    auto bits = read_payload_field(source_, 4);
                    if (!bits)
                    {
                        return std::move(bits).error();
                    }
                    return Tree(std::bit_cast<float>(static_cast<std::uint32_t>(*bits)));
                }
                case Marker::Kind::F64:
                {
                    auto bits = read_payload_field(source_, 8);
                    if (!bits)
                    {
                        return std::move(bits).error();
                    }
                    return Tree(std::bit_cast<double>(*bits));
                }
                case Marker::Kind::FixStr:
                case Marker::Kind::Str8:
                case Marker::Kind::Str16:
                case Marker::Kind::Str32:
                {
                    auto len = read_checked_len(*marker);
                    if (!len)
                    {
                        return std::move(len).error();
                    }
                    return Trees::string(source_, *len);
                }
                case Marker::Kind::Bin8:
                case Marker::Kind::Bin16:
                case Marker::Kind::Bin32:
                {
                    auto len = read_checked_len(*marker);
                    if (!len)
                    {
                        return std::move(len).error();
                    }
                    return Trees::binary(source_, *len);
                }
                case Marker::Kind::FixExt1:
                case Marker::Kind::FixExt2:
                case Marker::Kind::FixExt4:
                case Marker::Kind::FixExt8:
                case Marker::Kind::FixExt16:
                case Marker::Kind::Ext8:
                case Marker::Kind::Ext16:
                case Marker::Kind::Ext32:
                {
                    auto len = read_checked_len(*marker);
                    if (!len)
                    {
                        return std::move(len).error();
                    }
                    auto type = read_payload_field(source_, 1);
                    if (!type)
                    {
                        return std::move(type).error();
                    }
                    return Trees::ext(source_, static_cast<std::int8_t>(static_cast<std::uint8_t>(*type)), *len);
                }
                case Marker::Kind::FixArray:
                case Marker::Kind::Array16:
                case Marker::Kind::Array32:
                {
                    auto len = read_checked_len(*marker);
                    if (!len)
                    {
                        return std::move(len).error();
                    }
                    return read_array(*len, depth);
                }
                case Marker::Kind::FixMap:
                case Marker::Kind::Map16:
                case Marker::Kind::Map32:
                {
                    auto len = read_checked_len(*marker);
                    if (!len)
                    {
                        return std::move(len).error();
                    }
                    return read_map(*len, depth);
                }
                }
                return Error::invalid_marker(*marker);
            }

        private:
            Result<std::uint32_t> read_checked_len(Marker marker)
            {
                auto len = read_len_field(source_, marker);
                if (len && *len > limits_.max_len)
                {
                    return Error::make(ErrorCode::LimitExceeded, "declared length " + std::to_string(*len) +
                                                                     " exceeds the limit of " +
                                                                     std::to_string(limits_.max_len));
                }
                return len;
            }

            Result<void> enter(std::size_t depth) const
            {
                if (depth + 1 > limits_.max_depth)
                {
                    return Error::make(ErrorCode::LimitExceeded,
                                       "nesting exceeds the depth limit of " + std::to_string(limits_.max_depth));
                }
                return {};
            }

            Result<Tree> read_array(std::uint32_t len, std::size_t depth)
            {
                if (auto outcome = enter(depth); !outcome)
                {
                    return std::move(outcome).error();
                }
                typename Tree::Array items;
                items.reserve(std::min(len, kReserveCap));
                for (std::uint32_t i = 0; i < len; ++i)
                {
                    auto item = read(depth + 1);
                    if (!item)
                    {
                        return std::move(item).error();
                    }
                    items.push_back(std::move(*item));
                }
                return Tree(std::move(items));
            }

            Result<Tree> read_map(std::uint32_t len, std::size_t depth)
            {
                if (auto outcome = enter(depth); !outcome)
                {
                    return std::move(outcome).error();
                }
                typename Tree::Map entries;
                entries.reserve(std::min(len, kReserveCap));
                for (std::uint32_t i = 0; i < len; ++i)
                {
                    auto key = read(depth + 1);
                    if (!key)
                    {
                        return std::move(key).error();
                    }
                    auto value = read(depth + 1);
                    if (!value)
                    {
                        return std::move(value).error();
                    }
                    entries.emplace_back(std::move(*key), std::move(*value));
                }
                return Tree(std::move(entries));
            }

            typename Trees::Source &source_;
            const Limits &limits_;
        };
    } // namespace

    Result<Value> read_value(ByteSource &source, const Limits &limits)
    {
        return TreeReader<OwnedTrees>(source, limits).read(0);
    }

    Result<ValueRef> read_value_ref(BorrowSource &source, const Limits &limits)
    {
        return TreeReader<BorrowedTrees>(source, limits).read(0);
    }

} // namespace minipack
