#include "minipack/value_codec.hpp"

#include <limits>

#include "minipack/encode.hpp"

namespace minipack
{

    namespace
    {
        Result<std::uint32_t> container_len(std::size_t size)
        {
            if (size > std::numeric_limits<std::uint32_t>::max())
            {
                return Error::make(ErrorCode::LengthOverflow,
                                   "container of " + std::to_string(size) + " entries does not fit a 32-bit length");
            }
            return static_cast<std::uint32_t>(size);
        }

        Result<void> discard_marker(Result<Marker> written)
        {
            if (!written)
            {
                return std::move(written).error();
            }
            return {};
        }

        template <typename Tree>
        class TreeWriter
        {
        public:
            explicit TreeWriter(ByteSink &sink) : sink_(sink) {}

            Result<void> write(const Tree &tree)
            {
                return std::visit([this](const auto &node) { return write_node(node); }, tree.storage());
            }

        private:
            Result<void> write_node(Nil)
            {
                return discard_marker(write_nil(sink_));
            }

            Result<void> write_node(bool value)
            {
                return discard_marker(write_bool(sink_, value));
            }

            Result<void> write_node(Integer value)
            {
                return discard_marker(write_integer(sink_, value));
            }

            Result<void> write_node(float value)
            {
                return discard_marker(write_f32(sink_, value));
            }

            Result<void> write_node(double value)
            {
                return discard_marker(write_f64(sink_, value));
            }

            Result<void> write_node(std::string_view value)
            {
                return discard_marker(write_str(sink_, value));
            }

            Result<void> write_node(const std::string &value)
            {
                return discard_marker(write_str(sink_, value));
            }

            Result<void> write_node(const Binary &value)
            {
                return discard_marker(write_bin(sink_, value));
            }

            Result<void> write_node(const BinaryRef &value)
            {
                return discard_marker(write_bin(sink_, value.data));
            }

            Result<void> write_node(const Ext &value)
            {
                return discard_marker(write_ext(sink_, value.type, value.data));
            }

            Result<void> write_node(const ExtRef &value)
            {
                return discard_marker(write_ext(sink_, value.type, value.data));
            }

            Result<void> write_node(const typename Tree::Array &items)
            {
                auto len = container_len(items.size());
                if (!len)
                {
                    return std::move(len).error();
                }
                if (auto outcome = write_array_len(sink_, *len); !outcome)
                {
                    return std::move(outcome).error();
                }
                for (const auto &item : items)
                {
                    if (auto outcome = write(item); !outcome)
                    {
                        return std::move(outcome).error();
                    }
                }
                return {};
            }

            Result<void> write_node(const typename Tree::Map &entries)
            {
                auto len = container_len(entries.size());
                if (!len)
                {
                    return std::move(len).error();
                }
                if (auto outcome = write_map_len(sink_, *len); !outcome)
                {
                    return std::move(outcome).error();
                }
                for (const auto &[key, value] : entries)
                {
                    if (auto outcome = write(key); !outcome)
                    {
                        return std::move(outcome).error();
                    }
                    if (auto outcome = write(value); !outcome)
                    {
                        return std::move(outcome).error();
                    }
                }
                return {};
            }

            ByteSink &sink_;
        };
    } // namespace

    Result<void> write_value(ByteSink &sink, const Value &value)
    {
        return TreeWriter<Value>(sink).write(value);
    }

    Result<void> write_value_ref(ByteSink &sink, const ValueRef &value)
    {
        return TreeWriter<ValueRef>(sink).write(value);
    }

} // namespace minipack
