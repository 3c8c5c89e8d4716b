#include "minipack/shape.hpp"

#include "minipack/decode.hpp"
#include "minipack/encode.hpp"
#include "minipack/value_codec.hpp"

namespace minipack
{

    ContainerShape tuple_shape()
    {
        return ContainerShape{
            .write_container_len = [](ByteSink &sink, std::uint32_t count) { return write_array_len(sink, count); },
            .write_field = [](ByteSink &, std::string_view) { return Result<void>(); },
        };
    }

    ContainerShape map_shape()
    {
        return ContainerShape{
            .write_container_len = [](ByteSink &sink, std::uint32_t count) { return write_map_len(sink, count); },
            .write_field = [](ByteSink &sink, std::string_view name) -> Result<void>
            {
                if (auto outcome = write_str(sink, name); !outcome)
                {
                    return std::move(outcome).error();
                }
                return {};
            },
        };
    }

    ContainerShape shape_for(StructShape shape)
    {
        return shape == StructShape::Map ? map_shape() : tuple_shape();
    }

    StructWriter::StructWriter(ByteSink &sink, ContainerShape shape) : sink_(sink), shape_(std::move(shape)) {}

    Result<void> StructWriter::begin(std::uint32_t field_count)
    {
        if (auto outcome = shape_.write_container_len(sink_, field_count); !outcome)
        {
            return std::move(outcome).error();
        }
        return {};
    }

    Result<void> StructWriter::field(std::string_view name)
    {
        return shape_.write_field(sink_, name);
    }

    Result<void> StructWriter::field(std::string_view name, const Value &value)
    {
        if (auto outcome = field(name); !outcome)
        {
            return std::move(outcome).error();
        }
        return write_value(sink_, value);
    }

    Result<StructHeader> read_struct_header(ByteSource &source)
    {
        auto marker = read_marker(source);
        if (!marker)
        {
            return std::move(marker).error();
        }
        bool named = false;
        switch (marker->kind())
        {
        case Marker::Kind::FixArray:
        case Marker::Kind::Array16:
        case Marker::Kind::Array32:
            break;
        case Marker::Kind::FixMap:
        case Marker::Kind::Map16:
        case Marker::Kind::Map32:
            named = true;
            break;
        default:
            return Error::type_mismatch(*marker);
        }
        auto count = read_len_field(source, *marker);
        if (!count)
        {
            return std::move(count).error();
        }
        return StructHeader{.field_count = *count, .named = named};
    }

} // namespace minipack
