/**
 * MiniPack - Pluggable container shape for records.
 *
 * A record is written either as an array of its field values (tuple shape) or
 * as a map from field name to value (map shape). The choice is a pair of
 * callables injected into StructWriter, so callers can supply their own.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <string_view>

#include "minipack/config.hpp"
#include "minipack/error.hpp"
#include "minipack/io.hpp"
#include "minipack/marker.hpp"
#include "minipack/value.hpp"

namespace minipack
{

    struct ContainerShape
    {
        std::function<Result<Marker>(ByteSink &, std::uint32_t)> write_container_len;
        // Called before each field value.
        std::function<Result<void>(ByteSink &, std::string_view)> write_field;
    };

    ContainerShape tuple_shape();
    ContainerShape map_shape();
    ContainerShape shape_for(StructShape shape);

    class StructWriter
    {
    public:
        StructWriter(ByteSink &sink, ContainerShape shape);

        Result<void> begin(std::uint32_t field_count);
        /// Emits whatever precedes a field value; the caller writes the value next.
        Result<void> field(std::string_view name);
        Result<void> field(std::string_view name, const Value &value);

    private:
        ByteSink &sink_;
        ContainerShape shape_;
    };

    struct StructHeader
    {
        std::uint32_t field_count{};
        // Map shape: each field value is preceded by its name.
        bool named{};
    };

    /// Accepts either shape. Any marker other than an array or map fails with TypeMismatch.
    Result<StructHeader> read_struct_header(ByteSource &source);

} // namespace minipack
