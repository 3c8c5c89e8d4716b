/**
 * MiniPack - Codec configuration and its JSON form.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>

#include "minipack/limits.hpp"

namespace minipack
{

    /// How a record is laid out on the wire.
    enum class StructShape : std::uint8_t
    {
        Tuple,
        Map
    };

    std::string_view to_string(StructShape shape) noexcept;
    std::optional<StructShape> struct_shape_from_string(std::string_view value) noexcept;

    struct CodecConfig
    {
        Limits limits{};
        StructShape struct_shape{StructShape::Tuple};
    };

    void to_json(nlohmann::json &json, const Limits &limits);
    void from_json(const nlohmann::json &json, Limits &limits);

    void to_json(nlohmann::json &json, const CodecConfig &config);
    void from_json(const nlohmann::json &json, CodecConfig &config);

    /// Reads a JSON config file. Missing keys keep their defaults.
    CodecConfig load_config(const std::filesystem::path &path);

} // namespace minipack
