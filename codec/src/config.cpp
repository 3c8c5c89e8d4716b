#include "minipack/config.hpp"

#include <array>
#include <fstream>
#include <stdexcept>
#include <string>

namespace minipack
{

    namespace
    {
        struct StructShapeMapping
        {
            StructShape shape;
            std::string_view label;
        };

        constexpr std::array<StructShapeMapping, 2> kStructShapeMappings{{
            {StructShape::Tuple, "tuple"},
            {StructShape::Map, "map"},
        }};
    } // namespace

    std::string_view to_string(StructShape shape) noexcept
    {
        for (const auto &mapping : kStructShapeMappings)
        {
            if (mapping.shape == shape)
            {
                return mapping.label;
            }
        }
        return "tuple";
    }

    std::optional<StructShape> struct_shape_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kStructShapeMappings)
        {
            if (mapping.label == value)
            {
                return mapping.shape;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const Limits &limits)
    {
        json = {
            {"max_depth", limits.max_depth},
            {"max_len", limits.max_len},
            {"max_size", limits.max_size},
        };
    }

    void from_json(const nlohmann::json &json, Limits &limits)
    {
        const Limits defaults{};
        limits.max_depth = json.value("max_depth", defaults.max_depth);
        limits.max_len = json.value("max_len", defaults.max_len);
        limits.max_size = json.value("max_size", defaults.max_size);
    }

    void to_json(nlohmann::json &json, const CodecConfig &config)
    {
        json = {
            {"limits", config.limits},
            {"struct_shape", std::string(to_string(config.struct_shape))},
        };
    }

    void from_json(const nlohmann::json &json, CodecConfig &config)
    {
        config.limits = json.value("limits", Limits{});
        if (auto it = json.find("struct_shape"); it != json.end())
        {
            const auto label = it->get<std::string>();
            auto shape = struct_shape_from_string(label);
            if (!shape)
            {
                throw std::runtime_error("Unknown struct_shape: " + label);
            }
            config.struct_shape = *shape;
        }
        else
        {
            config.struct_shape = StructShape::Tuple;
        }
    }

    CodecConfig load_config(const std::filesystem::path &path)
    {
        std::ifstream input(path);
        if (!input)
        {
            throw std::runtime_error("Cannot open config file: " + path.string());
        }
        nlohmann::json json;
        try
        {
            input >> json;
        }
        catch (const nlohmann::json::parse_error &error)
        {
            throw std::runtime_error("Invalid config file " + path.string() + ": " + error.what());
        }
        return json.get<CodecConfig>();
    }

} // namespace minipack
