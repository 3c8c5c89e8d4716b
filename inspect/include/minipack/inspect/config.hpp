#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "minipack/config.hpp"

namespace minipack::inspect
{

    struct InspectConfig
    {
        std::optional<std::filesystem::path> config_path;
        std::optional<std::filesystem::path> log_path;
        std::optional<std::size_t> max_depth;
        std::optional<std::uint64_t> max_size;
        std::optional<std::string> host;
        std::uint16_t port{};
        // Unset or "-" reads standard input.
        std::optional<std::filesystem::path> input;
        bool verbose{};
        bool show_help{};
    };

    InspectConfig parse_arguments(int argc, char *argv[]);

    /// Config file values with command-line overrides applied.
    CodecConfig resolve_codec_config(const InspectConfig &config);

} // namespace minipack::inspect
