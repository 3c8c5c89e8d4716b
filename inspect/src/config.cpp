#include "minipack/inspect/config.hpp"

#include <stdexcept>
#include <string>

namespace minipack::inspect
{

    namespace
    {
        std::string require_value(int &index, int argc, char *argv[], const std::string &option)
        {
            if (index >= argc)
            {
                throw std::runtime_error(option + " requires a value");
            }
            return argv[index++];
        }
    } // namespace

    InspectConfig parse_arguments(int argc, char *argv[])
    {
        InspectConfig config;
        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--config")
            {
                config.config_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--max-depth")
            {
                config.max_depth = static_cast<std::size_t>(std::stoull(require_value(index, argc, argv, arg)));
            }
            else if (arg == "--max-size")
            {
                config.max_size = static_cast<std::uint64_t>(std::stoull(require_value(index, argc, argv, arg)));
            }
            else if (arg == "--connect")
            {
                const auto endpoint = require_value(index, argc, argv, arg);
                const auto colon_pos = endpoint.rfind(':');
                if (colon_pos == std::string::npos || colon_pos == 0)
                {
                    throw std::runtime_error("Expected endpoint format host:port");
                }
                config.host = endpoint.substr(0, colon_pos);
                const auto port = std::stoul(endpoint.substr(colon_pos + 1));
                if (port == 0 || port > 65535)
                {
                    throw std::runtime_error("Port out of range: " + endpoint.substr(colon_pos + 1));
                }
                config.port = static_cast<std::uint16_t>(port);
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                config.show_help = true;
            }
            else if (arg == "-" || arg.rfind("--", 0) != 0)
            {
                if (config.input)
                {
                    throw std::runtime_error("Only one input may be given, got another: " + arg);
                }
                config.input = std::filesystem::path(arg);
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        if (config.host && config.input)
        {
            throw std::runtime_error("--connect cannot be combined with an input file");
        }
        return config;
    }

    CodecConfig resolve_codec_config(const InspectConfig &config)
    {
        CodecConfig codec = config.config_path ? load_config(*config.config_path) : CodecConfig{};
        if (config.max_depth)
        {
            codec.limits.max_depth = *config.max_depth;
        }
        if (config.max_size)
        {
            codec.limits.max_size = *config.max_size;
        }
        return codec;
    }

} // namespace minipack::inspect
