#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <asio.hpp>

#include "minipack/framing.hpp"
#include "minipack/inspect/config.hpp"
#include "minipack/io.hpp"
#include "minipack/json.hpp"
#include "minipack/socket_io.hpp"
#include "minipack/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "MiniPack inspector " << minipack::version() << "\n"
                  << "Usage: " << program_name
                  << " [<FILE>|-] [--connect <HOST:PORT>] [--config <FILE>] [--max-depth <N>] [--max-size <BYTES>] "
                     "[--log <FILE>] [--verbose]\n";
    }

    void setup_logging(const minipack::inspect::InspectConfig &config)
    {
        std::vector<spdlog::sink_ptr> sinks;
        // Stdout carries the decoded messages.
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (config.log_path)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_path->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("inspect", sinks.begin(), sinks.end());
        logger->set_level(config.verbose ? spdlog::level::debug : spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    }

    // Prints every message as one JSON line. Returns false on a malformed stream.
    bool dump_messages(minipack::ByteSource &source, const minipack::Limits &limits)
    {
        std::size_t count = 0;
        for (;;)
        {
            auto message = minipack::read_frame(source, limits);
            if (!message)
            {
                spdlog::error("Message {} unreadable: {}", count + 1, message.error().describe());
                return false;
            }
            if (!message->has_value())
            {
                break;
            }
            std::cout << minipack::to_json_value(**message).dump() << '\n';
            ++count;
        }
        std::cout.flush();
        spdlog::info("Decoded {} message(s)", count);
        return true;
    }

} // namespace

int main(int argc, char *argv[])
{
    minipack::inspect::InspectConfig config;
    try
    {
        config = minipack::inspect::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (config.show_help)
    {
        print_usage(argv[0]);
        return EXIT_SUCCESS;
    }

    try
    {
        setup_logging(config);
        const auto codec = minipack::inspect::resolve_codec_config(config);
        spdlog::debug("Limits: depth {}, length {}, size {}", codec.limits.max_depth, codec.limits.max_len,
                      codec.limits.max_size);

        bool ok = false;
        if (config.host)
        {
            asio::io_context io_context;
            asio::ip::tcp::resolver resolver(io_context);
            asio::ip::tcp::socket socket(io_context);
            asio::connect(socket, resolver.resolve(*config.host, std::to_string(config.port)));
            spdlog::info("Connected to {}:{}", *config.host, config.port);
            minipack::SocketSource source(socket);
            ok = dump_messages(source, codec.limits);
        }
        else if (!config.input || config.input->string() == "-")
        {
            minipack::StreamSource source(std::cin);
            ok = dump_messages(source, codec.limits);
        }
        else
        {
            std::ifstream file(*config.input, std::ios::binary);
            if (!file)
            {
                throw std::runtime_error("Cannot open " + config.input->string());
            }
            minipack::StreamSource source(file);
            ok = dump_messages(source, codec.limits);
        }
        return ok ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Inspector failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }
}
