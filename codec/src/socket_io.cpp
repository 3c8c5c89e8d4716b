#include "minipack/socket_io.hpp"

namespace minipack
{

    SocketSource::SocketSource(asio::ip::tcp::socket &socket) noexcept : socket_(socket) {}

    Result<std::size_t> SocketSource::read(std::span<std::uint8_t> buffer)
    {
        if (buffer.empty())
        {
            return std::size_t{0};
        }
        std::error_code ec;
        const auto count = socket_.read_some(asio::buffer(buffer.data(), buffer.size()), ec);
        if (ec == asio::error::eof)
        {
            return std::size_t{0};
        }
        if (ec)
        {
            return Error::io_fault(ec);
        }
        return count;
    }

    SocketSink::SocketSink(asio::ip::tcp::socket &socket) noexcept : socket_(socket) {}

    Result<std::size_t> SocketSink::write(std::span<const std::uint8_t> bytes)
    {
        if (bytes.empty())
        {
            return std::size_t{0};
        }
        std::error_code ec;
        const auto count = socket_.write_some(asio::buffer(bytes.data(), bytes.size()), ec);
        if (ec)
        {
            return Error::io_fault(ec);
        }
        return count;
    }

} // namespace minipack
