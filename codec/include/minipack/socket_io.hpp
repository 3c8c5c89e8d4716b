/**
 * MiniPack - Byte source and sink over a blocking asio TCP socket.
 */
#pragma once

#include <asio.hpp>

#include "minipack/io.hpp"

namespace minipack
{

    class SocketSource final : public ByteSource
    {
    public:
        explicit SocketSource(asio::ip::tcp::socket &socket) noexcept;

        // An orderly shutdown by the peer reads as end of input.
        Result<std::size_t> read(std::span<std::uint8_t> buffer) override;

    private:
        asio::ip::tcp::socket &socket_;
    };

    class SocketSink final : public ByteSink
    {
    public:
        explicit SocketSink(asio::ip::tcp::socket &socket) noexcept;

        Result<std::size_t> write(std::span<const std::uint8_t> bytes) override;

    private:
        asio::ip::tcp::socket &socket_;
    };

} // namespace minipack
