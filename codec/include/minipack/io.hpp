/**
 * MiniPack - Byte source and sink capabilities plus in-memory and stream implementations.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <span>
#include <vector>

#include "minipack/error.hpp"

namespace minipack
{

    class ByteSource
    {
    public:
        virtual ~ByteSource() = default;

        /// Reads up to `buffer.size()` bytes. A result of 0 for a non-empty buffer means end of input.
        virtual Result<std::size_t> read(std::span<std::uint8_t> buffer) = 0;

        /// Like read, with interrupted reads retried.
        Result<std::size_t> read_some(std::span<std::uint8_t> buffer);

        /// Fills `buffer` completely. End of input yields InsufficientData; interrupted reads are retried.
        Result<void> read_exact(std::span<std::uint8_t> buffer);
    };

    /// A source whose bytes already live in memory and can be handed out without copying.
    class BorrowSource : public ByteSource
    {
    public:
        /// Returns the next `size` bytes as a view into the backing storage and advances past them.
        virtual Result<std::span<const std::uint8_t>> borrow(std::size_t size) = 0;
    };

    class ByteSink
    {
    public:
        virtual ~ByteSink() = default;

        /// Writes up to `bytes.size()` bytes and reports how many were accepted.
        virtual Result<std::size_t> write(std::span<const std::uint8_t> bytes) = 0;

        /// Writes every byte. A sink that accepts nothing is an I/O fault; interrupted writes are retried.
        Result<void> write_all(std::span<const std::uint8_t> bytes);
    };

    class SliceSource final : public BorrowSource
    {
    public:
        explicit SliceSource(std::span<const std::uint8_t> data) noexcept;

        Result<std::size_t> read(std::span<std::uint8_t> buffer) override;
        Result<std::span<const std::uint8_t>> borrow(std::size_t size) override;

        std::size_t position() const noexcept;
        std::span<const std::uint8_t> remaining() const noexcept;

    private:
        std::span<const std::uint8_t> data_;
        std::size_t position_{0};
    };

    /// Input split over discontiguous chunks. Borrowing across a chunk boundary fails with FragmentedInput.
    class ChunkedSource final : public BorrowSource
    {
    public:
        explicit ChunkedSource(std::vector<std::span<const std::uint8_t>> chunks);

        Result<std::size_t> read(std::span<std::uint8_t> buffer) override;
        Result<std::span<const std::uint8_t>> borrow(std::size_t size) override;

        std::size_t position() const noexcept;

    private:
        void skip_exhausted() noexcept;
        std::size_t remaining_total() const noexcept;

        std::vector<std::span<const std::uint8_t>> chunks_;
        std::size_t chunk_{0};
        std::size_t offset_{0};
        std::size_t position_{0};
    };

    class BufferSink final : public ByteSink
    {
    public:
        BufferSink() = default;

        Result<std::size_t> write(std::span<const std::uint8_t> bytes) override;

        const std::vector<std::uint8_t> &bytes() const noexcept;
        std::vector<std::uint8_t> take() noexcept;
        void clear() noexcept;

    private:
        std::vector<std::uint8_t> buffer_;
    };

    /// Writes into a caller-owned fixed buffer; once it is full every further write accepts 0 bytes.
    class SpanSink final : public ByteSink
    {
    public:
        explicit SpanSink(std::span<std::uint8_t> buffer) noexcept;

        Result<std::size_t> write(std::span<const std::uint8_t> bytes) override;

        std::size_t written() const noexcept;

    private:
        std::span<std::uint8_t> buffer_;
        std::size_t written_{0};
    };

    class StreamSource final : public ByteSource
    {
    public:
        explicit StreamSource(std::istream &stream) noexcept;

        Result<std::size_t> read(std::span<std::uint8_t> buffer) override;

    private:
        std::istream &stream_;
    };

    class StreamSink final : public ByteSink
    {
    public:
        explicit StreamSink(std::ostream &stream) noexcept;

        Result<std::size_t> write(std::span<const std::uint8_t> bytes) override;
        Result<void> flush();

    private:
        std::ostream &stream_;
    };

} // namespace minipack
