#include "minipack/io.hpp"

#include <algorithm>
#include <istream>
#include <ostream>
#include <utility>

namespace minipack
{

    namespace
    {
        bool is_interrupted(const Error &error)
        {
            return error.code == ErrorCode::IoFault && error.io_error == std::errc::interrupted;
        }
    } // namespace

    Result<std::size_t> ByteSource::read_some(std::span<std::uint8_t> buffer)
    {
        for (;;)
        {
            auto count = read(buffer);
            if (count || !is_interrupted(count.error()))
            {
                return count;
            }
        }
    }

    Result<void> ByteSource::read_exact(std::span<std::uint8_t> buffer)
    {
        std::size_t filled = 0;
        while (filled < buffer.size())
        {
            auto count = read_some(buffer.subspan(filled));
            if (!count)
            {
                return std::move(count).error();
            }
            if (*count == 0)
            {
                return Error::insufficient_data();
            }
            filled += *count;
        }
        return {};
    }

    Result<void> ByteSink::write_all(std::span<const std::uint8_t> bytes)
    {
        std::size_t written = 0;
        while (written < bytes.size())
        {
            auto count = write(bytes.subspan(written));
            if (!count)
            {
                if (is_interrupted(count.error()))
                {
                    continue;
                }
                return std::move(count).error();
            }
            if (*count == 0)
            {
                return Error::io_fault(std::make_error_code(std::errc::no_buffer_space));
            }
            written += *count;
        }
        return {};
    }

    SliceSource::SliceSource(std::span<const std::uint8_t> data) noexcept : data_(data) {}

    Result<std::size_t> SliceSource::read(std::span<std::uint8_t> buffer)
    {
        const auto available = remaining();
        const auto count = std::min(buffer.size(), available.size());
        std::copy_n(available.begin(), count, buffer.begin());
        position_ += count;
        return count;
    }

    Result<std::span<const std::uint8_t>> SliceSource::borrow(std::size_t size)
    {
        const auto available = remaining();
        if (available.size() < size)
        {
            return Error::insufficient_data();
        }
        position_ += size;
        return available.first(size);
    }

    std::size_t SliceSource::position() const noexcept
    {
        return position_;
    }

    std::span<const std::uint8_t> SliceSource::remaining() const noexcept
    {
        return data_.subspan(position_);
    }

    ChunkedSource::ChunkedSource(std::vector<std::span<const std::uint8_t>> chunks) : chunks_(std::move(chunks))
    {
        skip_exhausted();
    }

    void ChunkedSource::skip_exhausted() noexcept
    {
        while (chunk_ < chunks_.size() && offset_ == chunks_[chunk_].size())
        {
            ++chunk_;
            offset_ = 0;
        }
    }

    std::size_t ChunkedSource::remaining_total() const noexcept
    {
        std::size_t total = 0;
        for (std::size_t i = chunk_; i < chunks_.size(); ++i)
        {
            total += chunks_[i].size();
        }
        return total - offset_;
    }

    Result<std::size_t> ChunkedSource::read(std::span<std::uint8_t> buffer)
    {
        std::size_t filled = 0;
        while (filled < buffer.size() && chunk_ < chunks_.size())
        {
            const auto available = chunks_[chunk_].subspan(offset_);
            const auto count = std::min(buffer.size() - filled, available.size());
            std::copy_n(available.begin(), count, buffer.begin() + static_cast<std::ptrdiff_t>(filled));
            filled += count;
            offset_ += count;
            position_ += count;
            skip_exhausted();
        }
        return filled;
    }

    Result<std::span<const std::uint8_t>> ChunkedSource::borrow(std::size_t size)
    {
        if (size == 0)
        {
            return std::span<const std::uint8_t>{};
        }
        if (chunk_ < chunks_.size() && chunks_[chunk_].size() - offset_ >= size)
        {
            const auto view = chunks_[chunk_].subspan(offset_, size);
            offset_ += size;
            position_ += size;
            skip_exhausted();
            return view;
        }
        if (remaining_total() < size)
        {
            return Error::insufficient_data();
        }
        return Error::make(ErrorCode::FragmentedInput,
                           "borrowed span of " + std::to_string(size) + " bytes crosses a chunk boundary at offset " +
                               std::to_string(position_));
    }

    std::size_t ChunkedSource::position() const noexcept
    {
        return position_;
    }

    Result<std::size_t> BufferSink::write(std::span<const std::uint8_t> bytes)
    {
        buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
        return bytes.size();
    }

    const std::vector<std::uint8_t> &BufferSink::bytes() const noexcept
    {
        return buffer_;
    }

    std::vector<std::uint8_t> BufferSink::take() noexcept
    {
        return std::exchange(buffer_, {});
    }

    void BufferSink::clear() noexcept
    {
        buffer_.clear();
    }

    SpanSink::SpanSink(std::span<std::uint8_t> buffer) noexcept : buffer_(buffer) {}

    Result<std::size_t> SpanSink::write(std::span<const std::uint8_t> bytes)
    {
        const auto count = std::min(bytes.size(), buffer_.size() - written_);
        std::copy_n(bytes.begin(), count, buffer_.begin() + static_cast<std::ptrdiff_t>(written_));
        written_ += count;
        return count;
    }

    std::size_t SpanSink::written() const noexcept
    {
        return written_;
    }

    StreamSource::StreamSource(std::istream &stream) noexcept : stream_(stream) {}

    Result<std::size_t> StreamSource::read(std::span<std::uint8_t> buffer)
    {
        if (buffer.empty() || stream_.eof())
        {
            return std::size_t{0};
        }
        stream_.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        if (stream_.bad())
        {
            return Error::io_fault(std::make_error_code(std::errc::io_error));
        }
        return static_cast<std::size_t>(stream_.gcount());
    }

    StreamSink::StreamSink(std::ostream &stream) noexcept : stream_(stream) {}

    Result<std::size_t> StreamSink::write(std::span<const std::uint8_t> bytes)
    {
        stream_.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!stream_)
        {
            return Error::io_fault(std::make_error_code(std::errc::io_error));
        }
        return bytes.size();
    }

    Result<void> StreamSink::flush()
    {
        stream_.flush();
        if (!stream_)
        {
            return Error::io_fault(std::make_error_code(std::errc::io_error));
        }
        return {};
    }

} // namespace minipack
