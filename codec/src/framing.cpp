#include "minipack/framing.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "minipack/value_codec.hpp"

namespace minipack
{

    namespace
    {
        // Largest read issued at once while a message is still arriving.
        constexpr std::size_t kReadBlock = 64 * 1024;

        Error rejected(const MessageLen &scanner)
        {
            spdlog::warn("Rejected message at byte {}: {}", scanner.position(), to_string(scanner.error()));
            return Error::make(scanner.error(), "malformed message at byte " + std::to_string(scanner.position()));
        }

        Result<Value> decode_complete(std::span<const std::uint8_t> message, const Limits &limits)
        {
            SliceSource source(message);
            auto value = read_value(source, limits);
            if (!value)
            {
                spdlog::warn("Message of {} bytes failed to decode: {}", message.size(), value.error().describe());
            }
            return value;
        }
    } // namespace

    Result<std::vector<std::uint8_t>> encode_frame(const Value &message)
    {
        BufferSink sink;
        if (auto outcome = write_value(sink, message); !outcome)
        {
            return std::move(outcome).error();
        }
        return sink.take();
    }

    Result<std::optional<DecodedFrame>> try_decode_frame(std::span<const std::uint8_t> buffer, const Limits &limits)
    {
        MessageLen scanner(limits);
        const auto len = scanner.incremental_len(buffer);
        switch (len.status)
        {
        case LenStatus::Truncated:
            spdlog::debug("Frame incomplete: have {} bytes, need at least {}", buffer.size(), len.length);
            return std::optional<DecodedFrame>{};
        case LenStatus::Invalid:
            return rejected(scanner);
        case LenStatus::Complete:
            break;
        }

        auto value = decode_complete(buffer.first(len.length), limits);
        if (!value)
        {
            return std::move(value).error();
        }
        spdlog::debug("Frame complete: {} bytes", len.length);
        return std::optional<DecodedFrame>(DecodedFrame{
            .message = std::move(*value),
            .bytes_consumed = len.length,
        });
    }

    Result<std::optional<Value>> read_frame(ByteSource &source, const Limits &limits)
    {
        std::vector<std::uint8_t> buffer(1);
        auto first = source.read_some(buffer);
        if (!first)
        {
            return std::move(first).error();
        }
        if (*first == 0)
        {
            return std::optional<Value>{};
        }

        MessageLen scanner(limits);
        auto len = scanner.incremental_len(buffer);
        while (len.status == LenStatus::Truncated)
        {
            const auto offset = buffer.size();
            const auto want = std::min(len.length - offset, kReadBlock);
            buffer.resize(offset + want);
            const auto fresh = std::span<std::uint8_t>(buffer).subspan(offset);
            if (auto outcome = source.read_exact(fresh); !outcome)
            {
                return std::move(outcome).error();
            }
            len = scanner.incremental_len(fresh);
        }
        if (len.status == LenStatus::Invalid)
        {
            return rejected(scanner);
        }

        auto value = decode_complete(buffer, limits);
        if (!value)
        {
            return std::move(value).error();
        }
        spdlog::debug("Read message of {} bytes", len.length);
        return std::optional<Value>(std::move(*value));
    }

    FrameReader::FrameReader(Limits limits) : limits_(limits), scanner_(limits) {}

    void FrameReader::feed(std::span<const std::uint8_t> bytes)
    {
        // Compact once the returned messages make up at least half of the buffer.
        if (consumed_ > 0 && consumed_ >= buffer_.size() - consumed_)
        {
            buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(consumed_));
            consumed_ = 0;
        }
        buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
    }

    Result<std::optional<Value>> FrameReader::next()
    {
        const auto pending = std::span<const std::uint8_t>(buffer_).subspan(consumed_);
        const auto len = scanner_.incremental_len(pending.subspan(scanned_));
        switch (len.status)
        {
        case LenStatus::Truncated:
            scanned_ = pending.size();
            return std::optional<Value>{};
        case LenStatus::Invalid:
            scanned_ = pending.size();
            return rejected(scanner_);
        case LenStatus::Complete:
            break;
        }

        auto value = decode_complete(pending.first(len.length), limits_);
        consumed_ += len.length;
        scanner_.reset();
        scanned_ = 0;
        if (consumed_ == buffer_.size())
        {
            buffer_.clear();
            consumed_ = 0;
        }
        if (!value)
        {
            return std::move(value).error();
        }
        return std::optional<Value>(std::move(*value));
    }

    std::size_t FrameReader::buffered() const noexcept
    {
        return buffer_.size() - consumed_;
    }

} // namespace minipack
