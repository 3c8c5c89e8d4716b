/**
 * MiniPack - Self-delimiting MessagePack framing helpers.
 *
 * Messages are sent back to back with no header; the message-length scanner
 * decides where each one ends.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "minipack/error.hpp"
#include "minipack/io.hpp"
#include "minipack/limits.hpp"
#include "minipack/message_len.hpp"
#include "minipack/value.hpp"

namespace minipack
{

    struct DecodedFrame
    {
        Value message;
        std::size_t bytes_consumed{};
    };

    Result<std::vector<std::uint8_t>> encode_frame(const Value &message);

    /// nullopt while `buffer` holds only a prefix of the next message.
    Result<std::optional<DecodedFrame>> try_decode_frame(std::span<const std::uint8_t> buffer,
                                                         const Limits &limits = {});

    /// Reads exactly one message from a blocking source, never past its last byte.
    /// nullopt when the source ends cleanly before the first byte of a message.
    Result<std::optional<Value>> read_frame(ByteSource &source, const Limits &limits = {});

    /// Accumulates arbitrary chunks and yields complete messages in order.
    class FrameReader
    {
    public:
        explicit FrameReader(Limits limits = {});

        void feed(std::span<const std::uint8_t> bytes);

        /// Next complete message, nullopt when more bytes are needed.
        Result<std::optional<Value>> next();

        std::size_t buffered() const noexcept;

    private:
        Limits limits_;
        MessageLen scanner_;
        std::vector<std::uint8_t> buffer_;
        // Leading bytes of buffer_ that belong to messages already returned.
        std::size_t consumed_{0};
        // Bytes past consumed_ already handed to the scanner.
        std::size_t scanned_{0};
    };

} // namespace minipack
