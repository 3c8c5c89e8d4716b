/**
 * MiniPack - Incremental message-length scanner.
 *
 * Determines the byte length of one complete top-level message from chunks
 * as they arrive, without building values. Each byte is examined once over
 * the lifetime of a scan; the state between calls is the stack of open
 * containers and the number of bytes consumed.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "minipack/error_codes.hpp"
#include "minipack/limits.hpp"
#include "minipack/marker.hpp"

namespace minipack
{

    enum class LenStatus : std::uint8_t
    {
        Complete,
        Truncated,
        Invalid
    };

    struct LenResult
    {
        LenStatus status{LenStatus::Truncated};
        // Complete: exact message length. Truncated: lower bound on the total length. Invalid: 0.
        std::size_t length{};

        static LenResult complete(std::size_t length) noexcept
        {
            return {LenStatus::Complete, length};
        }

        static LenResult truncated(std::size_t at_least) noexcept
        {
            return {LenStatus::Truncated, at_least};
        }

        static LenResult invalid() noexcept
        {
            return {LenStatus::Invalid, 0};
        }

        friend bool operator==(const LenResult &lhs, const LenResult &rhs) noexcept = default;
    };

    class MessageLen
    {
    public:
        explicit MessageLen(Limits limits = {});

        /// Scans `next_bytes`, the bytes that follow everything passed before.
        /// Once Complete or Invalid, further calls repeat that result and ignore their input.
        LenResult incremental_len(std::span<const std::uint8_t> next_bytes);

        /// One-shot scan of a buffer that starts at a message boundary.
        static LenResult len_of(std::span<const std::uint8_t> message, Limits limits = {});

        /// Forgets the current message so the next call starts a new one.
        void reset() noexcept;

        /// Bytes of the current message consumed so far.
        std::size_t position() const noexcept;
        /// Bytes examined since construction, across resets.
        std::size_t bytes_scanned() const noexcept;
        /// Why the scan became Invalid, Ok otherwise.
        ErrorCode error() const noexcept;
        const Limits &limits() const noexcept;

    private:
        enum class Step : std::uint8_t
        {
            Marker,
            Length,
            Payload,
            Complete,
            Invalid
        };

        enum class LengthOf : std::uint8_t
        {
            Bytes,
            Ext,
            Array,
            Map
        };

        void on_marker(Marker marker);
        void on_length(std::uint32_t len);
        void begin_length(LengthOf target, std::size_t width) noexcept;
        void begin_payload(std::uint64_t size);
        void open_container(std::uint64_t items);
        void finish_item() noexcept;
        bool check_len(std::uint64_t len) noexcept;
        void fail(ErrorCode reason) noexcept;
        std::uint64_t lower_bound() const noexcept;
        LenResult truncated() noexcept;

        Limits limits_;
        Step step_{Step::Marker};
        std::size_t position_{0};
        std::size_t estimate_{1};
        std::size_t bytes_scanned_{0};
        ErrorCode error_{ErrorCode::Ok};

        // Items not yet started, one entry per open container.
        std::vector<std::uint64_t> open_;
        std::uint64_t pending_items_{0};

        std::uint64_t payload_left_{0};

        LengthOf length_of_{LengthOf::Bytes};
        std::array<std::uint8_t, 4> length_buffer_{};
        std::size_t length_have_{0};
        std::size_t length_size_{0};
    };

} // namespace minipack
