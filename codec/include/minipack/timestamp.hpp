/**
 * MiniPack - Timestamp extension (ext type -1) in its 32, 64 and 96 bit forms.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <span>

#include "minipack/error.hpp"
#include "minipack/io.hpp"

namespace minipack
{

    inline constexpr std::int8_t kTimestampExtType = -1;

    class Timestamp
    {
    public:
        static constexpr std::uint32_t kMaxNanoseconds = 999'999'999;
        static constexpr std::int64_t kMax64BitSeconds = 0x3'ffff'ffff;

        /// Seconds only, stored as FixExt4.
        static Timestamp from_32(std::uint32_t seconds) noexcept;
        /// 34-bit seconds and 30-bit nanoseconds, stored as FixExt8.
        static std::optional<Timestamp> from_64(std::int64_t seconds, std::uint32_t nanoseconds) noexcept;
        /// Signed 64-bit seconds, stored as Ext8 with 12 bytes.
        static std::optional<Timestamp> from_96(std::int64_t seconds, std::uint32_t nanoseconds) noexcept;
        /// Picks the smallest form able to hold the instant.
        static std::optional<Timestamp> from_instant(std::int64_t seconds, std::uint32_t nanoseconds) noexcept;

        /// Parses the payload of a type -1 extension.
        static Result<Timestamp> from_ext_payload(std::span<const std::uint8_t> payload);

        int bit_size() const noexcept
        {
            return bits_;
        }

        std::int64_t seconds() const noexcept
        {
            return seconds_;
        }

        std::uint32_t nanoseconds() const noexcept
        {
            return nanoseconds_;
        }

        friend bool operator==(const Timestamp &lhs, const Timestamp &rhs) noexcept = default;

    private:
        Timestamp(int bits, std::int64_t seconds, std::uint32_t nanoseconds) noexcept
            : bits_(bits), seconds_(seconds), nanoseconds_(nanoseconds)
        {
        }

        int bits_;
        std::int64_t seconds_;
        std::uint32_t nanoseconds_;
    };

    Result<Marker> write_timestamp(ByteSink &sink, Timestamp timestamp);

    /// Fails with TypeMismatch for any other ext type and InvalidTimestamp for a malformed payload.
    Result<Timestamp> read_timestamp(ByteSource &source);

} // namespace minipack
