#include "minipack/timestamp.hpp"

#include <array>

#include "minipack/decode.hpp"
#include "minipack/encode.hpp"
#include "wire.hpp"

namespace minipack
{

    namespace
    {
        Error invalid_timestamp(std::string message)
        {
            return Error::make(ErrorCode::InvalidTimestamp, std::move(message));
        }
    } // namespace

    Timestamp Timestamp::from_32(std::uint32_t seconds) noexcept
    {
        return Timestamp(32, seconds, 0);
    }

    std::optional<Timestamp> Timestamp::from_64(std::int64_t seconds, std::uint32_t nanoseconds) noexcept
    {
        if (seconds < 0 || seconds > kMax64BitSeconds || nanoseconds > kMaxNanoseconds)
        {
            return std::nullopt;
        }
        return Timestamp(64, seconds, nanoseconds);
    }

    std::optional<Timestamp> Timestamp::from_96(std::int64_t seconds, std::uint32_t nanoseconds) noexcept
    {
        if (nanoseconds > kMaxNanoseconds)
        {
            return std::nullopt;
        }
        return Timestamp(96, seconds, nanoseconds);
    }

    std::optional<Timestamp> Timestamp::from_instant(std::int64_t seconds, std::uint32_t nanoseconds) noexcept
    {
        if (nanoseconds == 0 && seconds >= 0 && seconds <= 0xffff'ffff)
        {
            return from_32(static_cast<std::uint32_t>(seconds));
        }
        if (auto compact = from_64(seconds, nanoseconds))
        {
            return compact;
        }
        return from_96(seconds, nanoseconds);
    }

    Result<Timestamp> Timestamp::from_ext_payload(std::span<const std::uint8_t> payload)
    {
        switch (payload.size())
        {
        case 4:
            return from_32(static_cast<std::uint32_t>(wire::load_be(payload)));
        case 8:
        {
            const auto data = wire::load_be(payload);
            const auto nanoseconds = static_cast<std::uint32_t>(data >> 34);
            const auto seconds = static_cast<std::int64_t>(data & static_cast<std::uint64_t>(kMax64BitSeconds));
            if (auto timestamp = from_64(seconds, nanoseconds))
            {
                return *timestamp;
            }
            return invalid_timestamp("nanoseconds out of range: " + std::to_string(nanoseconds));
        }
        case 12:
        {
            const auto nanoseconds = static_cast<std::uint32_t>(wire::load_be(payload.first(4)));
            const auto seconds = static_cast<std::int64_t>(wire::load_be(payload.subspan(4)));
            if (auto timestamp = from_96(seconds, nanoseconds))
            {
                return *timestamp;
            }
            return invalid_timestamp("nanoseconds out of range: " + std::to_string(nanoseconds));
        }
        default:
            return invalid_timestamp("timestamp payload of " + std::to_string(payload.size()) + " bytes");
        }
    }

    Result<Marker> write_timestamp(ByteSink &sink, Timestamp timestamp)
    {
        std::array<std::uint8_t, 12> payload{};
        std::span<std::uint8_t> used;
        switch (timestamp.bit_size())
        {
        case 32:
            used = std::span<std::uint8_t>(payload).first(4);
            wire::store_be(static_cast<std::uint64_t>(timestamp.seconds()), used);
            break;
        case 64:
            used = std::span<std::uint8_t>(payload).first(8);
            wire::store_be((static_cast<std::uint64_t>(timestamp.nanoseconds()) << 34) |
                               static_cast<std::uint64_t>(timestamp.seconds()),
                           used);
            break;
        default:
            used = std::span<std::uint8_t>(payload);
            wire::store_be(timestamp.nanoseconds(), used.first(4));
            wire::store_be(static_cast<std::uint64_t>(timestamp.seconds()), used.subspan(4));
            break;
        }
        return write_ext(sink, kTimestampExtType, used);
    }

    Result<Timestamp> read_timestamp(ByteSource &source)
    {
        auto meta = read_ext_meta(source);
        if (!meta)
        {
            return std::move(meta).error();
        }
        if (meta->type != kTimestampExtType)
        {
            return Error::make(ErrorCode::TypeMismatch,
                               "ext type " + std::to_string(meta->type) + " is not a timestamp");
        }
        if (meta->size != 4 && meta->size != 8 && meta->size != 12)
        {
            return invalid_timestamp("timestamp payload of " + std::to_string(meta->size) + " bytes");
        }
        std::array<std::uint8_t, 12> payload{};
        const auto used = std::span<std::uint8_t>(payload).first(meta->size);
        if (auto outcome = source.read_exact(used); !outcome)
        {
            return std::move(outcome).error();
        }
        return Timestamp::from_ext_payload(used);
    }

} // namespace minipack
