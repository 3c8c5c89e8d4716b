/**
 * MiniPack - Error codes shared by every encode and decode path.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace minipack
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        TypeMismatch = 1,
        InsufficientData = 2,
        InvalidMarker = 3,
        InvalidUtf8 = 4,
        IoFault = 5,
        OutOfRange = 6,
        LimitExceeded = 7,
        BufferTooSmall = 8,
        FragmentedInput = 9,
        LengthOverflow = 10,
        InvalidTimestamp = 11
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

} // namespace minipack
