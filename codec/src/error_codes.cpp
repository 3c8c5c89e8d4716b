#include "minipack/error_codes.hpp"

#include <array>

namespace minipack
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 12> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::TypeMismatch, "type_mismatch"},
            {ErrorCode::InsufficientData, "insufficient_data"},
            {ErrorCode::InvalidMarker, "invalid_marker"},
            {ErrorCode::InvalidUtf8, "invalid_utf8"},
            {ErrorCode::IoFault, "io_fault"},
            {ErrorCode::OutOfRange, "out_of_range"},
            {ErrorCode::LimitExceeded, "limit_exceeded"},
            {ErrorCode::BufferTooSmall, "buffer_too_small"},
            {ErrorCode::FragmentedInput, "fragmented_input"},
            {ErrorCode::LengthOverflow, "length_overflow"},
            {ErrorCode::InvalidTimestamp, "invalid_timestamp"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

} // namespace minipack
