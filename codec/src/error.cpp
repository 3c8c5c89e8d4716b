#include "minipack/error.hpp"

namespace minipack
{

    Error Error::type_mismatch(Marker actual)
    {
        Error error = make(ErrorCode::TypeMismatch, "unexpected marker " + to_string(actual));
        error.marker = actual;
        return error;
    }

    Error Error::invalid_marker(Marker actual)
    {
        Error error = make(ErrorCode::InvalidMarker, "marker " + to_string(actual) + " is not a valid value");
        error.marker = actual;
        return error;
    }

    Error Error::insufficient_data()
    {
        return make(ErrorCode::InsufficientData, "input ended before the value was complete");
    }

    Error Error::invalid_utf8(std::vector<std::uint8_t> bytes, std::size_t offset)
    {
        Error error = make(ErrorCode::InvalidUtf8, "string payload is not valid UTF-8 at offset " + std::to_string(offset));
        error.raw = std::move(bytes);
        error.utf8_offset = offset;
        return error;
    }

    Error Error::io_fault(std::error_code error)
    {
        Error result = make(ErrorCode::IoFault, error.message());
        result.io_error = error;
        return result;
    }

    Error Error::make(ErrorCode code, std::string message)
    {
        Error error;
        error.code = code;
        error.message = std::move(message);
        return error;
    }

    std::string Error::describe() const
    {
        std::string text(to_string(code));
        if (!message.empty())
        {
            text += ": ";
            text += message;
        }
        return text;
    }

    BadResultAccess::BadResultAccess(Error error)
        : std::runtime_error(error.describe()), error_(std::move(error))
    {
    }

} // namespace minipack
