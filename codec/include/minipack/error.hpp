/**
 * MiniPack - Typed error value and the Result type returned by every codec call.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

#include "minipack/error_codes.hpp"
#include "minipack/marker.hpp"

namespace minipack
{

    struct Error
    {
        ErrorCode code{ErrorCode::Ok};
        std::string message;
        // Marker observed by a typed reader (TypeMismatch, InvalidMarker).
        std::optional<Marker> marker;
        // Underlying fault of a source or sink (IoFault).
        std::error_code io_error;
        // Payload that failed UTF-8 validation and the offset of the first bad byte.
        std::vector<std::uint8_t> raw;
        std::size_t utf8_offset{};

        static Error type_mismatch(Marker actual);
        static Error invalid_marker(Marker actual);
        static Error insufficient_data();
        static Error invalid_utf8(std::vector<std::uint8_t> bytes, std::size_t offset);
        static Error io_fault(std::error_code error);
        static Error make(ErrorCode code, std::string message);

        std::string describe() const;
    };

    class BadResultAccess : public std::runtime_error
    {
    public:
        explicit BadResultAccess(Error error);

        const Error &error() const noexcept
        {
            return error_;
        }

    private:
        Error error_;
    };

    template <typename T>
    class [[nodiscard]] Result
    {
    public:
        Result(T value) : storage_(std::in_place_index<0>, std::move(value)) {}
        Result(Error error) : storage_(std::in_place_index<1>, std::move(error)) {}

        bool has_value() const noexcept
        {
            return storage_.index() == 0;
        }

        explicit operator bool() const noexcept
        {
            return has_value();
        }

        T &value() &
        {
            ensure_value();
            return *std::get_if<0>(&storage_);
        }

        const T &value() const &
        {
            ensure_value();
            return *std::get_if<0>(&storage_);
        }

        T &&value() &&
        {
            ensure_value();
            return std::move(*std::get_if<0>(&storage_));
        }

        T &operator*() & noexcept
        {
            return *std::get_if<0>(&storage_);
        }

        const T &operator*() const & noexcept
        {
            return *std::get_if<0>(&storage_);
        }

        T &&operator*() && noexcept
        {
            return std::move(*std::get_if<0>(&storage_));
        }

        T *operator->() noexcept
        {
            return std::get_if<0>(&storage_);
        }

        const T *operator->() const noexcept
        {
            return std::get_if<0>(&storage_);
        }

        // Only meaningful when has_value() is false.
        const Error &error() const & noexcept
        {
            return *std::get_if<1>(&storage_);
        }

        Error &&error() && noexcept
        {
            return std::move(*std::get_if<1>(&storage_));
        }

        ErrorCode code() const noexcept
        {
            return has_value() ? ErrorCode::Ok : error().code;
        }

    private:
        void ensure_value() const
        {
            if (!has_value())
            {
                throw BadResultAccess(error());
            }
        }

        std::variant<T, Error> storage_;
    };

    template <>
    class [[nodiscard]] Result<void>
    {
    public:
        Result() = default;
        Result(Error error) : error_(std::move(error)) {}

        bool has_value() const noexcept
        {
            return !error_.has_value();
        }

        explicit operator bool() const noexcept
        {
            return has_value();
        }

        void value() const
        {
            if (error_)
            {
                throw BadResultAccess(*error_);
            }
        }

        const Error &error() const & noexcept
        {
            return *error_;
        }

        Error &&error() && noexcept
        {
            return std::move(*error_);
        }

        ErrorCode code() const noexcept
        {
            return error_ ? error_->code : ErrorCode::Ok;
        }

    private:
        std::optional<Error> error_;
    };

} // namespace minipack
