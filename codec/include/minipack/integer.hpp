/**
 * MiniPack - Lossless integer value covering the whole u64 and i64 ranges.
 */
#pragma once

#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace minipack
{

    /// Non-negative values are held as u64 and negative values as i64, so equal
    /// magnitudes compare equal regardless of the wire width they came from.
    class Integer
    {
    public:
        constexpr Integer() noexcept = default;

        template <std::integral T>
        constexpr Integer(T value) noexcept
        {
            if constexpr (std::is_signed_v<T>)
            {
                negative_ = value < 0;
                bits_ = static_cast<std::uint64_t>(static_cast<std::int64_t>(value));
            }
            else
            {
                bits_ = static_cast<std::uint64_t>(value);
            }
        }

        constexpr bool is_negative() const noexcept
        {
            return negative_;
        }

        /// Converts to T when the value fits, nullopt otherwise.
        template <std::integral T>
        constexpr std::optional<T> as() const noexcept
        {
            if (negative_)
            {
                const auto value = static_cast<std::int64_t>(bits_);
                if (std::in_range<T>(value))
                {
                    return static_cast<T>(value);
                }
                return std::nullopt;
            }
            if (std::in_range<T>(bits_))
            {
                return static_cast<T>(bits_);
            }
            return std::nullopt;
        }

        constexpr std::optional<std::uint64_t> as_u64() const noexcept
        {
            return as<std::uint64_t>();
        }

        constexpr std::optional<std::int64_t> as_i64() const noexcept
        {
            return as<std::int64_t>();
        }

        constexpr double as_f64() const noexcept
        {
            return negative_ ? static_cast<double>(static_cast<std::int64_t>(bits_)) : static_cast<double>(bits_);
        }

        std::string to_string() const
        {
            return negative_ ? std::to_string(static_cast<std::int64_t>(bits_)) : std::to_string(bits_);
        }

        friend constexpr bool operator==(const Integer &lhs, const Integer &rhs) noexcept = default;

    private:
        std::uint64_t bits_{0};
        bool negative_{false};
    };

} // namespace minipack
