#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace minipack::wire
{

    inline void store_be(std::uint64_t value, std::span<std::uint8_t> out) noexcept
    {
        const auto width = out.size();
        for (std::size_t i = 0; i < width; ++i)
        {
            out[i] = static_cast<std::uint8_t>((value >> (8 * (width - 1 - i))) & 0xFF);
        }
    }

    inline std::uint64_t load_be(std::span<const std::uint8_t> bytes) noexcept
    {
        std::uint64_t value = 0;
        for (const auto byte : bytes)
        {
            value = (value << 8) | byte;
        }
        return value;
    }

    /// Offset of the first byte that breaks UTF-8 well-formedness, or nullopt when the input is valid.
    std::optional<std::size_t> find_invalid_utf8(std::span<const std::uint8_t> bytes) noexcept;

} // namespace minipack::wire
