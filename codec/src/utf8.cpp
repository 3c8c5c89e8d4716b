#include "wire.hpp"

namespace minipack::wire
{

    std::optional<std::size_t> find_invalid_utf8(std::span<const std::uint8_t> bytes) noexcept
    {
        std::size_t i = 0;
        while (i < bytes.size())
        {
            const auto lead = bytes[i];
            if (lead < 0x80)
            {
                ++i;
                continue;
            }

            std::size_t length = 0;
            std::uint8_t low = 0x80;
            std::uint8_t high = 0xBF;
            if (lead >= 0xC2 && lead <= 0xDF)
            {
                length = 2;
            }
            else if (lead >= 0xE0 && lead <= 0xEF)
            {
                length = 3;
                if (lead == 0xE0)
                {
                    low = 0xA0; // overlong
                }
                else if (lead == 0xED)
                {
                    high = 0x9F; // surrogates
                }
            }
            else if (lead >= 0xF0 && lead <= 0xF4)
            {
                length = 4;
                if (lead == 0xF0)
                {
                    low = 0x90;
                }
                else if (lead == 0xF4)
                {
                    high = 0x8F; // above U+10FFFF
                }
            }
            else
            {
                return i;
            }

            if (i + length > bytes.size())
            {
                return i;
            }
            const auto second = bytes[i + 1];
            if (second < low || second > high)
            {
                return i;
            }
            for (std::size_t k = 2; k < length; ++k)
            {
                if ((bytes[i + k] & 0xC0) != 0x80)
                {
                    return i;
                }
            }
            i += length;
        }
        return std::nullopt;
    }

} // namespace minipack::wire
