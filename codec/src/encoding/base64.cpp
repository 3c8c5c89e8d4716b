#include "minipack/encoding/base64.hpp"

#include <string_view>

namespace minipack::encoding
{

    namespace
    {

        constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        constexpr char kPad = '=';

    } // namespace

    std::string encode_base64(std::span<const std::uint8_t> data)
    {
        std::string output;
        output.reserve(((data.size() + 2) / 3) * 4);

        std::size_t i = 0;
        for (; i + 3 <= data.size(); i += 3)
        {
            const std::uint32_t group = (static_cast<std::uint32_t>(data[i]) << 16) |
                                        (static_cast<std::uint32_t>(data[i + 1]) << 8) |
                                        static_cast<std::uint32_t>(data[i + 2]);
            output.push_back(kAlphabet[(group >> 18) & 0x3F]);
            output.push_back(kAlphabet[(group >> 12) & 0x3F]);
            output.push_back(kAlphabet[(group >> 6) & 0x3F]);
            output.push_back(kAlphabet[group & 0x3F]);
        }

        const auto rest = data.size() - i;
        if (rest == 1)
        {
            const std::uint32_t group = static_cast<std::uint32_t>(data[i]) << 16;
            output.push_back(kAlphabet[(group >> 18) & 0x3F]);
            output.push_back(kAlphabet[(group >> 12) & 0x3F]);
            output.push_back(kPad);
            output.push_back(kPad);
        }
        else if (rest == 2)
        {
            const std::uint32_t group = (static_cast<std::uint32_t>(data[i]) << 16) |
                                        (static_cast<std::uint32_t>(data[i + 1]) << 8);
            output.push_back(kAlphabet[(group >> 18) & 0x3F]);
            output.push_back(kAlphabet[(group >> 12) & 0x3F]);
            output.push_back(kAlphabet[(group >> 6) & 0x3F]);
            output.push_back(kPad);
        }

        return output;
    }

} // namespace minipack::encoding
