#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace minipack::encoding
{

    /// Standard alphabet with `=` padding.
    std::string encode_base64(std::span<const std::uint8_t> data);

} // namespace minipack::encoding
