/**
 * MiniPack - Library version.
 */
#pragma once

#include <string_view>

#define MINIPACK_VERSION_MAJOR 0
#define MINIPACK_VERSION_MINOR 3
#define MINIPACK_VERSION_PATCH 0

namespace minipack
{

    constexpr std::string_view version() noexcept
    {
        return "0.3.0";
    }

} // namespace minipack
