/**
 * MiniPack - Resource limits shared by the scanner and the value decoders.
 */
#pragma once

#include <cstddef>
#include <cstdint>

namespace minipack
{

    struct Limits
    {
        // Open containers allowed at once.
        std::size_t max_depth{1024};
        // Largest declared string/binary/ext length or container element count.
        std::uint64_t max_len{0xffff'ffff};
        // Largest total message size in bytes.
        std::uint64_t max_size{0x7fff'ffff};

        friend bool operator==(const Limits &lhs, const Limits &rhs) noexcept = default;
    };

} // namespace minipack
