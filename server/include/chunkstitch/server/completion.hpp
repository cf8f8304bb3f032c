#pragma once

#include <cstddef>
#include <cstdint>

namespace chunkstitch::server
{

    // Only meaningful right after a chunk write, with the upload's mutex held.
    constexpr bool is_complete(std::size_t received_chunks, std::uint64_t expected_chunks) noexcept
    {
        return received_chunks == expected_chunks;
    }

} // namespace chunkstitch::server
