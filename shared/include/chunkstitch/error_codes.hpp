/**
 * ChunkStitch - Error codes shared by the engine, the server and the client.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace chunkstitch
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidRequest = 2,
        QuantityMismatch = 3,
        StorageError = 4,
        Busy = 5,
        Unsupported = 6,
        InternalError = 7
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

} // namespace chunkstitch
