#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chunkstitch::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

    // Returns std::nullopt when the input holds characters outside the base64
    // alphabet (whitespace is skipped) or data after the padding.
    std::optional<std::vector<std::byte>> decode_base64(std::string_view input);

} // namespace chunkstitch::encoding
