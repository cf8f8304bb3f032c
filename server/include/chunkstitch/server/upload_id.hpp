#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace chunkstitch::server
{

    inline constexpr std::size_t kMaxUploadIdLength = 128;

    // Upload ids become part of staged file names, so only [A-Za-z0-9_-] is accepted.
    bool is_valid_upload_id(std::string_view upload_id) noexcept;

    // Throws AssemblyError(InvalidRequest) describing what is wrong with the id.
    void validate_upload_id(std::string_view upload_id);

    std::string issue_upload_id();

} // namespace chunkstitch::server
