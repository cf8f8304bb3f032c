#include "chunkstitch/server/upload_id.hpp"

#include <algorithm>

#include "chunkstitch/crypto.hpp"
#include "chunkstitch/server/errors.hpp"

namespace chunkstitch::server
{

    namespace
    {
        constexpr std::size_t kIssuedIdBytes = 16;

        bool is_safe_character(char ch) noexcept
        {
            return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '_' ||
                   ch == '-';
        }
    } // namespace

    bool is_valid_upload_id(std::string_view upload_id) noexcept
    {
        return !upload_id.empty() && upload_id.size() <= kMaxUploadIdLength &&
               std::all_of(upload_id.begin(), upload_id.end(), is_safe_character);
    }

    void validate_upload_id(std::string_view upload_id)
    {
        if (upload_id.empty())
        {
            throw AssemblyError(chunkstitch::ErrorCode::InvalidRequest, "Upload id is required");
        }
        if (upload_id.size() > kMaxUploadIdLength)
        {
            throw AssemblyError(chunkstitch::ErrorCode::InvalidRequest, "Upload id is too long");
        }
        if (!is_valid_upload_id(upload_id))
        {
            throw AssemblyError(chunkstitch::ErrorCode::InvalidRequest,
                                "Upload id only supports alphanumeric characters, underscores and hyphens");
        }
    }

    std::string issue_upload_id()
    {
        return chunkstitch::crypto::random_hex_token(kIssuedIdBytes);
    }

} // namespace chunkstitch::server
