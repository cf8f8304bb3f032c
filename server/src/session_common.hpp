#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "chunkstitch/protocol.hpp"
#include "chunkstitch/server/assembler.hpp"

namespace chunkstitch::server::session_common
{

    chunkstitch::protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                             const std::optional<std::string> &request_id);

    chunkstitch::protocol::ProgressResponse to_progress_response(const UploadProgress &progress);

} // namespace chunkstitch::server::session_common
