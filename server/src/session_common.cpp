#include "session_common.hpp"

namespace chunkstitch::server::session_common
{

    chunkstitch::protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                             const std::optional<std::string> &request_id)
    {
        chunkstitch::protocol::ResponseEnvelope envelope;
        envelope.kind = chunkstitch::protocol::ResponseKind::Ok;
        envelope.payload = std::move(payload);
        envelope.error = chunkstitch::ErrorCode::Ok;
        envelope.request_id = request_id;
        return envelope;
    }

    chunkstitch::protocol::ProgressResponse to_progress_response(const UploadProgress &progress)
    {
        chunkstitch::protocol::ProgressResponse response{
            .have = progress.received,
            .want = progress.expected,
            .complete = progress.complete,
        };
        if (progress.rejection)
        {
            response.error = progress.rejection->reason;
            response.status = progress.rejection->status;
        }
        return response;
    }

} // namespace chunkstitch::server::session_common
