#include "chunkstitch/server/session.hpp"

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include "chunkstitch/encoding/base64.hpp"
#include "chunkstitch/server/errors.hpp"
#include "session_common.hpp"

namespace chunkstitch::server
{

    void Session::handle_upload_start(const chunkstitch::protocol::RequestEnvelope &envelope)
    {
        chunkstitch::protocol::UploadStartRequest request;
        try
        {
            request = envelope.payload.get<chunkstitch::protocol::UploadStartRequest>();
        }
        catch (const std::exception &ex)
        {
            send_error(chunkstitch::ErrorCode::InvalidRequest, ex.what(), envelope.request_id);
            return;
        }

        try
        {
            const auto expired = services_.assembler.expire_stale(services_.upload_timeout);
            if (expired > 0)
            {
                spdlog::debug("Expired {} idle uploads", expired);
            }
            const auto result =
                services_.assembler.start_upload(request.upload_id, request.total, std::move(request.metadata));
            const chunkstitch::protocol::UploadStartResponse response{
                .upload_id = result.upload_id,
                .total = result.expected,
            };
            send_response(session_common::make_ok_response(response, envelope.request_id));
        }
        catch (const AssemblyError &ex)
        {
            send_error(ex.code(), ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            send_error(chunkstitch::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void Session::handle_upload_chunk(const chunkstitch::protocol::RequestEnvelope &envelope)
    {
        ChunkSubmission submission;
        try
        {
            auto request = envelope.payload.get<chunkstitch::protocol::UploadChunkRequest>();
            auto data = chunkstitch::encoding::decode_base64(request.data_base64);
            if (!data)
            {
                send_error(chunkstitch::ErrorCode::InvalidRequest, "Chunk data is not valid base64",
                           envelope.request_id);
                return;
            }
            submission.upload_id = std::move(request.upload_id);
            submission.sequence = request.sequence;
            submission.chunk_total = request.total;
            submission.payload = std::move(*data);
            submission.content_type = std::move(request.content_type);
        }
        catch (const std::exception &ex)
        {
            send_error(chunkstitch::ErrorCode::InvalidRequest, ex.what(), envelope.request_id);
            return;
        }

        try
        {
            const auto progress = services_.assembler.submit_chunk(submission);
            const auto response = session_common::to_progress_response(progress);
            send_response(session_common::make_ok_response(response, envelope.request_id));
        }
        catch (const AssemblyError &ex)
        {
            if (ex.code() == chunkstitch::ErrorCode::StorageError || ex.code() == chunkstitch::ErrorCode::InternalError)
            {
                spdlog::error("Chunk {} of upload {} failed: {}", submission.sequence, submission.upload_id,
                              ex.what());
            }
            send_error(ex.code(), ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Chunk {} of upload {} failed: {}", submission.sequence, submission.upload_id, ex.what());
            send_error(chunkstitch::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void Session::handle_ping(const chunkstitch::protocol::RequestEnvelope &envelope)
    {
        nlohmann::json payload;
        payload["active_uploads"] = services_.assembler.active_uploads();
        send_response(session_common::make_ok_response(payload, envelope.request_id));
    }

} // namespace chunkstitch::server
