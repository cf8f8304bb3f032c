#include "chunkstitch/server/artifact_consumer.hpp"

#include <spdlog/spdlog.h>

#include <nlohmann/json.hpp>

namespace chunkstitch::server
{

    ArtifactConsumer make_logging_consumer(std::optional<std::uint64_t> max_artifact_size)
    {
        return [max_artifact_size](HandoffContext &context)
        {
            spdlog::info("Upload {} ready: {} bytes of {} at {} metadata={}", context.upload_id(),
                         context.content_length(), context.content_type(), context.artifact_path().string(),
                         nlohmann::json(context.metadata()).dump());
            if (max_artifact_size && context.content_length() > *max_artifact_size)
            {
                context.reject(kPayloadTooLargeStatus, "artifact exceeds size limit");
            }
        };
    }

} // namespace chunkstitch::server
