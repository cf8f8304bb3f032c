#pragma once

#include <cstdint>
#include <optional>

#include "chunkstitch/server/handoff.hpp"

namespace chunkstitch::server
{

    inline constexpr int kPayloadTooLargeStatus = 413;

    // Consumer used by the standalone server: logs each artifact with its
    // metadata and vetoes artifacts larger than `max_artifact_size`.
    ArtifactConsumer make_logging_consumer(std::optional<std::uint64_t> max_artifact_size);

} // namespace chunkstitch::server
