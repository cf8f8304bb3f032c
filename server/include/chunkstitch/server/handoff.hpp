#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <istream>
#include <optional>
#include <string>

#include "chunkstitch/protocol.hpp"
#include "chunkstitch/server/combiner.hpp"
#include "chunkstitch/server/upload_registry.hpp"

namespace chunkstitch::server
{

    inline constexpr auto kDefaultContentType = "application/octet-stream";

    struct Rejection
    {
        int status{};
        std::string reason;
    };

    /**
     * What the downstream consumer sees of a completed upload.
     *
     * The consumer can read the artifact and veto it; it has no way to answer
     * the submitting client itself.
     */
    class HandoffContext
    {
    public:
        HandoffContext(const AssembledArtifact &artifact, const UploadMetadata &metadata, std::string content_type);

        HandoffContext(const HandoffContext &) = delete;
        HandoffContext &operator=(const HandoffContext &) = delete;

        const std::string &upload_id() const noexcept { return artifact_.upload_id; }
        const UploadMetadata &metadata() const noexcept { return metadata_; }
        const std::string &content_type() const noexcept { return content_type_; }
        std::uint64_t content_length() const noexcept { return artifact_.size; }
        const std::filesystem::path &artifact_path() const noexcept { return artifact_.path; }

        // Opened on first use, positioned at the start of the artifact.
        std::istream &stream();

        void reject(int status, std::string reason);

        const std::optional<Rejection> &rejection() const noexcept { return rejection_; }

    private:
        const AssembledArtifact &artifact_;
        const UploadMetadata &metadata_;
        std::string content_type_;
        std::ifstream stream_;
        std::optional<Rejection> rejection_;
    };

    using ArtifactConsumer = std::function<void(HandoffContext &)>;

    class HandoffSequencer
    {
    public:
        explicit HandoffSequencer(ArtifactConsumer consumer);

        /**
         * Invokes the consumer for `entry`, whose mutex the caller holds.
         *
         * The entry is marked handed off before the call, so a consumer that
         * throws is still never invoked twice. Throws std::logic_error when the
         * entry was already handed off.
         */
        std::optional<Rejection> deliver(UploadEntry &entry, const AssembledArtifact &artifact,
                                         const std::optional<std::string> &chunk_content_type);

    private:
        ArtifactConsumer consumer_;
    };

} // namespace chunkstitch::server
