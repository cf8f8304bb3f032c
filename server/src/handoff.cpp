#include "chunkstitch/server/handoff.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

#include "chunkstitch/server/errors.hpp"

namespace chunkstitch::server
{

    namespace
    {
        constexpr auto kContentTypeKey = "content_type";

        std::string resolve_content_type(const UploadMetadata &metadata,
                                         const std::optional<std::string> &chunk_content_type)
        {
            if (auto it = metadata.find(kContentTypeKey); it != metadata.end() && !it->second.empty())
            {
                return it->second;
            }
            if (chunk_content_type && !chunk_content_type->empty())
            {
                return *chunk_content_type;
            }
            return kDefaultContentType;
        }
    } // namespace

    HandoffContext::HandoffContext(const AssembledArtifact &artifact, const UploadMetadata &metadata,
                                   std::string content_type)
        : artifact_(artifact), metadata_(metadata), content_type_(std::move(content_type)) {}

    std::istream &HandoffContext::stream()
    {
        if (!stream_.is_open())
        {
            stream_.open(artifact_.path, std::ios::binary);
            if (!stream_.is_open())
            {
                throw StorageError("Cannot open artifact " + artifact_.path.string());
            }
        }
        return stream_;
    }

    void HandoffContext::reject(int status, std::string reason)
    {
        rejection_ = Rejection{.status = status, .reason = std::move(reason)};
    }

    HandoffSequencer::HandoffSequencer(ArtifactConsumer consumer) : consumer_(std::move(consumer))
    {
        if (!consumer_)
        {
            throw std::invalid_argument("Artifact consumer must be callable");
        }
    }

    std::optional<Rejection> HandoffSequencer::deliver(UploadEntry &entry, const AssembledArtifact &artifact,
                                                       const std::optional<std::string> &chunk_content_type)
    {
        if (entry.handed_off)
        {
            throw std::logic_error("Upload " + entry.upload_id + " was already handed off");
        }
        entry.handed_off = true;

        static const UploadMetadata kNoMetadata{};
        const auto &metadata = entry.metadata ? *entry.metadata : kNoMetadata;
        HandoffContext context(artifact, metadata, resolve_content_type(metadata, chunk_content_type));
        consumer_(context);

        if (context.rejection())
        {
            spdlog::warn("Upload {} rejected by consumer: {} {}", entry.upload_id, context.rejection()->status,
                         context.rejection()->reason);
        }
        return context.rejection();
    }

} // namespace chunkstitch::server
