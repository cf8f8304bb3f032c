#pragma once

#include <asio/thread_pool.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "chunkstitch/protocol.hpp"
#include "chunkstitch/server/chunk_store.hpp"
#include "chunkstitch/server/combiner.hpp"
#include "chunkstitch/server/config.hpp"
#include "chunkstitch/server/handoff.hpp"
#include "chunkstitch/server/upload_registry.hpp"

namespace chunkstitch::server
{

    struct ChunkSubmission
    {
        std::string upload_id;
        std::uint64_t sequence{};
        std::uint64_t chunk_total{};
        std::vector<std::byte> payload;
        std::optional<std::string> content_type{};
    };

    struct UploadProgress
    {
        std::string upload_id;
        std::uint64_t received{};
        std::uint64_t expected{};
        bool complete{};
        std::optional<Rejection> rejection{};
    };

    struct UploadStartResult
    {
        std::string upload_id;
        std::uint64_t expected{};
        bool created{};
    };

    /**
     * Reassembles uploads from independently submitted chunks.
     *
     * Submissions for different uploads run in parallel; submissions for the
     * same upload are serialized on that upload's mutex. The submission that
     * receives the last missing chunk combines the artifact and hands it to the
     * consumer while still holding the mutex, then posts removal of the staged
     * chunks to a background pool. The upload id stays registered until that
     * removal finished, so a reused id never loses chunks to an older cleanup.
     *
     * Errors are thrown as AssemblyError (InvalidRequest, QuantityMismatch,
     * StorageError, InternalError).
     */
    class ChunkAssembler
    {
    public:
        ChunkAssembler(AssemblerConfig config, ArtifactConsumer consumer);
        ~ChunkAssembler();

        ChunkAssembler(const ChunkAssembler &) = delete;
        ChunkAssembler &operator=(const ChunkAssembler &) = delete;

        // Registers an upload ahead of its chunks. Without an id, one is issued.
        UploadStartResult start_upload(const std::optional<std::string> &upload_id, std::uint64_t chunk_total,
                                       UploadMetadata metadata = {});

        UploadProgress submit_chunk(const ChunkSubmission &chunk);

        // Drops in-progress uploads idle for longer than `max_age` together with
        // their staged chunks. Returns how many were dropped.
        std::size_t expire_stale(std::chrono::seconds max_age);

        void wait_for_cleanup();

        std::size_t active_uploads() const { return registry_.size(); }

        const AssemblerConfig &config() const noexcept { return config_; }

    private:
        // Waits while the entry is finalizing. Returns false once it is retired.
        static bool wait_until_accepting(UploadEntry &entry, std::unique_lock<std::mutex> &lock);

        void finalize(const std::shared_ptr<UploadEntry> &entry, std::unique_lock<std::mutex> &lock,
                      const std::optional<std::string> &content_type, UploadProgress &progress);

        void schedule_cleanup(std::shared_ptr<UploadEntry> entry, std::set<std::uint64_t> sequences,
                              bool discard_chunks);

        AssemblerConfig config_;
        ChunkStore store_;
        UploadRegistry registry_;
        Combiner combiner_;
        HandoffSequencer handoff_;

        std::mutex cleanup_mutex_;
        std::condition_variable cleanup_idle_;
        std::size_t pending_cleanups_{0};

        // Declared last so its threads are joined before anything they use goes away.
        asio::thread_pool cleanup_pool_;
    };

} // namespace chunkstitch::server
