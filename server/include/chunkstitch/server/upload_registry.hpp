#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "chunkstitch/protocol.hpp"

namespace chunkstitch::server
{

    enum class UploadPhase : std::uint8_t
    {
        // Accepting chunks.
        InProgress,
        // Combined and handed off (or expired); staged chunks are being removed.
        Finalizing,
        // No longer in the registry. Holders must resolve the id again.
        Retired
    };

    /**
     * State of one upload while it is known to the registry.
     *
     * `mutex` serializes every chunk write, the completion check and the
     * combine/handoff sequence for this upload. `phase` is only written with
     * `mutex` held but may be read without it.
     */
    struct UploadEntry
    {
        UploadEntry(std::string id, std::uint64_t expected);

        const std::string upload_id;
        const std::uint64_t expected_chunks;

        std::mutex mutex;
        std::condition_variable phase_changed;
        std::atomic<UploadPhase> phase{UploadPhase::InProgress};

        // Guarded by mutex.
        std::set<std::uint64_t> received;
        std::optional<UploadMetadata> metadata;
        bool handed_off{false};
        std::chrono::steady_clock::time_point last_update;
    };

    class UploadRegistry
    {
    public:
        struct Resolution
        {
            std::shared_ptr<UploadEntry> entry;
            bool created{};
        };

        // Returns the entry for `upload_id`, creating it with `expected_chunks` if
        // absent. Throws AssemblyError(QuantityMismatch) when an in-progress entry
        // declares a different count.
        Resolution resolve_or_create(const std::string &upload_id, std::uint64_t expected_chunks);

        std::shared_ptr<UploadEntry> find(const std::string &upload_id) const;

        // Erases the entry (no-op when absent) and marks it retired.
        void remove(const std::string &upload_id);

        // Like remove(), but only if `entry` is still the one mapped to its id.
        // Must not be called with entry->mutex held.
        void retire(const std::shared_ptr<UploadEntry> &entry);

        std::vector<std::shared_ptr<UploadEntry>> snapshot() const;

        std::size_t size() const;

    private:
        static void mark_retired(UploadEntry &entry);

        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<UploadEntry>> uploads_;
    };

} // namespace chunkstitch::server
