#include "chunkstitch/server/upload_registry.hpp"

#include <spdlog/spdlog.h>

#include "chunkstitch/server/errors.hpp"

namespace chunkstitch::server
{

    UploadEntry::UploadEntry(std::string id, std::uint64_t expected)
        : upload_id(std::move(id)), expected_chunks(expected), last_update(std::chrono::steady_clock::now()) {}

    UploadRegistry::Resolution UploadRegistry::resolve_or_create(const std::string &upload_id,
                                                                 std::uint64_t expected_chunks)
    {
        std::lock_guard lock(mutex_);
        if (auto it = uploads_.find(upload_id); it != uploads_.end())
        {
            const auto &existing = it->second;
            if (existing->phase.load() == UploadPhase::InProgress && existing->expected_chunks != expected_chunks)
            {
                throw AssemblyError(chunkstitch::ErrorCode::QuantityMismatch,
                                    "Cannot change expected number of chunks from " +
                                        std::to_string(existing->expected_chunks) + " to " +
                                        std::to_string(expected_chunks));
            }
            return {.entry = existing, .created = false};
        }

        auto entry = std::make_shared<UploadEntry>(upload_id, expected_chunks);
        uploads_.emplace(upload_id, entry);
        spdlog::debug("Tracking upload {} expecting {} chunks", upload_id, expected_chunks);
        return {.entry = std::move(entry), .created = true};
    }

    std::shared_ptr<UploadEntry> UploadRegistry::find(const std::string &upload_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = uploads_.find(upload_id);
        if (it != uploads_.end())
        {
            return it->second;
        }
        return nullptr;
    }

    void UploadRegistry::remove(const std::string &upload_id)
    {
        std::shared_ptr<UploadEntry> removed;
        {
            std::lock_guard lock(mutex_);
            auto it = uploads_.find(upload_id);
            if (it == uploads_.end())
            {
                return;
            }
            removed = std::move(it->second);
            uploads_.erase(it);
        }
        mark_retired(*removed);
    }

    void UploadRegistry::retire(const std::shared_ptr<UploadEntry> &entry)
    {
        {
            std::lock_guard lock(mutex_);
            auto it = uploads_.find(entry->upload_id);
            if (it != uploads_.end() && it->second == entry)
            {
                uploads_.erase(it);
            }
        }
        mark_retired(*entry);
    }

    std::vector<std::shared_ptr<UploadEntry>> UploadRegistry::snapshot() const
    {
        std::lock_guard lock(mutex_);
        std::vector<std::shared_ptr<UploadEntry>> entries;
        entries.reserve(uploads_.size());
        for (const auto &[id, entry] : uploads_)
        {
            entries.push_back(entry);
        }
        return entries;
    }

    std::size_t UploadRegistry::size() const
    {
        std::lock_guard lock(mutex_);
        return uploads_.size();
    }

    void UploadRegistry::mark_retired(UploadEntry &entry)
    {
        {
            std::lock_guard lock(entry.mutex);
            entry.phase = UploadPhase::Retired;
        }
        entry.phase_changed.notify_all();
        spdlog::debug("Upload {} retired", entry.upload_id);
    }

} // namespace chunkstitch::server
