#include "chunkstitch/server/assembler.hpp"

#include <asio/post.hpp>

#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "chunkstitch/server/completion.hpp"
#include "chunkstitch/server/errors.hpp"
#include "chunkstitch/server/upload_id.hpp"

namespace chunkstitch::server
{

    namespace
    {

        void validate_chunk_total(std::uint64_t chunk_total)
        {
            if (chunk_total == 0)
            {
                throw AssemblyError(chunkstitch::ErrorCode::InvalidRequest, "Expected chunks must be positive");
            }
        }

        void validate_submission(const ChunkSubmission &chunk)
        {
            validate_upload_id(chunk.upload_id);
            validate_chunk_total(chunk.chunk_total);
            if (chunk.sequence >= chunk.chunk_total)
            {
                throw AssemblyError(chunkstitch::ErrorCode::InvalidRequest,
                                    "Sequence number must be between 0 and " + std::to_string(chunk.chunk_total - 1));
            }
            if (chunk.payload.empty())
            {
                throw AssemblyError(chunkstitch::ErrorCode::InvalidRequest, "Chunk cannot be empty");
            }
        }

        void check_quantity(const UploadEntry &entry, std::uint64_t chunk_total)
        {
            if (entry.expected_chunks != chunk_total)
            {
                throw AssemblyError(chunkstitch::ErrorCode::QuantityMismatch,
                                    "Cannot change expected number of chunks from " +
                                        std::to_string(entry.expected_chunks) + " to " + std::to_string(chunk_total));
            }
        }

    } // namespace

    ChunkAssembler::ChunkAssembler(AssemblerConfig config, ArtifactConsumer consumer)
        : config_(std::move(config)),
          store_(config_.chunks_dir),
          combiner_(store_, config_.completed_dir),
          handoff_(std::move(consumer)),
          cleanup_pool_(std::max<std::size_t>(config_.cleanup_threads, 1))
    {
        spdlog::debug("Staging chunks in {}, completed uploads in {}", config_.chunks_dir.string(),
                      config_.completed_dir.string());
    }

    ChunkAssembler::~ChunkAssembler()
    {
        cleanup_pool_.join();
    }

    UploadStartResult ChunkAssembler::start_upload(const std::optional<std::string> &upload_id,
                                                   std::uint64_t chunk_total, UploadMetadata metadata)
    {
        const auto id = upload_id ? *upload_id : issue_upload_id();
        validate_upload_id(id);
        validate_chunk_total(chunk_total);

        while (true)
        {
            auto resolution = registry_.resolve_or_create(id, chunk_total);
            auto &entry = *resolution.entry;
            std::unique_lock lock(entry.mutex);
            if (!wait_until_accepting(entry, lock))
            {
                continue;
            }
            check_quantity(entry, chunk_total);

            if (!entry.metadata)
            {
                entry.metadata = std::move(metadata);
            }
            else if (*entry.metadata != metadata)
            {
                spdlog::warn("Upload {} already has metadata; keeping the recorded values", id);
            }
            entry.last_update = std::chrono::steady_clock::now();

            spdlog::info("Upload {} started, expecting {} chunks", id, chunk_total);
            return {.upload_id = id, .expected = entry.expected_chunks, .created = resolution.created};
        }
    }

    UploadProgress ChunkAssembler::submit_chunk(const ChunkSubmission &chunk)
    {
        validate_submission(chunk);

        while (true)
        {
            auto resolution = registry_.resolve_or_create(chunk.upload_id, chunk.chunk_total);
            const auto &entry = resolution.entry;
            std::unique_lock lock(entry->mutex);
            if (!wait_until_accepting(*entry, lock))
            {
                continue;
            }
            check_quantity(*entry, chunk.chunk_total);

            store_.write(chunk.upload_id, chunk.sequence, chunk.payload);
            entry->received.insert(chunk.sequence);
            entry->last_update = std::chrono::steady_clock::now();
            spdlog::debug("Stored chunk {} of upload {} ({}/{})", chunk.sequence, chunk.upload_id,
                          entry->received.size(), entry->expected_chunks);

            UploadProgress progress{
                .upload_id = chunk.upload_id,
                .received = entry->received.size(),
                .expected = entry->expected_chunks,
            };
            if (is_complete(entry->received.size(), entry->expected_chunks))
            {
                finalize(entry, lock, chunk.content_type, progress);
            }
            return progress;
        }
    }

    void ChunkAssembler::finalize(const std::shared_ptr<UploadEntry> &entry, std::unique_lock<std::mutex> &lock,
                                  const std::optional<std::string> &content_type, UploadProgress &progress)
    {
        // A failed combine leaves the upload in progress; resubmitting any chunk retries it.
        const auto artifact = combiner_.combine(entry->upload_id, entry->expected_chunks);
        entry->phase = UploadPhase::Finalizing;
        progress.complete = true;

        std::optional<std::string> consumer_failure;
        try
        {
            progress.rejection = handoff_.deliver(*entry, artifact, content_type);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Consumer failed for upload {}: {}", entry->upload_id, ex.what());
            consumer_failure = ex.what();
        }

        auto sequences = entry->received;
        lock.unlock();
        schedule_cleanup(entry, std::move(sequences), !config_.keep_completed_chunks);

        if (consumer_failure)
        {
            throw AssemblyError(chunkstitch::ErrorCode::InternalError,
                                "Processing of upload " + entry->upload_id + " failed: " + *consumer_failure);
        }
    }

    std::size_t ChunkAssembler::expire_stale(std::chrono::seconds max_age)
    {
        const auto cutoff = std::chrono::steady_clock::now() - max_age;
        std::size_t expired = 0;
        for (auto &entry : registry_.snapshot())
        {
            // A held entry is busy (being written or handed off), not idle.
            std::unique_lock lock(entry->mutex, std::try_to_lock);
            if (!lock.owns_lock() || entry->phase != UploadPhase::InProgress || entry->last_update > cutoff)
            {
                continue;
            }
            entry->phase = UploadPhase::Finalizing;
            auto sequences = entry->received;
            lock.unlock();

            spdlog::info("Expiring idle upload {} with {} of {} chunks", entry->upload_id, sequences.size(),
                         entry->expected_chunks);
            schedule_cleanup(entry, std::move(sequences), true);
            ++expired;
        }
        return expired;
    }

    void ChunkAssembler::wait_for_cleanup()
    {
        std::unique_lock lock(cleanup_mutex_);
        cleanup_idle_.wait(lock, [this]
                           { return pending_cleanups_ == 0; });
    }

    bool ChunkAssembler::wait_until_accepting(UploadEntry &entry, std::unique_lock<std::mutex> &lock)
    {
        entry.phase_changed.wait(lock, [&entry]
                                 { return entry.phase != UploadPhase::Finalizing; });
        return entry.phase == UploadPhase::InProgress;
    }

    void ChunkAssembler::schedule_cleanup(std::shared_ptr<UploadEntry> entry, std::set<std::uint64_t> sequences,
                                          bool discard_chunks)
    {
        if (!discard_chunks)
        {
            registry_.retire(entry);
            return;
        }

        {
            std::lock_guard lock(cleanup_mutex_);
            ++pending_cleanups_;
        }
        asio::post(cleanup_pool_, [this, entry = std::move(entry), sequences = std::move(sequences)]
                   {
            // Retired even when discarding failed; submissions for this id wait on it.
            std::size_t failures = sequences.size();
            try
            {
                failures = combiner_.discard_chunks(entry->upload_id, sequences);
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Cleanup of upload {} aborted: {}", entry->upload_id, ex.what());
            }
            registry_.retire(entry);
            {
                std::lock_guard lock(cleanup_mutex_);
                --pending_cleanups_;
            }
            cleanup_idle_.notify_all();

            if (failures == 0)
            {
                spdlog::debug("Removed {} staged chunks of upload {}", sequences.size(), entry->upload_id);
            }
            else
            {
                spdlog::warn("Upload {} retired with {} staged chunks left behind", entry->upload_id, failures);
            } });
    }

} // namespace chunkstitch::server
