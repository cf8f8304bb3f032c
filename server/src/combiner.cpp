#include "chunkstitch/server/combiner.hpp"

#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "chunkstitch/server/errors.hpp"

namespace chunkstitch::server
{

    Combiner::Combiner(ChunkStore &store, std::filesystem::path completed_dir)
        : store_(store), completed_dir_(std::move(completed_dir))
    {
        std::error_code ec;
        std::filesystem::create_directories(completed_dir_, ec);
        if (ec)
        {
            throw StorageError("Cannot create completed directory " + completed_dir_.string() + ": " + ec.message());
        }
    }

    std::filesystem::path Combiner::artifact_path(const std::string &upload_id) const
    {
        return completed_dir_ / upload_id;
    }

    AssembledArtifact Combiner::combine(const std::string &upload_id, std::uint64_t expected_chunks) const
    {
        AssembledArtifact artifact{
            .upload_id = upload_id,
            .path = artifact_path(upload_id),
            .size = 0,
        };

        std::ofstream out(artifact.path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw StorageError("Cannot create artifact " + artifact.path.string());
        }
        for (std::uint64_t sequence = 0; sequence < expected_chunks; ++sequence)
        {
            const auto chunk = store_.read(upload_id, sequence);
            out.write(reinterpret_cast<const char *>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
            if (!out)
            {
                throw StorageError("Failed to append chunk " + std::to_string(sequence) + " to " +
                                   artifact.path.string());
            }
            artifact.size += chunk.size();
        }
        out.close();
        if (!out)
        {
            throw StorageError("Failed to finish artifact " + artifact.path.string());
        }

        spdlog::info("Combined {} chunks of upload {} into {} ({} bytes)", expected_chunks, upload_id,
                     artifact.path.string(), artifact.size);
        return artifact;
    }

    std::size_t Combiner::discard_chunks(const std::string &upload_id, const std::set<std::uint64_t> &sequences) const
    {
        std::size_t failures = 0;
        for (const auto sequence : sequences)
        {
            try
            {
                store_.remove(upload_id, sequence);
            }
            catch (const StorageError &ex)
            {
                ++failures;
                spdlog::warn("Cleanup of upload {}: {}", upload_id, ex.what());
            }
        }
        return failures;
    }

} // namespace chunkstitch::server
