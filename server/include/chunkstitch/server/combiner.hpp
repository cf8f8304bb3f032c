#pragma once

#include <cstdint>
#include <filesystem>
#include <set>
#include <string>

#include "chunkstitch/server/chunk_store.hpp"

namespace chunkstitch::server
{

    struct AssembledArtifact
    {
        std::string upload_id;
        std::filesystem::path path;
        std::uint64_t size{};
    };

    class Combiner
    {
    public:
        Combiner(ChunkStore &store, std::filesystem::path completed_dir);

        /**
         * Concatenates chunks 0..expected_chunks-1 of `upload_id` into
         * `<completed_dir>/<upload_id>`.
         *
         * Stops at the first missing or unreadable chunk and throws StorageError,
         * leaving a partial artifact behind; combining again overwrites it.
         */
        AssembledArtifact combine(const std::string &upload_id, std::uint64_t expected_chunks) const;

        // Deletes exactly the listed staged chunks of `upload_id`. Failures are
        // logged and counted, the remaining chunks are still attempted.
        std::size_t discard_chunks(const std::string &upload_id, const std::set<std::uint64_t> &sequences) const;

        std::filesystem::path artifact_path(const std::string &upload_id) const;

    private:
        ChunkStore &store_;
        std::filesystem::path completed_dir_;
    };

} // namespace chunkstitch::server
