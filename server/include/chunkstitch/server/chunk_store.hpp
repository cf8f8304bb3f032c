#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace chunkstitch::server
{

    /**
     * Staging area for chunk payloads, one file per (upload id, sequence number).
     *
     * Callers serialize access to a given upload id; the store itself keeps no
     * state besides the directory. All failures surface as StorageError.
     */
    class ChunkStore
    {
    public:
        explicit ChunkStore(std::filesystem::path directory);

        const std::filesystem::path &directory() const noexcept { return directory_; }

        // Replaces any previously staged payload for the same key.
        void write(const std::string &upload_id, std::uint64_t sequence, std::span<const std::byte> payload);

        std::vector<std::byte> read(const std::string &upload_id, std::uint64_t sequence) const;

        // A chunk that is already gone counts as removed.
        void remove(const std::string &upload_id, std::uint64_t sequence);

        bool contains(const std::string &upload_id, std::uint64_t sequence) const;

        std::filesystem::path chunk_path(const std::string &upload_id, std::uint64_t sequence) const;

    private:
        std::filesystem::path directory_;
    };

} // namespace chunkstitch::server
