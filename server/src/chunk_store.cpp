#include "chunkstitch/server/chunk_store.hpp"

#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "chunkstitch/server/errors.hpp"

namespace chunkstitch::server
{

    namespace
    {
        constexpr auto kPartialSuffix = ".partial";

        std::string describe(const std::string &upload_id, std::uint64_t sequence)
        {
            return "chunk " + std::to_string(sequence) + " of upload " + upload_id;
        }
    } // namespace

    ChunkStore::ChunkStore(std::filesystem::path directory) : directory_(std::move(directory))
    {
        std::error_code ec;
        std::filesystem::create_directories(directory_, ec);
        if (ec)
        {
            throw StorageError("Cannot create chunk directory " + directory_.string() + ": " + ec.message());
        }
    }

    std::filesystem::path ChunkStore::chunk_path(const std::string &upload_id, std::uint64_t sequence) const
    {
        return directory_ / (upload_id + "-" + std::to_string(sequence));
    }

    void ChunkStore::write(const std::string &upload_id, std::uint64_t sequence, std::span<const std::byte> payload)
    {
        const auto target = chunk_path(upload_id, sequence);
        auto partial = target;
        partial += kPartialSuffix;

        {
            std::ofstream out(partial, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw StorageError("Cannot open staging file for " + describe(upload_id, sequence));
            }
            out.write(reinterpret_cast<const char *>(payload.data()), static_cast<std::streamsize>(payload.size()));
            out.flush();
            if (!out)
            {
                out.close();
                std::error_code ignored;
                std::filesystem::remove(partial, ignored);
                throw StorageError("Failed to write " + describe(upload_id, sequence));
            }
        }

        std::error_code ec;
        std::filesystem::rename(partial, target, ec);
        if (ec)
        {
            std::error_code ignored;
            std::filesystem::remove(partial, ignored);
            throw StorageError("Failed to commit " + describe(upload_id, sequence) + ": " + ec.message());
        }
    }

    std::vector<std::byte> ChunkStore::read(const std::string &upload_id, std::uint64_t sequence) const
    {
        const auto path = chunk_path(upload_id, sequence);
        std::ifstream in(path, std::ios::binary | std::ios::ate);
        if (!in.is_open())
        {
            throw StorageError("Missing " + describe(upload_id, sequence));
        }
        const auto size = in.tellg();
        if (size < 0)
        {
            throw StorageError("Cannot determine size of " + describe(upload_id, sequence));
        }
        std::vector<std::byte> data(static_cast<std::size_t>(size));
        in.seekg(0);
        in.read(reinterpret_cast<char *>(data.data()), size);
        if (!in)
        {
            throw StorageError("Failed to read " + describe(upload_id, sequence));
        }
        return data;
    }

    void ChunkStore::remove(const std::string &upload_id, std::uint64_t sequence)
    {
        std::error_code ec;
        std::filesystem::remove(chunk_path(upload_id, sequence), ec);
        if (ec)
        {
            throw StorageError("Failed to delete " + describe(upload_id, sequence) + ": " + ec.message());
        }
        spdlog::trace("Deleted staged {}", describe(upload_id, sequence));
    }

    bool ChunkStore::contains(const std::string &upload_id, std::uint64_t sequence) const
    {
        std::error_code ec;
        return std::filesystem::is_regular_file(chunk_path(upload_id, sequence), ec);
    }

} // namespace chunkstitch::server
