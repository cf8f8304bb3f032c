#pragma once

#include <stdexcept>
#include <string>

#include "chunkstitch/error_codes.hpp"

namespace chunkstitch::server
{

    class AssemblyError : public std::runtime_error
    {
    public:
        AssemblyError(chunkstitch::ErrorCode code, std::string message);

        chunkstitch::ErrorCode code() const noexcept { return code_; }

    private:
        chunkstitch::ErrorCode code_;
    };

    // Chunk or artifact I/O failed. Nothing about the upload's received set changed.
    class StorageError : public AssemblyError
    {
    public:
        explicit StorageError(std::string message);
    };

} // namespace chunkstitch::server
