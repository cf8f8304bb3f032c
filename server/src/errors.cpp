#include "chunkstitch/server/errors.hpp"

namespace chunkstitch::server
{

    AssemblyError::AssemblyError(chunkstitch::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    StorageError::StorageError(std::string message)
        : AssemblyError(chunkstitch::ErrorCode::StorageError, std::move(message)) {}

} // namespace chunkstitch::server
