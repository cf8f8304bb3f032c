/**
 * ChunkStitch - Randomness helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <string>

namespace chunkstitch::crypto
{

    void ensure_sodium_init();

    // Lowercase hex encoding of `byte_count` random bytes.
    std::string random_hex_token(std::size_t byte_count);

} // namespace chunkstitch::crypto
