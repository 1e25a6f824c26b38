/**
 * SFTP Bridge - Random identifiers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <string>

namespace sftpbridge::crypto
{

    void ensure_sodium_init();

    // Hex string of `byte_count` random bytes. Used for session ids and staging names.
    std::string random_hex(std::size_t byte_count);

} // namespace sftpbridge::crypto
