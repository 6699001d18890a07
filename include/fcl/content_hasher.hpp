#pragma once

#include <fcl/result.hpp>

#include <filesystem>
#include <string>

namespace fcl {

/**
 * Computes SHA-256 content fingerprints.
 *
 * Files are streamed in HASH_BLOCK_SIZE blocks so memory use does not
 * depend on file size.
 */
class ContentHasher {
public:
    /**
     * Fingerprint a file's full content.
     *
     * @param path File to hash
     * @return Lowercase hex SHA-256 digest, or NOT_FOUND / PERMISSION_DENIED /
     *         IO_ERROR if the file vanishes or cannot be read
     */
    static Result<std::string> hash(const std::filesystem::path& path);

    /**
     * Fingerprint an in-memory buffer.
     */
    static Result<std::string> hash_bytes(const std::string& data);
};

}  // namespace fcl
