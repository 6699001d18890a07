#pragma once

#include <fcl/result.hpp>

#include <filesystem>
#include <string>

namespace fcl {

/**
 * Detects a MIME type from file content.
 *
 * Detection order:
 * 1. Magic-number signatures (images, audio, video, documents, archives)
 * 2. Printable content without NUL bytes -> "text/plain"
 * 3. Empty content -> "inode/x-empty"
 * 4. Anything else -> "application/octet-stream"
 */
class ContentSniffer {
public:
    /**
     * Sniff the first SNIFF_BYTES of a file.
     *
     * @return The MIME type, or NOT_FOUND / PERMISSION_DENIED if unreadable
     */
    static Result<std::string> sniff(const std::filesystem::path& path);

    /**
     * Sniff an in-memory prefix of a file.
     */
    static std::string from_bytes(const std::string& head);

private:
    static bool looks_like_text(const std::string& head);
};

}  // namespace fcl
