#include <fcl/content_sniffer.hpp>
#include <fcl/core_types.hpp>

#include <fstream>
#include <string_view>

namespace fcl {

namespace {

template<size_t N>
constexpr std::string_view sig(const char (&bytes)[N]) {
    return std::string_view(bytes, N - 1);
}

struct MagicSignature {
    size_t offset;
    std::string_view bytes;
    const char* mime;
    // Optional second marker that must also match (RIFF sub-types)
    size_t sub_offset = 0;
    std::string_view sub_bytes = {};
};

const MagicSignature SIGNATURES[] = {
    // Images
    {0, sig("\xFF\xD8\xFF"), "image/jpeg"},
    {0, sig("\x89PNG\r\n\x1A\n"), "image/png"},
    {0, sig("GIF87a"), "image/gif"},
    {0, sig("GIF89a"), "image/gif"},
    {0, sig("II*\0"), "image/tiff"},
    {0, sig("MM\0*"), "image/tiff"},
    {0, sig("RIFF"), "image/webp", 8, sig("WEBP")},
    {0, sig("BM"), "image/bmp"},

    // Audio
    {0, sig("RIFF"), "audio/x-wav", 8, sig("WAVE")},
    {0, sig("ID3"), "audio/mpeg"},
    {0, sig("\xFF\xFB"), "audio/mpeg"},
    {0, sig("OggS"), "audio/ogg"},
    {0, sig("fLaC"), "audio/flac"},

    // Video
    {0, sig("RIFF"), "video/x-msvideo", 8, sig("AVI ")},
    {4, sig("ftyp"), "video/mp4"},
    {0, sig("\x1A\x45\xDF\xA3"), "video/webm"},

    // Documents
    {0, sig("%PDF-"), "application/pdf"},
    {0, sig("\xD0\xCF\x11\xE0\xA1\xB1\x1A\xE1"), "application/msword"},

    // Archives
    {0, sig("PK\x03\x04"), "application/zip"},
    {0, sig("Rar!\x1A\x07"), "application/x-rar-compressed"},
    {0, sig("\x1F\x8B"), "application/gzip"},
    {257, sig("ustar"), "application/x-tar"},
    {0, sig("7z\xBC\xAF\x27\x1C"), "application/x-7z-compressed"},
};

bool matches_at(const std::string& head, size_t offset, std::string_view bytes) {
    if (head.size() < offset + bytes.size()) {
        return false;
    }
    return std::string_view(head).substr(offset, bytes.size()) == bytes;
}

}  // namespace

Result<std::string> ContentSniffer::sniff(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error(ErrorCode::NOT_FOUND, "File not found: " + path.string());
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error(ErrorCode::PERMISSION_DENIED, "Cannot read " + path.string());
    }

    std::string head(SNIFF_BYTES, '\0');
    in.read(&head[0], static_cast<std::streamsize>(head.size()));
    if (in.bad()) {
        return Error(ErrorCode::IO_ERROR, "Read error on " + path.string());
    }
    head.resize(static_cast<size_t>(in.gcount()));

    return from_bytes(head);
}

std::string ContentSniffer::from_bytes(const std::string& head) {
    if (head.empty()) {
        return "inode/x-empty";
    }

    for (const auto& signature : SIGNATURES) {
        if (!matches_at(head, signature.offset, signature.bytes)) {
            continue;
        }
        if (!signature.sub_bytes.empty() &&
            !matches_at(head, signature.sub_offset, signature.sub_bytes)) {
            continue;
        }
        return signature.mime;
    }

    if (looks_like_text(head)) {
        return "text/plain";
    }
    return "application/octet-stream";
}

bool ContentSniffer::looks_like_text(const std::string& head) {
    for (unsigned char c : head) {
        if (c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\b' || c == 0x1B) {
            continue;
        }
        // Bytes >= 0x80 are allowed so UTF-8 and Latin-1 text pass
        if (c < 0x20 || c == 0x7F) {
            return false;
        }
    }
    return true;
}

}  // namespace fcl
