#include <fcl/content_hasher.hpp>
#include <fcl/core_types.hpp>

#include <openssl/evp.h>

#include <fstream>
#include <memory>
#include <vector>

namespace fcl {

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

Result<DigestContext> new_sha256_context() {
    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return Error(ErrorCode::INTERNAL_ERROR, "EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return Error(ErrorCode::INTERNAL_ERROR, "EVP_DigestInit_ex failed");
    }
    return std::move(ctx);
}

Result<std::string> finish_hex(EVP_MD_CTX* ctx) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &digest_len) != 1) {
        return Error(ErrorCode::INTERNAL_ERROR, "EVP_DigestFinal_ex failed");
    }

    static const char HEX[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex.push_back(HEX[digest[i] >> 4]);
        hex.push_back(HEX[digest[i] & 0x0F]);
    }
    return hex;
}

}  // namespace

Result<std::string> ContentHasher::hash(const std::filesystem::path& path) {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        return Error(ErrorCode::NOT_FOUND, "File not found: " + path.string());
    }
    if (std::filesystem::is_directory(status)) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Not a file: " + path.string());
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error(ErrorCode::PERMISSION_DENIED, "Cannot open " + path.string() + " for reading");
    }

    auto ctx = new_sha256_context();
    if (!ctx.ok()) {
        return ctx.error();
    }

    std::vector<char> block(HASH_BLOCK_SIZE);
    while (in) {
        in.read(block.data(), static_cast<std::streamsize>(block.size()));
        std::streamsize n = in.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.value().get(), block.data(), static_cast<size_t>(n)) != 1) {
            return Error(ErrorCode::INTERNAL_ERROR, "EVP_DigestUpdate failed");
        }
    }
    if (in.bad()) {
        return Error(ErrorCode::IO_ERROR, "Read error while hashing " + path.string());
    }

    return finish_hex(ctx.value().get());
}

Result<std::string> ContentHasher::hash_bytes(const std::string& data) {
    auto ctx = new_sha256_context();
    if (!ctx.ok()) {
        return ctx.error();
    }
    if (EVP_DigestUpdate(ctx.value().get(), data.data(), data.size()) != 1) {
        return Error(ErrorCode::INTERNAL_ERROR, "EVP_DigestUpdate failed");
    }
    return finish_hex(ctx.value().get());
}

}  // namespace fcl
