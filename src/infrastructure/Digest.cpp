/**
 * @file Digest.cpp
 * @brief Implementation of Digest.
 */

#include "infrastructure/Digest.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>

namespace filegate::infrastructure {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

MdCtx NewSha256() {
    MdCtx ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 initialisation failed");
    }
    return ctx;
}

std::string Finish(EVP_MD_CTX* ctx) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, md, &len) != 1) {
        throw std::runtime_error("SHA-256 finalisation failed");
    }
    return Digest::ToHex(md, len);
}

} // namespace

std::string Digest::ToHex(const unsigned char* bytes, std::size_t length) {
    static const char* const digits = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        out.push_back(digits[bytes[i] >> 4]);
        out.push_back(digits[bytes[i] & 0x0F]);
    }
    return out;
}

std::string Digest::Sha256Hex(const std::string& data) {
    MdCtx ctx = NewSha256();
    EVP_DigestUpdate(ctx.get(), data.data(), data.size());
    return Finish(ctx.get());
}

std::optional<std::string> Digest::Sha256FileHex(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return std::nullopt;

    MdCtx ctx = NewSha256();
    std::vector<char> chunk(64 * 1024);
    while (in) {
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        std::streamsize n = in.gcount();
        if (n > 0) EVP_DigestUpdate(ctx.get(), chunk.data(), static_cast<std::size_t>(n));
    }
    if (in.bad()) return std::nullopt;
    return Finish(ctx.get());
}

std::string Digest::HmacSha256Hex(const std::string& key, const std::string& data) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(), md, &len)) {
        throw std::runtime_error("HMAC-SHA-256 failed");
    }
    return ToHex(md, len);
}

} // namespace filegate::infrastructure
