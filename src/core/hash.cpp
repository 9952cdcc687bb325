#include "core/hash.hpp"
#include "core/error.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <vector>

namespace llmshield::hash {

namespace {

std::string to_hex(const unsigned char* data, size_t len) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        hex += hex_chars[(data[i] >> 4) & 0x0F];
        hex += hex_chars[data[i] & 0x0F];
    }
    return hex;
}

} // anonymous namespace

std::string sha256_hex(std::string_view data) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw ShieldError(ErrorCategory::INTERNAL_ERROR, "EVP_MD_CTX_new failed");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    const bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1
        && EVP_DigestUpdate(ctx, data.data(), data.size()) == 1
        && EVP_DigestFinal_ex(ctx, digest, &digest_len) == 1;
    EVP_MD_CTX_free(ctx);

    if (!ok) {
        throw ShieldError(ErrorCategory::INTERNAL_ERROR, "SHA-256 digest failed");
    }
    return to_hex(digest, digest_len);
}

std::string random_hex(size_t byte_count) {
    std::vector<unsigned char> bytes(byte_count);
    if (RAND_bytes(bytes.data(), static_cast<int>(byte_count)) != 1) {
        throw ShieldError(ErrorCategory::INTERNAL_ERROR, "RAND_bytes failed");
    }
    return to_hex(bytes.data(), bytes.size());
}

} // namespace llmshield::hash
