#include "hash_bucketing.hpp"
#include <openssl/evp.h>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace flageval {

namespace {

// Must be exactly 15 F's (60 bits), not the full 64-bit range
constexpr double k_long_scale = static_cast<double>(0xFFFFFFFFFFFFFFFull);

struct md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // anonymous namespace

double bucket(std::string_view flag_key, std::string_view subject_id,
              std::string_view salt) {
    std::string input;
    input.reserve(flag_key.size() + subject_id.size() + salt.size() + 1);
    input.append(flag_key);
    input.push_back('.');
    input.append(subject_id);
    input.append(salt);

    std::unique_ptr<EVP_MD_CTX, md_ctx_deleter> ctx(EVP_MD_CTX_new());
    if (!ctx) throw std::runtime_error("bucket: EVP_MD_CTX_new failed");

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1 ||
        digest_len < 8) {
        throw std::runtime_error("bucket: SHA-1 digest failed");
    }

    // First 15 hex digits = first 7 bytes plus the high nibble of the 8th
    uint64_t value = 0;
    for (int i = 0; i < 7; ++i) {
        value = (value << 8) | digest[i];
    }
    value = (value << 4) | (digest[7] >> 4);

    return static_cast<double>(value) / k_long_scale;
}

} // namespace flageval
