#include "digest.hpp"
#include <memory>
#include <openssl/evp.h>
#include <stdexcept>

namespace Bulwark {
namespace Utils {
namespace Crypto {

namespace {

struct EvpCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    }
};

}  // namespace

std::string md5_hex(const std::string& input) {
    std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx)
        throw std::runtime_error("EVP_MD_CTX_new failed");

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int  hash_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1
        || EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1
        || EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        throw std::runtime_error("MD5 digest failed");
    }

    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string           hex;
    hex.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; ++i) {
        hex += hex_chars[(hash[i] >> 4) & 0x0F];
        hex += hex_chars[hash[i] & 0x0F];
    }
    return hex;
}

}  // namespace Crypto
}  // namespace Utils
}  // namespace Bulwark
