// ==============================================================================
// digest.cpp - Идентификаторы документов (OpenSSL EVP)
// ==============================================================================

#include "indexlens/digest.hpp"

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace indexlens {

std::string sha256_hex(std::string_view data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                                 EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("failed to allocate digest context");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    static const char hex[] = "0123456789abcdef";
    std::string result;
    result.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        result += hex[digest[i] >> 4];
        result += hex[digest[i] & 0x0f];
    }
    return result;
}

std::string document_id(std::string_view index_name) {
    return sha256_hex(index_name);
}

}  // namespace indexlens
