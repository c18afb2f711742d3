#include "warden/canon/Digest.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace warden {

std::string toHex(
    const unsigned char* data,
    size_t len
) {
    std::ostringstream out;
    for (size_t i = 0; i < len; ++i)
        out << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(data[i]);
    return out.str();
}

std::string sha256Hex(std::string_view data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_Digest(
            data.data(),
            data.size(),
            digest,
            &digest_len,
            EVP_sha256(),
            nullptr) != 1) {
        throw std::runtime_error("[Digest] SHA-256 computation failed");
    }

    return toHex(digest, digest_len);
}

std::string hmacSha256Hex(
    std::string_view key,
    std::string_view data
) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    const unsigned char* res = HMAC(
        EVP_sha256(),
        key.data(), static_cast<int>(key.size()),
        reinterpret_cast<const unsigned char*>(data.data()),
        data.size(),
        digest, &digest_len
    );
    if (res == nullptr) {
        throw std::runtime_error("[Digest] HMAC-SHA256 computation failed");
    }

    return toHex(digest, digest_len);
}

Sha256Stream::Sha256Stream()
    : ctx_(EVP_MD_CTX_new()) {
    if (ctx_ == nullptr) {
        throw std::runtime_error("[Digest] EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("[Digest] SHA-256 init failed");
    }
}

Sha256Stream::~Sha256Stream() {
    EVP_MD_CTX_free(ctx_);
}

void Sha256Stream::update(
    const void* data,
    size_t len
) {
    if (finalized_) {
        throw std::logic_error("[Digest] update after finalHex");
    }
    if (len == 0) return;
    if (EVP_DigestUpdate(ctx_, data, len) != 1) {
        throw std::runtime_error("[Digest] SHA-256 update failed");
    }
}

std::string Sha256Stream::finalHex() {
    if (finalized_) {
        throw std::logic_error("[Digest] finalHex called twice");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx_, digest, &digest_len) != 1) {
        throw std::runtime_error("[Digest] SHA-256 finalize failed");
    }
    finalized_ = true;

    return toHex(digest, digest_len);
}

}
