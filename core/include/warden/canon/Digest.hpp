#pragma once

#include <cstddef>
#include <string>
#include <string_view>

// Forward declaration keeps OpenSSL headers out of consumers
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace warden {

std::string toHex(
    const unsigned char* data,
    size_t len
);

// Lowercase hex SHA-256 of a byte buffer.
std::string sha256Hex(std::string_view data);

// Lowercase hex HMAC-SHA256.
std::string hmacSha256Hex(
    std::string_view key,
    std::string_view data
);

// Incremental SHA-256 for streamed input (files).
class Sha256Stream {
public:
    Sha256Stream();
    ~Sha256Stream();

    Sha256Stream(const Sha256Stream&) = delete;
    Sha256Stream& operator=(const Sha256Stream&) = delete;

    void update(
        const void* data,
        size_t len
    );

    // Finalizes the digest; the stream cannot be updated afterwards.
    std::string finalHex();

private:
    EVP_MD_CTX* ctx_;
    bool finalized_ = false;
};

}
