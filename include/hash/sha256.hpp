#pragma once

#include "types/digest.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Forward declaration from <openssl/evp.h>
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace zkvm16 {

/**
 * Sha256 - SHA-256 backed by the OpenSSL EVP digest interface
 *
 * Either hash a buffer in one call, or feed it incrementally:
 *
 *   Sha256 hasher;
 *   hasher.update(header);
 *   hasher.update(payload);
 *   Digest d = hasher.finalize();
 *
 * OpenSSL failures throw std::runtime_error.
 */
class Sha256 {
public:
    Sha256();

    // Absorb more input; may be called any number of times before finalize()
    void update(const uint8_t* data, size_t len);
    void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }

    /**
     * Produce the digest. The hasher is re-initialised afterwards and can
     * be reused for a new message.
     */
    Digest finalize();

    // One-shot helpers
    static Digest hash(const std::vector<uint8_t>& data);
    static Digest hash(const std::string& data);

private:
    struct CtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const;
    };

    std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;

    void init();
};

} // namespace zkvm16
