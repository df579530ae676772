#include "hash/sha256.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <stdexcept>

namespace zkvm16 {

void Sha256::CtxDeleter::operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
}

Sha256::Sha256()
    : ctx_(EVP_MD_CTX_new())
{
    if (!ctx_) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    init();
}

void Sha256::init() {
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
    }
}

void Sha256::update(const uint8_t* data, size_t len) {
    if (len == 0) return;
    if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

Digest Sha256::finalize() {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out, &out_len) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    if (out_len != Digest::LEN) {
        throw std::runtime_error("Unexpected SHA-256 digest length: " + std::to_string(out_len));
    }

    Digest::Bytes bytes;
    std::copy(out, out + Digest::LEN, bytes.begin());
    init();
    return Digest(bytes);
}

Digest Sha256::hash(const std::vector<uint8_t>& data) {
    Sha256 hasher;
    hasher.update(data);
    return hasher.finalize();
}

Digest Sha256::hash(const std::string& data) {
    Sha256 hasher;
    hasher.update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    return hasher.finalize();
}

} // namespace zkvm16
