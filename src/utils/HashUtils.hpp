#pragma once

#include <string>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <openssl/evp.h>

namespace collector::utils {

/**
 * Incremental digest over OpenSSL EVP. Used to hash object bodies while
 * they stream to disk, so verification needs no second read.
 */
class Digest {
public:
    explicit Digest(const EVP_MD* md) : m_ctx(EVP_MD_CTX_new()) {
        if (!m_ctx || EVP_DigestInit_ex(m_ctx, md, nullptr) != 1) {
            EVP_MD_CTX_free(m_ctx);
            throw std::runtime_error("EVP digest initialization failed");
        }
    }

    ~Digest() {
        EVP_MD_CTX_free(m_ctx);
    }

    Digest(const Digest&) = delete;
    Digest& operator=(const Digest&) = delete;

    static Digest md5() { return Digest(EVP_md5()); }

    void update(const char* data, size_t size) {
        EVP_DigestUpdate(m_ctx, data, size);
    }

    // Finalizes the context; call once
    std::string hexDigest() {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        EVP_DigestFinal_ex(m_ctx, hash, &hashLen);

        std::ostringstream oss;
        for (unsigned int i = 0; i < hashLen; ++i) {
            oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
        }
        return oss.str();
    }

private:
    EVP_MD_CTX* m_ctx;
};

} // namespace collector::utils
