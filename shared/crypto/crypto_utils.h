#ifndef SCANLINK_CRYPTO_UTILS_H
#define SCANLINK_CRYPTO_UTILS_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "../config/scanlink_config.h"

// Forward declaration keeps OpenSSL headers out of dependents
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace scanlink {
namespace crypto {

/**
 * @brief Incremental SHA-256 over a byte stream
 *
 * Used on both ends of a file transfer: the sender digests the file before
 * streaming it, the receiver digests each binary frame as it arrives.
 */
class Sha256Hasher
{
public:
    Sha256Hasher();
    ~Sha256Hasher();

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;

    void update(const void* data, size_t len);
    void update(const std::string& data) { update(data.data(), data.size()); }

    /**
     * @brief Finish the digest and return it as lowercase hex.
     * The hasher is reset and can be reused afterwards.
     */
    std::string hex_digest();

private:
    void reset();

    struct CtxDeleter
    {
        void operator()(EVP_MD_CTX* ctx) const;
    };
    std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
};

/**
 * @brief SHA-256 of a file read in chunks
 * @throws std::runtime_error if the file cannot be read
 */
std::string sha256_file(const std::string& path, size_t chunk_size = SCANLINK_CHUNK_SIZE);

std::string sha256_hex(const std::string& data);

std::string to_hex(const uint8_t* data, size_t len);

/**
 * @brief Random bytes from the OpenSSL CSPRNG, hex encoded
 * @throws std::runtime_error if the generator fails
 */
std::string random_hex(size_t bytes);

inline std::string generate_salt() { return random_hex(SCANLINK_SALT_BYTES); }

/**
 * @brief PBKDF2-HMAC-SHA256 of a device token, hex encoded
 */
std::string hash_token(const std::string& token, const std::string& salt, int iterations);

/**
 * @brief Compare two strings without an early exit on the first mismatch
 */
bool constant_time_equals(const std::string& a, const std::string& b);

/**
 * @brief Random version 4 UUID in canonical 8-4-4-4-12 form
 */
std::string generate_uuid();

/**
 * @brief True for canonical 8-4-4-4-12 hex UUIDs (either case)
 */
bool is_uuid(const std::string& value);

} // namespace crypto
} // namespace scanlink

#endif // SCANLINK_CRYPTO_UTILS_H
