#include "crypto_utils.h"

#include <cctype>
#include <fstream>
#include <stdexcept>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace scanlink {
namespace crypto {

void Sha256Hasher::CtxDeleter::operator()(EVP_MD_CTX* ctx) const
{
    EVP_MD_CTX_free(ctx);
}

Sha256Hasher::Sha256Hasher() : ctx_(EVP_MD_CTX_new())
{
    if (!ctx_)
    {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    reset();
}

Sha256Hasher::~Sha256Hasher() = default;

void Sha256Hasher::reset()
{
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1)
    {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
}

void Sha256Hasher::update(const void* data, size_t len)
{
    if (len == 0)
    {
        return;
    }
    if (EVP_DigestUpdate(ctx_.get(), data, len) != 1)
    {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

std::string Sha256Hasher::hex_digest()
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest, &digest_len) != 1)
    {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    reset();
    return to_hex(digest, digest_len);
}

std::string sha256_file(const std::string& path, size_t chunk_size)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        throw std::runtime_error("Cannot open file for hashing: " + path);
    }

    Sha256Hasher hasher;
    std::vector<char> buffer(chunk_size);
    while (in)
    {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got > 0)
        {
            hasher.update(buffer.data(), static_cast<size_t>(got));
        }
    }
    if (in.bad())
    {
        throw std::runtime_error("Read error while hashing: " + path);
    }
    return hasher.hex_digest();
}

std::string sha256_hex(const std::string& data)
{
    Sha256Hasher hasher;
    hasher.update(data);
    return hasher.hex_digest();
}

std::string to_hex(const uint8_t* data, size_t len)
{
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i)
    {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

std::string random_hex(size_t bytes)
{
    std::vector<uint8_t> buffer(bytes);
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1)
    {
        throw std::runtime_error("RAND_bytes failed");
    }
    return to_hex(buffer.data(), buffer.size());
}

std::string hash_token(const std::string& token, const std::string& salt, int iterations)
{
    uint8_t derived[32];
    if (PKCS5_PBKDF2_HMAC(token.data(), static_cast<int>(token.size()),
                          reinterpret_cast<const unsigned char*>(salt.data()),
                          static_cast<int>(salt.size()),
                          iterations, EVP_sha256(),
                          sizeof(derived), derived) != 1)
    {
        throw std::runtime_error("PKCS5_PBKDF2_HMAC failed");
    }
    return to_hex(derived, sizeof(derived));
}

bool constant_time_equals(const std::string& a, const std::string& b)
{
    if (a.size() != b.size())
    {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string generate_uuid()
{
    uint8_t bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1)
    {
        throw std::runtime_error("RAND_bytes failed");
    }
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::string hex = to_hex(bytes, sizeof(bytes));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

bool is_uuid(const std::string& value)
{
    if (value.size() != 36)
    {
        return false;
    }
    for (size_t i = 0; i < value.size(); ++i)
    {
        if (i == 8 || i == 13 || i == 18 || i == 23)
        {
            if (value[i] != '-')
                return false;
        }
        else if (!std::isxdigit(static_cast<unsigned char>(value[i])))
        {
            return false;
        }
    }
    return true;
}

} // namespace crypto
} // namespace scanlink
