/**
 * @file hash_utils.cpp
 * @brief Implementation of SHA-256 and random-name helpers over OpenSSL
 *
 * @date 2025
 */

#include "flashvm/utils/hash_utils.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace flashvm {
namespace utils {

namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

std::string DigestSHA256(const void* data, std::size_t length) {
    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to allocate digest context");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_length = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, length) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash, &hash_length) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    return HashUtils::BinaryToHex(hash, hash_length);
}

} // anonymous namespace

std::string HashUtils::ComputeSHA256(const std::string& data) {
    return DigestSHA256(data.data(), data.size());
}

std::string HashUtils::BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string HashUtils::RandomHex(std::size_t length) {
    std::vector<unsigned char> bytes((length + 1) / 2);
    if (!bytes.empty() && RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return BinaryToHex(bytes.data(), bytes.size()).substr(0, length);
}

} // namespace utils
} // namespace flashvm
