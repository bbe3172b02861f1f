#include "HmacProofVerifier.h"
#include "Hex.h"
#include "core/LoggingChannels.h"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace StenoBridge {
namespace Auth {

namespace {

constexpr size_t kSha256Size = 32;

bool hmacSha256(
    const std::vector<uint8_t>& key, std::string_view message, std::vector<uint8_t>& out)
{
    out.assign(EVP_MAX_MD_SIZE, 0);
    unsigned int length = 0;
    const unsigned char* digest = HMAC(
        EVP_sha256(),
        key.data(),
        static_cast<int>(key.size()),
        reinterpret_cast<const unsigned char*>(message.data()),
        message.size(),
        out.data(),
        &length);
    if (digest == nullptr || length != kSha256Size) {
        return false;
    }
    out.resize(length);
    return true;
}

} // namespace

HmacProofVerifier::HmacProofVerifier(std::vector<uint8_t> key) : key_(std::move(key))
{}

HmacProofVerifier::~HmacProofVerifier()
{
    OPENSSL_cleanse(key_.data(), key_.size());
}

bool HmacProofVerifier::verify(std::string_view nonce, std::string_view proof) const
{
    const auto presented = fromHex(proof);
    if (!presented.has_value() || presented->size() != kSha256Size) {
        return false;
    }

    std::vector<uint8_t> expected;
    if (!hmacSha256(key_, nonce, expected)) {
        LOG_ERROR(Auth, "HMAC-SHA256 computation failed");
        return false;
    }

    return CRYPTO_memcmp(expected.data(), presented->data(), kSha256Size) == 0;
}

Result<std::string, std::string> HmacProofVerifier::computeProof(
    const std::vector<uint8_t>& key, std::string_view nonce)
{
    std::vector<uint8_t> digest;
    if (!hmacSha256(key, nonce, digest)) {
        return Result<std::string, std::string>::error("HMAC-SHA256 computation failed");
    }
    return Result<std::string, std::string>::okay(toHex(digest));
}

} // namespace Auth
} // namespace StenoBridge
