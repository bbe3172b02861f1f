#pragma once

#include "ProofVerifier.h"
#include "core/Result.h"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace StenoBridge {
namespace Auth {

/**
 * @brief Proof = lowercase hex HMAC-SHA256 of the nonce text, keyed with the
 * pre-shared key. Comparison is constant time.
 */
class HmacProofVerifier : public ProofVerifier {
public:
    explicit HmacProofVerifier(std::vector<uint8_t> key);
    ~HmacProofVerifier() override;

    HmacProofVerifier(const HmacProofVerifier&) = delete;
    HmacProofVerifier& operator=(const HmacProofVerifier&) = delete;

    bool verify(std::string_view nonce, std::string_view proof) const override;

    /**
     * @brief The proof a client holding key must send for nonce. Used by the
     * CLI client and tests.
     */
    static Result<std::string, std::string> computeProof(
        const std::vector<uint8_t>& key, std::string_view nonce);

private:
    std::vector<uint8_t> key_;
};

} // namespace Auth
} // namespace StenoBridge
