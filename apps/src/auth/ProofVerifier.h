#pragma once

#include <string_view>

namespace StenoBridge {
namespace Auth {

/**
 * @brief Checks a client's response to a challenge nonce.
 *
 * The proof primitive is pluggable; AuthGate only needs a yes or no.
 */
class ProofVerifier {
public:
    virtual ~ProofVerifier() = default;

    virtual bool verify(std::string_view nonce, std::string_view proof) const = 0;
};

} // namespace Auth
} // namespace StenoBridge
