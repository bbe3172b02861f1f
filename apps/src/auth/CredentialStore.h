#pragma once

#include "core/Result.h"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace StenoBridge {
namespace Auth {

/**
 * @brief Reads the pre-shared key file, creating one on first use if allowed.
 *
 * The file holds either hex text or raw bytes. Surrounding whitespace is
 * ignored. Keys shorter than kMinKeyBytes are rejected.
 */
class CredentialStore {
public:
    static constexpr size_t kMinKeyBytes = 16;
    static constexpr size_t kGeneratedKeyBytes = 32;

    static Result<std::vector<uint8_t>, std::string> load(const std::filesystem::path& path);

    /**
     * @brief load(), but a missing file is first created with a fresh random
     * hex key readable only by the owner when generateIfMissing is true.
     */
    static Result<std::vector<uint8_t>, std::string> loadOrCreate(
        const std::filesystem::path& path, bool generateIfMissing);

    static Result<std::monostate, std::string> generate(const std::filesystem::path& path);
};

} // namespace Auth
} // namespace StenoBridge
