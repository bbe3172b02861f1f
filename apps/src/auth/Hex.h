#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace StenoBridge {
namespace Auth {

std::string toHex(const std::vector<uint8_t>& bytes);
std::string toHex(const uint8_t* data, size_t size);

// Accepts upper or lower case digits; nullopt for odd length or non-hex input.
std::optional<std::vector<uint8_t>> fromHex(std::string_view text);

} // namespace Auth
} // namespace StenoBridge
