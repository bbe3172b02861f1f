#include "JsonFields.h"
#include <limits>
#include <stdexcept>

namespace StenoBridge {
namespace Protocol {
namespace JsonFields {

namespace {

const nlohmann::json& field(const nlohmann::json& j, const std::string& key)
{
    auto it = j.find(key);
    if (it == j.end()) {
        throw std::invalid_argument("missing field '" + key + "'");
    }
    return *it;
}

[[noreturn]] void wrongType(const std::string& key, const char* expected, const nlohmann::json& v)
{
    throw std::invalid_argument(
        "field '" + key + "' must be " + expected + ", got " + v.type_name());
}

} // namespace

void requireObject(const nlohmann::json& j, const std::string& what)
{
    if (!j.is_object()) {
        throw std::invalid_argument(what + " must be an object, got " + j.type_name());
    }
}

std::string requireString(const nlohmann::json& j, const std::string& key)
{
    const auto& v = field(j, key);
    if (!v.is_string()) {
        wrongType(key, "a string", v);
    }
    return v.get<std::string>();
}

bool requireBool(const nlohmann::json& j, const std::string& key)
{
    const auto& v = field(j, key);
    if (!v.is_boolean()) {
        wrongType(key, "a boolean", v);
    }
    return v.get<bool>();
}

uint32_t requireCount(const nlohmann::json& j, const std::string& key)
{
    const auto& v = field(j, key);
    if (!v.is_number_unsigned()) {
        wrongType(key, "a non-negative integer", v);
    }
    const auto count = v.get<uint64_t>();
    if (count > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument("field '" + key + "' is out of range");
    }
    return static_cast<uint32_t>(count);
}

int64_t requireInteger(const nlohmann::json& j, const std::string& key)
{
    const auto& v = field(j, key);
    if (!v.is_number_integer()) {
        wrongType(key, "an integer", v);
    }
    return v.get<int64_t>();
}

std::vector<std::string> requireStringArray(const nlohmann::json& j, const std::string& key)
{
    const auto& v = field(j, key);
    if (!v.is_array()) {
        wrongType(key, "an array of strings", v);
    }
    std::vector<std::string> result;
    result.reserve(v.size());
    for (const auto& item : v) {
        if (!item.is_string()) {
            wrongType(key, "an array of strings", item);
        }
        result.push_back(item.get<std::string>());
    }
    return result;
}

std::optional<std::string> optionalString(const nlohmann::json& j, const std::string& key)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        wrongType(key, "a string", *it);
    }
    return it->get<std::string>();
}

std::optional<bool> optionalBool(const nlohmann::json& j, const std::string& key)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_boolean()) {
        wrongType(key, "a boolean", *it);
    }
    return it->get<bool>();
}

} // namespace JsonFields
} // namespace Protocol
} // namespace StenoBridge
