#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace StenoBridge {
namespace Protocol {

/**
 * @brief Thrown when a wire kind names no alternative of the target variant.
 */
class UnknownKindError : public std::invalid_argument {
public:
    explicit UnknownKindError(const std::string& kind)
        : std::invalid_argument("unknown kind '" + kind + "'"), kind_(kind)
    {}

    const std::string& kind() const { return kind_; }

private:
    std::string kind_;
};

/**
 * Helpers over variants whose alternatives expose static name(), toJson() and
 * static fromJson(). The kind string on the wire is the alternative's name().
 */
template <typename Variant>
std::string_view kindOf(const Variant& v)
{
    return std::visit([](const auto& alt) { return std::string_view(alt.name()); }, v);
}

template <typename Variant>
nlohmann::json payloadOf(const Variant& v)
{
    return std::visit([](const auto& alt) { return alt.toJson(); }, v);
}

template <typename Variant, std::size_t I = 0>
Variant fromKind(std::string_view kind, const nlohmann::json& payload)
{
    if constexpr (I < std::variant_size_v<Variant>) {
        using Alternative = std::variant_alternative_t<I, Variant>;
        if (kind == Alternative::name()) {
            return Variant{ std::in_place_index<I>, Alternative::fromJson(payload) };
        }
        return fromKind<Variant, I + 1>(kind, payload);
    }
    else {
        throw UnknownKindError(std::string(kind));
    }
}

template <typename Variant>
std::vector<std::string> kindNames()
{
    return []<std::size_t... I>(std::index_sequence<I...>) {
        return std::vector<std::string>{ std::variant_alternative_t<I, Variant>::name()... };
    }(std::make_index_sequence<std::variant_size_v<Variant>>{});
}

} // namespace Protocol
} // namespace StenoBridge
