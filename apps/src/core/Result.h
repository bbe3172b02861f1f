#pragma once

#include <utility>
#include <variant>

namespace StenoBridge {

/**
 * @brief Value-or-error return type used across component boundaries.
 *
 * Holds either a value of type T or an error of type E. T and E may be the
 * same type; the active alternative is tracked by index.
 *
 * Example:
 *   Result<int, std::string> parse(const std::string& text);
 *   auto result = parse("42");
 *   if (result.isError()) { log(result.errorValue()); }
 */
template <typename T, typename E>
class Result {
public:
    Result() : data_(std::in_place_index<0>) {}

    static Result okay(T value) { return Result(std::in_place_index<0>, std::move(value)); }

    static Result error(E err) { return Result(std::in_place_index<1>, std::move(err)); }

    bool isValue() const { return data_.index() == 0; }
    bool isError() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& errorValue() { return std::get<1>(data_); }
    const E& errorValue() const { return std::get<1>(data_); }

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> index, V&& v) : data_(index, std::forward<V>(v))
    {}

    std::variant<T, E> data_;
};

} // namespace StenoBridge
