#pragma once

#include <utility>
#include <variant>

namespace ProxyVm {

/**
 * @brief Value-or-error return type used across all fallible operations.
 *
 * Construct through okay() / error(); inspect with isValue() / isError().
 * Accessing the wrong alternative throws std::bad_variant_access.
 */
template <typename T, typename E>
class Result {
public:
    static Result okay(T value) { return Result(std::in_place_index<0>, std::move(value)); }

    static Result error(E error) { return Result(std::in_place_index<1>, std::move(error)); }

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

} // namespace ProxyVm
