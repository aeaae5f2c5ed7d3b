#pragma once

#include <cstddef>
#include <stdexcept>
#include <utility>
#include <variant>

namespace normfmt {

// Holds either a success value or an error. Never empty.
template<typename T, typename E>
class Result {
public:
    static auto success(T value) -> Result {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static auto failure(E error) -> Result {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] auto is_ok() const noexcept -> bool { return data_.index() == 0; }
    [[nodiscard]] auto is_err() const noexcept -> bool { return data_.index() == 1; }

    explicit operator bool() const noexcept { return is_ok(); }

    auto value() & -> T& {
        if (is_err()) {
            throw std::logic_error("Result::value() called on error result");
        }
        return std::get<0>(data_);
    }

    auto value() const& -> const T& {
        if (is_err()) {
            throw std::logic_error("Result::value() called on error result");
        }
        return std::get<0>(data_);
    }

    auto value() && -> T&& {
        if (is_err()) {
            throw std::logic_error("Result::value() called on error result");
        }
        return std::get<0>(std::move(data_));
    }

    auto error() const& -> const E& {
        if (is_ok()) {
            throw std::logic_error("Result::error() called on success result");
        }
        return std::get<1>(data_);
    }

    auto error() && -> E&& {
        if (is_ok()) {
            throw std::logic_error("Result::error() called on success result");
        }
        return std::get<1>(std::move(data_));
    }

private:
    template<std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

    std::variant<T, E> data_;
};

} // namespace normfmt
