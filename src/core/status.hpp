#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace moverwatch {

/// Outcome of a fallible operation: a value or an error description.
/// Adapters return this instead of throwing for expected failures
/// (transport errors, malformed payloads, bad config files).
template <typename T, typename E = std::string>
class Result {
public:
    [[nodiscard]] static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    /// Index-based so that Result<std::string, std::string> works
    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /// Throws std::logic_error when called on an error
    [[nodiscard]] const T& value() const& {
        if (is_err()) {
            throw std::logic_error("value() called on error Result");
        }
        return std::get<0>(data_);
    }

    [[nodiscard]] T value() && {
        if (is_err()) {
            throw std::logic_error("value() called on error Result");
        }
        return std::get<0>(std::move(data_));
    }

    /// Throws std::logic_error when called on a success
    [[nodiscard]] const E& error() const& {
        if (is_ok()) {
            throw std::logic_error("error() called on ok Result");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T fallback) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return fallback;
    }

    [[nodiscard]] T value_or(T fallback) && {
        if (is_ok()) {
            return std::get<0>(std::move(data_));
        }
        return fallback;
    }

    /// Apply func to the value, keeping the error untouched
    template <typename F>
    [[nodiscard]] auto map(F&& func) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::Ok(func(std::get<0>(data_)));
        }
        return Result<U, E>::Err(std::get<1>(data_));
    }

    /// Chain a second fallible step (e.g. transport then parse)
    template <typename F>
    [[nodiscard]] auto and_then(F&& func) const& -> std::invoke_result_t<F, const T&> {
        using Next = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return func(std::get<0>(data_));
        }
        return Next::Err(std::get<1>(data_));
    }

private:
    template <std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> tag, Args&&... args)
        : data_(tag, std::forward<Args>(args)...) {}

    std::variant<T, E> data_;
};

}  // namespace moverwatch
