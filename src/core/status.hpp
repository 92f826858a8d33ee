#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace prism {

/// Result monad for error handling without exceptions
/// Inspired by Rust's Result<T, E>
template <typename T, typename E = std::string>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    /// Index-based so that T == E still works
    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /// Get the value (throws if error)
    [[nodiscard]] const T& value() const& {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result");
        }
        return std::get<0>(data_);
    }

    /// Move the value out (throws if error)
    [[nodiscard]] T value() && {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result");
        }
        return std::get<0>(std::move(data_));
    }

    /// Get the error (throws if ok)
    [[nodiscard]] const E& error() const& {
        if (is_ok()) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
    }

    /// Transform the value if Ok, preserve error if Err
    template <typename F>
    [[nodiscard]] auto map(F&& func) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::Ok(func(std::get<0>(data_)));
        }
        return Result<U, E>::Err(std::get<1>(data_));
    }

    /// Chain operations that may fail
    template <typename F>
    [[nodiscard]] auto and_then(F&& func) const& -> std::invoke_result_t<F, const T&> {
        using ResultType = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return func(std::get<0>(data_));
        }
        return ResultType::Err(std::get<1>(data_));
    }

private:
    template <size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> tag, Args&&... args)
        : data_(tag, std::forward<Args>(args)...) {}

    std::variant<T, E> data_;
};

/// Failure classes surfaced by the snapshot engine
enum class ErrorKind {
    InvalidSymbol,           // client input malformed
    UnsupportedExchange,     // exchange label names no known venue
    UpstreamTransportError,  // network failure or non-200 from a venue
    UpstreamSemanticError,   // 200 but the venue envelope reports failure
    NoTickerData             // venue returned no ticker row for the instrument
};

/// Error value carried through Result<T, Error>
struct Error {
    ErrorKind kind;
    std::string detail;

    [[nodiscard]] static Error invalid_symbol(std::string detail) {
        return Error{ErrorKind::InvalidSymbol, std::move(detail)};
    }
    [[nodiscard]] static Error unsupported_exchange(std::string detail) {
        return Error{ErrorKind::UnsupportedExchange, std::move(detail)};
    }
    [[nodiscard]] static Error transport(std::string detail) {
        return Error{ErrorKind::UpstreamTransportError, std::move(detail)};
    }
    [[nodiscard]] static Error semantic(std::string detail) {
        return Error{ErrorKind::UpstreamSemanticError, std::move(detail)};
    }
    [[nodiscard]] static Error no_ticker_data(std::string detail) {
        return Error{ErrorKind::NoTickerData, std::move(detail)};
    }
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidSymbol:          return "InvalidSymbol";
        case ErrorKind::UnsupportedExchange:    return "UnsupportedExchange";
        case ErrorKind::UpstreamTransportError: return "UpstreamTransportError";
        case ErrorKind::UpstreamSemanticError:  return "UpstreamSemanticError";
        case ErrorKind::NoTickerData:           return "NoTickerData";
    }
    return "Unknown";
}

/// True for failures caused by a venue rather than by the caller
[[nodiscard]] constexpr bool is_upstream(ErrorKind kind) noexcept {
    return kind == ErrorKind::UpstreamTransportError ||
           kind == ErrorKind::UpstreamSemanticError ||
           kind == ErrorKind::NoTickerData;
}

/// HTTP status the endpoint layer reports for an error kind
[[nodiscard]] constexpr int http_status(ErrorKind kind) noexcept {
    return is_upstream(kind) ? 502 : 400;
}

}  // namespace prism
