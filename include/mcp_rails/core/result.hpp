#pragma once

#include <cassert>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace mcp_rails {

// ---------------------------------------------------------------------------
// Result<T, E>: either a T or an E. Startup code (CLI, config) returns these
// instead of throwing.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }
    static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool IsOk() const noexcept { return state_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return state_.index() == 1; }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk());
        return std::get<0>(state_);
    }
    [[nodiscard]] T Value() && {
        assert(IsOk());
        return std::get<0>(std::move(state_));
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr());
        return std::get<1>(state_);
    }
    [[nodiscard]] E Error() && {
        assert(IsErr());
        return std::get<1>(std::move(state_));
    }

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : state_(tag, std::forward<V>(v)) {}

    std::variant<T, E> state_;
};

// Result<void, E>: success carries nothing.
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(std::nullopt); }
    static Result Err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr());
        return *error_;
    }
    [[nodiscard]] E Error() && {
        assert(IsErr());
        return std::move(*error_);
    }

private:
    explicit Result(std::optional<E> error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// Startup errors. Per-request failures never become an Error; they are
// answered on the wire as JSON-RPC errors.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    ConfigNotFound,
    ConfigParse,
    ConfigInvalid,
    Usage,
    Internal,
};

struct Error {
    std::string operation;  // "ConfigLoader", "CommandLine"
    std::string message;
    ErrorCategory category = ErrorCategory::Internal;

    // Process exit status for this error.
    [[nodiscard]] int ExitCode() const {
        switch (category) {
            case ErrorCategory::ConfigNotFound:
            case ErrorCategory::ConfigParse:
            case ErrorCategory::ConfigInvalid:
                return 1;
            case ErrorCategory::Usage:
                return 2;
            case ErrorCategory::Internal:
                break;
        }
        return 99;
    }

    [[nodiscard]] std::string ToString() const {
        return operation + ": " + message;
    }

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation && message == other.message &&
               category == other.category;
    }
    bool operator!=(const Error& other) const { return !(*this == other); }
};

} // namespace mcp_rails
