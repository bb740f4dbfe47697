#pragma once

#include <variant>
#include <string>
#include <vector>
#include <functional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace tinsel {

/**
 * ErrorKind - Failure taxonomy of the engine.
 *
 * StoreUnavailable and MigrationFailed degrade to an in-memory session,
 * RemoteWriteFailed is retried by the outbox, ValidationRejected is
 * returned to the caller synchronously and never queued.
 */
enum class ErrorKind {
    Unknown,
    StoreUnavailable,
    MigrationFailed,
    StorageFailure,
    RemoteWriteFailed,
    ValidationRejected
};

[[nodiscard]] constexpr const char* kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Unknown: return "unknown";
        case ErrorKind::StoreUnavailable: return "store-unavailable";
        case ErrorKind::MigrationFailed: return "migration-failed";
        case ErrorKind::StorageFailure: return "storage-failure";
        case ErrorKind::RemoteWriteFailed: return "remote-write-failed";
        case ErrorKind::ValidationRejected: return "validation-rejected";
    }
    return "unknown";
}

/**
 * A single field-level validation problem.
 */
struct Issue {
    std::string path;
    std::string message;

    bool operator==(const Issue&) const = default;
};

/**
 * Error type for Result - a failure with a message, a kind and an optional
 * numeric code (the SQLite result code for storage failures).
 */
struct Error {
    std::string message;
    ErrorKind kind{ErrorKind::Unknown};
    int code{0};
    std::vector<Issue> issues;

    Error() = default;
    explicit Error(std::string msg, ErrorKind k = ErrorKind::Unknown, int c = 0)
        : message(std::move(msg)), kind(k), code(c) {}

    [[nodiscard]] Error with_kind(ErrorKind k) const {
        Error copy = *this;
        copy.kind = k;
        return copy;
    }

    bool operator==(const Error& other) const {
        return message == other.message && kind == other.kind && code == other.code;
    }
};

/**
 * Result<T, E> - Either a value (ok) or an error (err).
 *
 *   Result<int> parse_tier(const std::string& s);
 *   auto tier = parse_tier(raw)
 *       .map([](int t) { return std::clamp(t, 1, 5); })
 *       .value_or(1);
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return data_.index() == 1; }

    /**
     * Get the value, throwing if this is an error.
     */
    [[nodiscard]] T& unwrap() & {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        throw_if_err();
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        return is_ok() ? std::get<0>(data_) : std::move(default_value);
    }

    [[nodiscard]] T value_or(T default_value) && {
        return is_ok() ? std::get<0>(std::move(data_)) : std::move(default_value);
    }

    /**
     * map : Result<T, E> -> (T -> U) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(data_)));
        }
        return Result<U, E>::err(std::get<1>(data_));
    }

    /**
     * and_then : Result<T, E> -> (T -> Result<U, E>) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) && -> std::invoke_result_t<F, T> {
        using ResultU = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(std::move(data_)));
        }
        return ResultU::err(std::get<1>(std::move(data_)));
    }

    template<typename F>
    const Result& inspect_err(F&& f) const& {
        if (is_err()) {
            std::invoke(std::forward<F>(f), std::get<1>(data_));
        }
        return *this;
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void throw_if_err() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " +
                                         std::get<1>(data_).message);
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
    }

    std::variant<T, E> data_;
};

/**
 * Result<void, E> - success without a value, or an error.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() { return Result(true); }
    [[nodiscard]] static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool is_ok() const noexcept { return is_ok_; }
    [[nodiscard]] bool is_err() const noexcept { return !is_ok_; }

    void unwrap() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " + error_.message);
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using ResultU = std::invoke_result_t<F>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f));
        }
        return ResultU::err(error_);
    }

    template<typename F>
    const Result& inspect_err(F&& f) const {
        if (is_err()) {
            std::invoke(std::forward<F>(f), error_);
        }
        return *this;
    }

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

template<typename T>
using Res = Result<T, Error>;

using VoidResult = Result<void, Error>;

} // namespace tinsel
