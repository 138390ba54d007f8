#pragma once

#include <variant>
#include <string>
#include <string_view>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace offgrid {

/**
 * ErrorKind - Classifies failures so callers can react without parsing
 * messages.
 */
enum class ErrorKind {
    Internal,
    InvalidArgument,
    InvalidGeometry,    // non-positive size or position outside the grid
    PlacementConflict,  // geometry would overlap another placed widget
    RetryableSync,      // timeout, transport failure, rate limiting
    RejectedSync,       // sink refused the mutation (validation, conflict, not found)
    Storage,            // local persistence failure
    NotFound
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Internal: return "Internal";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::InvalidGeometry: return "InvalidGeometry";
        case ErrorKind::PlacementConflict: return "PlacementConflict";
        case ErrorKind::RetryableSync: return "RetryableSyncError";
        case ErrorKind::RejectedSync: return "RejectedSyncError";
        case ErrorKind::Storage: return "Storage";
        case ErrorKind::NotFound: return "NotFound";
    }
    return "Unknown";
}

/**
 * Error - A failure with a kind, a message and an optional native code
 * (SQLite result code, HTTP status).
 */
struct Error {
    ErrorKind kind{ErrorKind::Internal};
    std::string message;
    int code{0};

    Error() = default;
    explicit Error(std::string msg, int c = 0)
        : message(std::move(msg)), code(c) {}
    Error(ErrorKind k, std::string msg, int c = 0)
        : kind(k), message(std::move(msg)), code(c) {}

    [[nodiscard]] static Error invalid_geometry(std::string msg) {
        return Error{ErrorKind::InvalidGeometry, std::move(msg)};
    }
    [[nodiscard]] static Error placement_conflict(std::string msg) {
        return Error{ErrorKind::PlacementConflict, std::move(msg)};
    }
    [[nodiscard]] static Error storage(std::string msg, int rc = 0) {
        return Error{ErrorKind::Storage, std::move(msg), rc};
    }
    [[nodiscard]] static Error invalid_argument(std::string msg) {
        return Error{ErrorKind::InvalidArgument, std::move(msg)};
    }

    [[nodiscard]] bool is(ErrorKind k) const noexcept { return kind == k; }

    /**
     * "Kind: message" for logs and persisted lastError columns.
     */
    [[nodiscard]] std::string describe() const {
        std::string out(to_string(kind));
        out += ": ";
        out += message;
        return out;
    }

    bool operator==(const Error& other) const {
        return kind == other.kind && message == other.message && code == other.code;
    }
};

/**
 * Result<T, E> - Either a value (ok) or an error (err).
 *
 * Every fallible operation in the engine reports through this type:
 *   auto pos = layout::find_next_available_position(widgets, size, bounds);
 *   if (pos.is_err()) return Result<int>::err(pos.unwrap_err());
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

    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /**
     * Get the value, throwing std::runtime_error on error. Prefer checking
     * is_ok() first outside of tests.
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
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
    }

    [[nodiscard]] T value_or(T default_value) && {
        if (is_ok()) {
            return std::get<0>(std::move(data_));
        }
        return default_value;
    }

    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(data_)));
        }
        return Result<U, E>::err(std::get<1>(data_));
    }

    template<typename F>
    [[nodiscard]] auto map_err(F&& f) const& -> Result<T, std::invoke_result_t<F, const E&>> {
        using NewE = std::invoke_result_t<F, const E&>;
        if (is_err()) {
            return Result<T, NewE>::err(std::invoke(std::forward<F>(f), std::get<1>(data_)));
        }
        return Result<T, NewE>::ok(std::get<0>(data_));
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using ResultU = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(data_));
        }
        return ResultU::err(std::get<1>(data_));
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void throw_if_err() const {
        if (is_ok()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " +
                                     std::get<1>(data_).describe());
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    // Index-based access so T and E may be the same type.
    std::variant<T, E> data_;
};

/**
 * Result<void, E> - success carries no value.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() {
        return Result(true);
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept { return is_ok_; }
    [[nodiscard]] bool is_err() const noexcept { return !is_ok_; }

    void unwrap() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " + error_.describe());
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

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

template<typename T>
using Res = Result<T, Error>;

} // namespace offgrid
