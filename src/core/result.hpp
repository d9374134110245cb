#pragma once

#include <variant>
#include <string>
#include <string_view>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace tether {

/**
 * ErrorKind - The closed set of failures a store operation can report.
 */
enum class ErrorKind {
    Validation,        // malformed request, never sent to a port
    PermissionDenied,  // capability gate failed before dispatch
    NotFound,          // entity absent
    Conflict,          // a mutation on the same id is still in flight
    Transport          // repository port call failed
};

[[nodiscard]] constexpr std::string_view kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "ValidationError";
        case ErrorKind::PermissionDenied: return "PermissionDenied";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::Conflict: return "ConflictError";
        case ErrorKind::Transport: return "TransportError";
    }
    return "UnknownError";
}

/**
 * Error - A failure with a kind, a message and a retry hint.
 *
 * `retryable` is only meaningful for transport failures; the core treats
 * transient and permanent failures the same way and leaves retrying to the
 * port.
 */
struct Error {
    ErrorKind kind{ErrorKind::Transport};
    std::string message;
    bool retryable{false};

    Error() = default;
    Error(ErrorKind k, std::string msg, bool retry = false)
        : kind(k), message(std::move(msg)), retryable(retry) {}

    [[nodiscard]] static Error validation(std::string msg) {
        return Error{ErrorKind::Validation, std::move(msg)};
    }
    [[nodiscard]] static Error permission_denied(std::string msg) {
        return Error{ErrorKind::PermissionDenied, std::move(msg)};
    }
    [[nodiscard]] static Error not_found(std::string msg) {
        return Error{ErrorKind::NotFound, std::move(msg)};
    }
    [[nodiscard]] static Error conflict(std::string msg) {
        return Error{ErrorKind::Conflict, std::move(msg)};
    }
    [[nodiscard]] static Error transport(std::string msg, bool retry = false) {
        return Error{ErrorKind::Transport, std::move(msg), retry};
    }

    [[nodiscard]] bool is(ErrorKind k) const noexcept { return kind == k; }

    [[nodiscard]] std::string to_string() const {
        return std::string(kind_name(kind)) + ": " + message;
    }

    bool operator==(const Error& other) const {
        return kind == other.kind && message == other.message;
    }
};

/**
 * Result<T, E> - Either a success value (ok) or an error (err).
 *
 * Usage:
 *   Result<Workspace> find(const std::string& id) {
 *       if (id.empty()) return Result<Workspace>::err(Error::validation("empty id"));
 *       ...
 *   }
 *
 *   auto name = find(id).map([](const Workspace& ws) { return ws.name; });
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
     * Get the success value, throwing if this is an error.
     * Stores never unwrap a result they have not checked.
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

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        return is_ok() ? std::get<0>(data_) : std::move(default_value);
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
    [[nodiscard]] auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using ResultU = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(data_));
        }
        return ResultU::err(std::get<1>(data_));
    }

    template<typename OnOk, typename OnErr>
    [[nodiscard]] auto match(OnOk&& on_ok, OnErr&& on_err) const& {
        if (is_ok()) {
            return std::invoke(std::forward<OnOk>(on_ok), std::get<0>(data_));
        }
        return std::invoke(std::forward<OnErr>(on_err), std::get<1>(data_));
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void throw_if_err() const {
        if (is_ok()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " +
                                     std::get<1>(data_).to_string());
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    // Indexed rather than typed access so that Result<Error, Error> stays legal.
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
        if (is_ok_) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " + error_.to_string());
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok_) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using ResultU = std::invoke_result_t<F>;
        if (is_ok_) {
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

/**
 * Completion<T> - Continuation invoked once when an asynchronous operation
 * settles. Ports and stores never invoke it more than once.
 */
template<typename T>
using Completion = std::function<void(Result<T, Error>)>;

} // namespace tether
