#pragma once

#include "core/error.hpp"

#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace duet {

/**
 * Result<T, E> - Either a success value (Ok) or an error (Err).
 *
 * Used for every fallible operation in the sync core so that failures
 * are handled at the call site instead of escaping the event loop.
 *
 * Usage:
 *   Result<uint16_t> listen(uint16_t port) {
 *       if (!bound) return Result<uint16_t>::err(Error{"port in use", ErrorKind::HostStartFailed});
 *       return Result<uint16_t>::ok(port);
 *   }
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
     * Get the success value, throwing if this is an error.
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

    /**
     * Get the error, throwing if this is a success.
     */
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

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void throw_if_err() const {
        if (!is_err()) {
            return;
        }
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " +
                                     std::get<1>(data_).message);
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    // Index-based so that T and E may be the same type.
    std::variant<T, E> data_;
};

/**
 * Result<void, E> - Success with no value, or an error.
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
                throw std::runtime_error("Result::unwrap() called on error: " + error_.message);
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
    }

    [[nodiscard]] const E& unwrap_err() const {
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

} // namespace duet
