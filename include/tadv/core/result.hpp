#pragma once

/// @file result.hpp
/// @brief Result<T,E> type for explicit error handling without exceptions.

#include <utility>
#include <variant>

namespace tadv {

/// Either a success value or an error.
///
/// Everything in the simulation that can be misconfigured (Home, Player,
/// Enemy, GameSession) is built through a static Create() returning a
/// Result, so an object that exists is always valid.
///
/// @tparam T The success value type.
/// @tparam E The error type; tadv::foundation::GameError everywhere in this
///           project (see GameResult).
///
/// Example:
/// @code
///   auto home = Home::Create({700.0, 300.0}, 20.0);
///   if (!home) {
///       log(home.error().message());
///   }
/// @endcode
template <typename T, typename E>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }

    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return std::holds_alternative<T>(data_); }

    [[nodiscard]] bool hasError() const noexcept { return std::holds_alternative<E>(data_); }

    /// True on success.
    explicit operator bool() const noexcept { return hasValue(); }

    /// Access the success value (throws std::bad_variant_access on error).
    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(data_)); }

    [[nodiscard]] const E& error() const& { return std::get<E>(data_); }
    [[nodiscard]] E& error() & { return std::get<E>(data_); }

    [[nodiscard]] T valueOr(T defaultValue) const& {
        return hasValue() ? value() : std::move(defaultValue);
    }

private:
    explicit Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    explicit Result(E error) : data_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> data_;
};

/// Specialization for operations with no success payload.
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return success_; }
    [[nodiscard]] bool hasError() const noexcept { return !success_; }
    explicit operator bool() const noexcept { return success_; }

    [[nodiscard]] const E& error() const& { return error_; }

private:
    explicit Result(bool) : success_(true) {}
    explicit Result(E error) : success_(false), error_(std::move(error)) {}

    bool success_ = false;
    E error_;
};

}  // namespace tadv
