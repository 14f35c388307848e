#pragma once

#include <cassert>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include "error.hpp"

namespace docwire {

    /// @brief Result<T> holds either the value produced by an RPC, a pooled
    /// operation or a write, or the Error that ended it.
    /// @tparam T The type of the successful value.
    /// @note Every fallible coroutine in the library returns
    /// awaitable<Result<T>> instead of throwing.
    template <typename T>
    class [[nodiscard]] Result {
       public:
        using value_type = T;

        /// @brief Create a successful Result, constructing T in place.
        template <typename... Args, typename = std::enable_if_t<
                                        std::is_constructible_v<T, Args&&...>>>
        static Result ok(Args&&... args) {
            return Result(std::in_place_type<T>, std::forward<Args>(args)...);
        }

        /// @brief Create a failed Result holding a copy of the Error.
        static Result err(const Error& error) {
            return Result(std::in_place_type<Error>, error);
        }

        /// @brief Create a failed Result taking ownership of the Error.
        static Result err(Error&& error) {
            return Result(std::in_place_type<Error>, std::move(error));
        }

        /// @brief Allow `if (result) { ... }` to mean "if success".
        explicit operator bool() const noexcept { return has_value(); }

        bool has_value() const noexcept {
            return std::holds_alternative<T>(m_state);
        }

        bool has_error() const noexcept {
            return std::holds_alternative<Error>(m_state);
        }

        const T& value() const& {
            const T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return *p;
        }

        T& value() & {
            T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return *p;
        }

        T&& value() && {
            T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return std::move(*p);
        }

        [[nodiscard]] const T* value_ptr() const noexcept {
            return std::get_if<T>(&m_state);
        }

        [[nodiscard]] T* value_ptr() noexcept {
            return std::get_if<T>(&m_state);
        }

        const Error& error() const& {
            const Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return *p;
        }

        Error& error() & {
            Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return *p;
        }

        Error&& error() && {
            Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return std::move(*p);
        }

        [[nodiscard]] const Error* error_ptr() const noexcept {
            return std::get_if<Error>(&m_state);
        }

        [[nodiscard]] Error* error_ptr() noexcept {
            return std::get_if<Error>(&m_state);
        }

        /// @brief Return the value, or the result of make_fallback() when
        /// this Result holds an Error. The fallback is only built on error.
        template <typename F,
                  typename = std::enable_if_t<std::is_invocable_r_v<T, F&&>>>
        T value_or_else(F&& make_fallback) const& {
            return has_value() ? value() : std::forward<F>(make_fallback)();
        }

        template <typename F,
                  typename = std::enable_if_t<std::is_invocable_r_v<T, F&&>>>
        T value_or_else(F&& make_fallback) && {
            return has_value() ? std::move(*this).value()
                               : std::forward<F>(make_fallback)();
        }

        T value_or(T fallback) const& {
            return value_or_else([&] { return std::move(fallback); });
        }

        T value_or(T fallback) && {
            return std::move(*this).value_or_else(
                [&] { return std::move(fallback); });
        }

        /// @brief The stored error, or `fallback` if this Result holds a
        /// value. Handy on logging paths.
        const Error& error_or(const Error& fallback) const noexcept {
            return has_error() ? *error_ptr() : fallback;
        }

        /// @brief Rewrap the error of this Result as a Result<U>.
        /// @pre has_error()
        template <typename U>
        Result<U> forward_error() const& {
            return Result<U>::err(error());
        }

       private:
        template <typename... Args>
        explicit Result(std::in_place_type_t<T>, Args&&... args)
            : m_state(std::in_place_type<T>, std::forward<Args>(args)...) {}

        explicit Result(std::in_place_type_t<Error>, const Error& error)
            : m_state(std::in_place_type<Error>, error) {}

        explicit Result(std::in_place_type_t<Error>, Error&& error)
            : m_state(std::in_place_type<Error>, std::move(error)) {}

        std::variant<T, Error> m_state;
    };

    /// @brief Result of an operation that produces no value: success or an
    /// Error (client teardown, stream writes, backoff waits).
    template <>
    class [[nodiscard]] Result<void> {
       public:
        using value_type = void;

        static Result ok() { return Result(); }

        static Result err(const Error& error) { return Result(error); }

        static Result err(Error&& error) { return Result(std::move(error)); }

        explicit operator bool() const noexcept { return has_value(); }

        bool has_value() const noexcept { return !m_error.has_value(); }

        bool has_error() const noexcept { return m_error.has_value(); }

        const Error& error() const& {
            assert(m_error && "Result::error() called on a successful Result");
            return *m_error;
        }

        Error&& error() && {
            assert(m_error && "Result::error() called on a successful Result");
            return std::move(*m_error);
        }

        [[nodiscard]] const Error* error_ptr() const noexcept {
            return m_error ? &*m_error : nullptr;
        }

        const Error& error_or(const Error& fallback) const noexcept {
            return m_error ? *m_error : fallback;
        }

        template <typename U>
        Result<U> forward_error() const& {
            return Result<U>::err(error());
        }

       private:
        Result() = default;
        explicit Result(Error error) : m_error(std::move(error)) {}

        std::optional<Error> m_error;
    };

}  // namespace docwire
