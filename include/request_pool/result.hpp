#pragma once

#include <cassert>
#include <type_traits>
#include <utility>
#include <variant>

#include "error.hpp"

namespace request_pool {

    /// @brief Result<T> holds either the value produced by a unit of pooled
    /// work or the Error that ended it.
    /// @tparam T The type of the successful value.
    /// @note Similar in spirit to std::expected<T, Error> from C++23. Work
    /// handed to a pool returns a Result so the connection can inspect the
    /// error and decide whether to reconnect, give up, or retire itself.
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

        /// @brief Create an error Result holding a copy of the given Error.
        static Result err(const Error& error) {
            return Result(std::in_place_type<Error>, error);
        }

        /// @brief Create an error Result taking ownership of the given Error.
        static Result err(Error&& error) {
            return Result(std::in_place_type<Error>, std::move(error));
        }

        /// @brief Shorthand for err(Error{code, message}).
        static Result err(Error::Code code, std::string message) {
            return Result(std::in_place_type<Error>,
                          Error{code, std::move(message)});
        }

        /// @brief `if (result)` means "if success".
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

        /// @brief Pointer to the stored Error, or nullptr on success.
        [[nodiscard]] const Error* error_ptr() const noexcept {
            return std::get_if<Error>(&m_state);
        }

        [[nodiscard]] Error* error_ptr() noexcept {
            return std::get_if<Error>(&m_state);
        }

        /// @brief Return the stored value, or the result of make_fallback()
        /// when this Result holds an Error. The fallback is built lazily.
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

        /// @brief Stored error if present, otherwise the given fallback.
        const Error& error_or(const Error& fallback) const noexcept {
            return has_error() ? *error_ptr() : fallback;
        }

       private:
        template <typename... Args>
        explicit Result(std::in_place_type_t<T>, Args&&... args)
            : m_state(std::in_place_type<T>, std::forward<Args>(args)...) {}

        explicit Result(std::in_place_type_t<Error>, const Error& error)
            : m_state(std::in_place_type<Error>, error) {}

        explicit Result(std::in_place_type_t<Error>, Error&& error)
            : m_state(std::in_place_type<Error>, std::move(error)) {}

        /// @brief Exactly one of {T, Error} is active at any time.
        std::variant<T, Error> m_state;
    };

    /// @brief Detects Result<T> specializations; pooled work must return one.
    template <typename>
    struct is_result : std::false_type {};

    template <typename T>
    struct is_result<Result<T>> : std::true_type {};

    template <typename T>
    inline constexpr bool is_result_v = is_result<T>::value;

}  // namespace request_pool
