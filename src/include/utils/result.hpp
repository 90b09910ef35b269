/**
 * @file result.hpp
 * @brief Value-or-error return type for operations whose failure is an expected outcome.
 *
 * `Result<T, E>` carries either a `T` or an error enum `E` with an optional message and
 * integer code. The host layer returns it from every cleanup sub-step so a failed step can be
 * recorded and logged without unwinding the caller:
 *
 * @code
 *  StepResult r = attempt_step([&] { binding.close_document(doc, false); });
 *  if (r.is_error())
 *      report.add("close", r.error_message());
 * @endcode
 *
 * Move-only, to avoid accidental copies of large payloads.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace hostkeeper::basics
{

template <typename T, typename E>
class Result
{
  public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value)
    {
        Result result;
        result.m_data = std::move(value);
        return result;
    }

    /**
     * @param err     Error category.
     * @param message Human-readable detail (may be empty).
     * @param code    Optional platform code (errno, HRESULT, ...).
     */
    [[nodiscard]] static Result error(E err, std::string message = {}, int code = 0)
    {
        Result result;
        result.m_data = ErrorData{err, std::move(message), code};
        return result;
    }

    // Default constructible (starts in error state with default error)
    Result() : m_data(ErrorData{E{}, {}, 0}) {}

    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    [[nodiscard]] bool is_ok() const noexcept { return std::holds_alternative<T>(m_data); }
    [[nodiscard]] bool is_error() const noexcept { return !is_ok(); }

    [[nodiscard]] T &content() &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    [[nodiscard]] const T &content() const &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    [[nodiscard]] T &&content() &&
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(std::move(m_data));
    }

    [[nodiscard]] T value_or(T default_value) const &
    {
        return is_ok() ? std::get<T>(m_data) : std::move(default_value);
    }

    [[nodiscard]] E error() const
    {
        return error_data("Result::error() called on success state").error_enum;
    }

    [[nodiscard]] const std::string &error_message() const
    {
        return error_data("Result::error_message() called on success state").message;
    }

    [[nodiscard]] int error_code() const
    {
        return error_data("Result::error_code() called on success state").error_code;
    }

  private:
    struct ErrorData
    {
        E error_enum;
        std::string message;
        int error_code;
    };

    const ErrorData &error_data(const char *what) const
    {
        if (is_ok())
        {
            throw std::logic_error(what);
        }
        return std::get<ErrorData>(m_data);
    }

    std::variant<T, ErrorData> m_data;
};

} // namespace hostkeeper::basics
