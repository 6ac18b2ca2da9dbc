/**
 * @file result.hpp
 * @brief Result<T, E>: a success value or an error enum with a detail message.
 *
 * Returned where failure is an expected outcome rather than a fault: a handoff
 * refused by the routing policy, a daemon start refused because another
 * instance holds the pid file, a session whose context document is missing.
 * No conversion to bool; callers ask is_ok() or is_error().
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace ctxhub::utils
{

/**
 * @code
 * auto r = mailbox.send("dev", "dash", "api_updated", "v2");
 * if (r.is_error())
 *     LOGGER_WARN("send refused ({}): {}", to_string(r.error()), r.error_message());
 * @endcode
 *
 * Accessing the side that is not held throws std::logic_error.
 */
template <typename T, typename E>
class Result
{
  public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value)
    {
        Result r;
        r.m_data.template emplace<T>(std::move(value));
        return r;
    }

    /// @p code is an optional errno-style detail; 0 when there is none.
    [[nodiscard]] static Result error(E err, std::string message = {}, int code = 0)
    {
        Result r;
        r.m_data = Failure{err, code, std::move(message)};
        return r;
    }

    /// A default Result is an error holding E{}.
    Result() = default;
    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    [[nodiscard]] bool is_ok() const noexcept { return m_data.index() == 1; }
    [[nodiscard]] bool is_error() const noexcept { return m_data.index() == 0; }

    [[nodiscard]] T &content() &
    {
        require_ok("content");
        return std::get<T>(m_data);
    }
    [[nodiscard]] const T &content() const &
    {
        require_ok("content");
        return std::get<T>(m_data);
    }
    [[nodiscard]] T &&content() &&
    {
        require_ok("content");
        return std::get<T>(std::move(m_data));
    }

    [[nodiscard]] T value_or(T fallback) const &
    {
        return is_ok() ? std::get<T>(m_data) : std::move(fallback);
    }

    [[nodiscard]] E error() const { return failure("error").kind; }
    [[nodiscard]] int error_code() const { return failure("error_code").code; }
    [[nodiscard]] const std::string &error_message() const
    {
        return failure("error_message").message;
    }

  private:
    struct Failure
    {
        E kind{};
        int code = 0;
        std::string message;
    };

    void require_ok(const char *accessor) const
    {
        if (!is_ok())
            throw std::logic_error(std::string("Result::") + accessor + "() on an error result");
    }

    const Failure &failure(const char *accessor) const
    {
        if (is_ok())
            throw std::logic_error(std::string("Result::") + accessor + "() on a success result");
        return std::get<Failure>(m_data);
    }

    std::variant<Failure, T> m_data;
};

/// Success payload for operations that return nothing on success.
struct Unit
{
};

} // namespace ctxhub::utils
