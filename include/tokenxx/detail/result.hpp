/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
Coordinator, stores, locks and refreshers return result<T>; nothing in the
core path throws except on allocation failure.

*/

#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <format>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace tokenxx
{

/// Error categories for tokenxx operations
enum class errc : std::uint16_t
{
    ok = 0,

    // Coordination (100-199)
    rate_limited = 100,
    refresh_failed = 101,
    missing_access_token = 102,

    // Caller operations (200-299)
    invalid_token = 200,
    upstream_failed = 201,

    // Backends (300-399)
    store_failed = 300,
    lock_failed = 301,

    // Input validation and configuration (700-799)
    invalid_argument = 700,
    config_missing = 701,
    config_invalid = 702,

    // Internal errors (900-999)
    internal_error = 900,
};

[[nodiscard]] constexpr std::string_view to_string(errc code) noexcept
{
    switch (code)
    {
        case errc::ok: return "ok";
        case errc::rate_limited: return "rate_limited";
        case errc::refresh_failed: return "refresh_failed";
        case errc::missing_access_token: return "missing_access_token";
        case errc::invalid_token: return "invalid_token";
        case errc::upstream_failed: return "upstream_failed";
        case errc::store_failed: return "store_failed";
        case errc::lock_failed: return "lock_failed";
        case errc::invalid_argument: return "invalid_argument";
        case errc::config_missing: return "config_missing";
        case errc::config_invalid: return "config_invalid";
        case errc::internal_error: return "internal_error";
    }
    return "unknown";
}

/// Rich error value carried by result<T>
struct error_info
{
    errc code = errc::ok;
    std::string message;
    std::string detail;
    std::error_code sys;
    std::source_location where;

    /// Suggested wait before trying again (rate_limited only)
    std::chrono::milliseconds retry_after{0};

    /// Upstream HTTP status when the failure came from an HTTP exchange (0 = none)
    int http_status = 0;

    [[nodiscard]] bool is(errc c) const noexcept { return code == c; }

    /// Format error for display
    [[nodiscard]] std::string to_string() const
    {
        std::string out = std::format("[{}] {}", tokenxx::to_string(code), message);
        if (code == errc::rate_limited)
            out += std::format(" (retry after {}ms)", retry_after.count());
        if (http_status != 0)
            out += std::format(" (http {})", http_status);
        return out;
    }
};

template<class T>
using result = std::expected<T, error_info>;

namespace detail
{

[[nodiscard]] inline std::unexpected<error_info> make_unexpected(error_info info)
{
    return std::unexpected<error_info>(std::move(info));
}

} // namespace detail

[[nodiscard]] inline error_info make_error(errc code, std::string message, std::string detail = {},
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    error_info info;
    info.code = code;
    info.message = std::move(message);
    info.detail = std::move(detail);
    info.sys = sys;
    info.where = where;
    return info;
}

/// Build a rate_limited error; the delay is clamped at zero
[[nodiscard]] inline error_info make_rate_limited(std::chrono::milliseconds retry_after,
    std::string message = "upstream token endpoint is rate limited",
    std::source_location where = std::source_location::current())
{
    error_info info = make_error(errc::rate_limited, std::move(message), {}, {}, where);
    info.retry_after = retry_after.count() < 0 ? std::chrono::milliseconds{0} : retry_after;
    return info;
}

/// Helper to create successful result
template<typename T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

/// Helper to create void success
[[nodiscard]] inline result<void> ok()
{
    return result<void>{};
}

template<typename T = void>
[[nodiscard]] result<T> fail(error_info info)
{
    return detail::make_unexpected(std::move(info));
}

template<typename T = void>
[[nodiscard]] result<T> fail(errc code, std::string message, std::string detail = {},
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return detail::make_unexpected(make_error(code, std::move(message), std::move(detail), sys, where));
}

} // namespace tokenxx
