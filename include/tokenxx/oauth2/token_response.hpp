/*

token_response.hpp
------------------

Classification of a token endpoint response. Kept free of any I/O so every
branch is reachable from tests.

*/

#pragma once

#include <algorithm>
#include <charconv>
#include <cmath>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <boost/json.hpp>

#include <tokenxx/detail/error_detail.hpp>
#include <tokenxx/detail/redact.hpp>
#include <tokenxx/detail/result.hpp>
#include <tokenxx/oauth2/token.hpp>

namespace tokenxx::oauth2
{

/// Lifetime assumed when the provider omits expires_in
inline constexpr std::chrono::seconds default_fallback_lifetime{50 * 60};

/// Longest lifetime taken from a provider; larger expires_in values are capped
inline constexpr std::chrono::seconds max_token_lifetime{24 * 60 * 60};

/// Provider marker for throttling, matched case-insensitively in any body
inline constexpr std::string_view rate_limit_marker = "too many requests";

namespace detail
{

/// expires_in in seconds capped at max_token_lifetime, 0 when unusable
[[nodiscard]] inline std::int64_t expires_in_seconds(const boost::json::value* value) noexcept
{
    constexpr std::int64_t ceiling = max_token_lifetime.count();
    if (value == nullptr)
        return 0;
    if (value->is_int64())
        return std::clamp<std::int64_t>(value->as_int64(), 0, ceiling);
    if (value->is_uint64())
        return value->as_uint64() > static_cast<std::uint64_t>(ceiling) ? ceiling : static_cast<std::int64_t>(value->as_uint64());
    if (value->is_double())
    {
        // range check before the cast, out-of-range conversion is undefined
        const double seconds = value->as_double();
        if (!std::isfinite(seconds) || seconds <= 0.0)
            return 0;
        return seconds >= static_cast<double>(ceiling) ? ceiling : static_cast<std::int64_t>(seconds);
    }
    if (value->is_string())
    {
        const auto& text = value->as_string();
        std::int64_t parsed = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
        if (ec == std::errc::result_out_of_range)
            return !text.empty() && text.front() == '-' ? 0 : ceiling;
        if (ec == std::errc{} && ptr == text.data() + text.size())
            return std::clamp<std::int64_t>(parsed, 0, ceiling);
    }
    return 0;
}

} // namespace detail

/**
Turn a token endpoint response into a refreshed token or an error.

@param status            HTTP status code.
@param body              Response body.
@param fallback_lifetime Lifetime used when expires_in is missing or not positive;
                         larger values are capped at max_token_lifetime.
@return                  rate_limited for 429 or a throttling marker in the body,
                         refresh_failed for other non-2xx statuses,
                         missing_access_token for a 2xx without a usable token.
**/
[[nodiscard]] inline result<refreshed_token> parse_token_response(int status, std::string_view body,
    std::chrono::seconds fallback_lifetime = default_fallback_lifetime)
{
    if (status == 429 || tokenxx::detail::contains_ci(body, rate_limit_marker))
    {
        error_info info = make_rate_limited(std::chrono::milliseconds{0});
        info.http_status = status;
        info.detail = tokenxx::detail::error_detail().add_int("status", status).add_body("body", body).str();
        return fail<refreshed_token>(std::move(info));
    }

    if (status < 200 || status > 299)
    {
        error_info info = make_error(errc::refresh_failed, "token endpoint rejected the refresh",
            tokenxx::detail::error_detail().add_int("status", status).add_body("body", body).str());
        info.http_status = status;
        return fail<refreshed_token>(std::move(info));
    }

    boost::system::error_code ec;
    const boost::json::value root = boost::json::parse(body, ec);
    if (ec || !root.is_object())
        return fail<refreshed_token>(errc::missing_access_token, "token endpoint returned a non-JSON body",
            tokenxx::detail::error_detail().add_int("status", status).add_body("body", body).str());

    const auto& obj = root.as_object();
    const auto* token = obj.if_contains("access_token");
    if (token == nullptr || !token->is_string() || token->as_string().empty())
        return fail<refreshed_token>(errc::missing_access_token, "no access_token in token response",
            tokenxx::detail::error_detail().add_int("status", status).add_body("body", body).str());

    const std::int64_t expires_in = detail::expires_in_seconds(obj.if_contains("expires_in"));

    refreshed_token out;
    out.access_token = std::string(token->as_string());
    out.lifetime = expires_in > 0 ? std::chrono::seconds{expires_in} : fallback_lifetime;
    return ok(std::move(out));
}

} // namespace tokenxx::oauth2
