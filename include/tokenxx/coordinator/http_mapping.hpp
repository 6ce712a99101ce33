/*

http_mapping.hpp
----------------

Translation of coordinator and upstream failures into the response a
service in front of them should send.

*/

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <boost/json.hpp>

#include <tokenxx/detail/result.hpp>

namespace tokenxx
{

struct http_failure
{
    int status = 500;

    /// Whole seconds for the Retry-After header, set for 503 only
    std::optional<std::int64_t> retry_after_seconds;

    /// JSON body
    std::string body;
};

/// Milliseconds rounded up to whole seconds
[[nodiscard]] constexpr std::int64_t retry_after_header_seconds(std::chrono::milliseconds ms) noexcept
{
    if (ms.count() <= 0)
        return 0;
    return (ms.count() + 999) / 1000;
}

/**
Map an error to an HTTP status and body.

rate_limited gives 503 with Retry-After, invalid_token gives 401,
refresh_failed, missing_access_token and upstream_failed give 502,
anything else 500.
**/
[[nodiscard]] inline http_failure map_to_http(const error_info& err)
{
    http_failure out;
    boost::json::object body;
    body["code"] = std::string(to_string(err.code));

    switch (err.code)
    {
        case errc::rate_limited:
            out.status = 503;
            out.retry_after_seconds = retry_after_header_seconds(err.retry_after);
            body["error"] = "Upstream rate limited by the OAuth provider";
            body["retryAfterMs"] = err.retry_after.count();
            break;
        case errc::invalid_token:
            out.status = 401;
            body["error"] = "Upstream rejected the access token";
            break;
        case errc::refresh_failed:
        case errc::missing_access_token:
        case errc::upstream_failed:
            out.status = 502;
            body["error"] = err.message;
            break;
        default:
            out.status = 500;
            body["error"] = err.message;
            break;
    }

    if (err.http_status != 0)
        body["upstreamStatus"] = err.http_status;
    if (!err.detail.empty())
        body["details"] = err.detail;

    out.body = boost::json::serialize(body);
    return out;
}

} // namespace tokenxx
