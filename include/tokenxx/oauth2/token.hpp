/*

token.hpp
---------

OAuth2 token types shared by the coordinator, the stores and the refreshers.

*/

#pragma once

#include <chrono>
#include <string>

namespace tokenxx::oauth2
{

/// Long-lived credential set used to mint access tokens
struct credentials
{
    std::string refresh_token;
    std::string client_id;
    std::string client_secret;

    [[nodiscard]] bool complete() const noexcept
    {
        return !refresh_token.empty() && !client_id.empty() && !client_secret.empty();
    }
};

/// Access token as stored in the shared token state
struct cached_token
{
    std::string access_token;

    /// Already reduced by the coordinator skew
    std::chrono::system_clock::time_point expires_at{};

    [[nodiscard]] bool expired(std::chrono::system_clock::time_point now) const noexcept
    {
        return access_token.empty() || expires_at <= now;
    }
};

/// Outcome of one exchange with the token endpoint
struct refreshed_token
{
    std::string access_token;
    std::chrono::seconds lifetime{0};
};

} // namespace tokenxx::oauth2
