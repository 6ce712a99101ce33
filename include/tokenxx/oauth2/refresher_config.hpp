/*

refresher_config.hpp
--------------------

Settings of the HTTP token refresher.

*/

#pragma once

#include <chrono>
#include <string>

#include <tokenxx/config.hpp>
#include <tokenxx/net/tls_options.hpp>
#include <tokenxx/oauth2/token_endpoint.hpp>
#include <tokenxx/oauth2/token_response.hpp>

namespace tokenxx::oauth2
{

struct refresher_config
{
    std::string endpoint_url = accounts_token_url("com");

    /// Lifetime assumed when the response has no usable expires_in
    std::chrono::seconds fallback_lifetime = default_fallback_lifetime;

    /// Bound on the whole exchange, resolve to last byte read
    std::chrono::milliseconds timeout{15000};

    net::tls_options tls;
    std::string user_agent = "tokenxx/" TOKENXX_VERSION_STRING;
};

} // namespace tokenxx::oauth2
