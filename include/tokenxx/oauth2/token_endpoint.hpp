/*

token_endpoint.hpp
------------------

Location of the OAuth token endpoint.

*/

#pragma once

#include <charconv>
#include <string>
#include <string_view>
#include <utility>

#include <tokenxx/detail/result.hpp>

namespace tokenxx::oauth2
{

/// Token URL of the Zoho accounts server for a data-centre suffix ("com", "eu", "in", ...)
[[nodiscard]] inline std::string accounts_token_url(std::string_view dc)
{
    std::string url = "https://accounts.zoho.";
    url.append(dc.empty() ? std::string_view("com") : dc);
    url += "/oauth/v2/token";
    return url;
}

struct token_endpoint
{
    std::string host;
    std::string service;
    std::string target = "/";
    bool use_tls = true;

    /// Host header value; the port is omitted when it is the scheme default
    [[nodiscard]] std::string host_header() const
    {
        if ((use_tls && service == "443") || (!use_tls && service == "80"))
            return host;
        return host + ":" + service;
    }

    /**
    Split an absolute http(s) URL.

    @return errc::config_invalid for another scheme, an empty host or a bad port.
    **/
    static result<token_endpoint> parse(std::string_view url)
    {
        token_endpoint ep;
        std::string_view rest;
        if (url.starts_with("https://"))
        {
            rest = url.substr(8);
            ep.use_tls = true;
            ep.service = "443";
        }
        else if (url.starts_with("http://"))
        {
            rest = url.substr(7);
            ep.use_tls = false;
            ep.service = "80";
        }
        else
            return fail<token_endpoint>(errc::config_invalid, "token endpoint must be an http(s) URL", std::string(url));

        const auto slash = rest.find('/');
        std::string_view authority = rest.substr(0, slash);
        if (slash != std::string_view::npos)
            ep.target = std::string(rest.substr(slash));

        if (const auto at = authority.rfind('@'); at != std::string_view::npos)
            return fail<token_endpoint>(errc::config_invalid, "token endpoint must not carry user info", std::string(url));

        if (const auto colon = authority.rfind(':'); colon != std::string_view::npos)
        {
            const std::string_view port = authority.substr(colon + 1);
            unsigned int value = 0;
            const auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
            if (port.empty() || ec != std::errc{} || ptr != port.data() + port.size() || value == 0 || value > 65535)
                return fail<token_endpoint>(errc::config_invalid, "invalid port in token endpoint", std::string(url));
            ep.service = std::string(port);
            authority = authority.substr(0, colon);
        }

        if (authority.empty())
            return fail<token_endpoint>(errc::config_invalid, "token endpoint has no host", std::string(url));
        ep.host = std::string(authority);
        return ok(std::move(ep));
    }
};

} // namespace tokenxx::oauth2
