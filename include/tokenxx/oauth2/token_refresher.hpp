/*

token_refresher.hpp
-------------------

Exchange of the long-lived credential for a fresh access token.

*/

#pragma once

#include <tokenxx/detail/result.hpp>
#include <tokenxx/oauth2/token.hpp>

namespace tokenxx::oauth2
{

class token_refresher
{
public:
    virtual ~token_refresher() = default;

    /**
    Perform one refresh exchange with the provider.

    @return The new access token and its upstream lifetime, or one of
            errc::rate_limited, errc::refresh_failed, errc::missing_access_token.
    **/
    virtual result<refreshed_token> refresh(const credentials& creds) = 0;
};

} // namespace tokenxx::oauth2
