/*

token_state_store.hpp
---------------------

Durable record of the shared access token and of the provider cooldown.
Every instance talks to the same store; implementations must give atomic
single-record upserts.

*/

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <tokenxx/detail/result.hpp>
#include <tokenxx/oauth2/token.hpp>

namespace tokenxx::state
{

using clock = std::chrono::system_clock;

/// How far into the past invalidate_token() pushes the stored expiry
inline constexpr std::chrono::hours invalidation_offset{24};

class token_state_store
{
public:
    virtual ~token_state_store() = default;

    /**
    Read the shared cooldown.

    @return Instant until which refreshes are suppressed, the epoch when unset.
    **/
    virtual result<clock::time_point> read_cooldown() = 0;

    /**
    Extend the shared cooldown. A value earlier than the stored one leaves
    the stored one in place.
    **/
    virtual result<void> write_cooldown(clock::time_point until) = 0;

    /// Current token record, nullopt when no refresh ever succeeded
    virtual result<std::optional<oauth2::cached_token>> read_token() = 0;

    /**
    Upsert the token record.

    @return errc::invalid_argument for an empty token or an expiry at or
            before the epoch.
    **/
    virtual result<void> write_token(const std::string& access_token, clock::time_point expires_at) = 0;

    /// Force the stored expiry into the past; the record is kept
    virtual result<void> invalidate_token() = 0;
};

/// Validation shared by all write_token() implementations
[[nodiscard]] inline result<void> check_token_write(const std::string& access_token, clock::time_point expires_at)
{
    if (access_token.empty())
        return fail<void>(errc::invalid_argument, "refusing to store an empty access token");
    if (expires_at.time_since_epoch().count() <= 0)
        return fail<void>(errc::invalid_argument, "refusing to store a token without a valid expiry");
    return ok();
}

[[nodiscard]] inline std::int64_t to_epoch_ms(clock::time_point tp) noexcept
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

[[nodiscard]] inline clock::time_point from_epoch_ms(std::int64_t ms) noexcept
{
    return clock::time_point{std::chrono::duration_cast<clock::duration>(std::chrono::milliseconds{ms})};
}

} // namespace tokenxx::state
