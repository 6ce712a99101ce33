/*

coordinator/coordinator_config.hpp
----------------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <string>
#include <utility>

#include <tokenxx/config.hpp>
#include <tokenxx/detail/result.hpp>

namespace tokenxx
{

/**
 * Timing and identity of the shared-token coordinator.
 */
struct coordinator_config
{
    /// Provider identity; names the lock and the stored records
    std::string provider = TOKENXX_DEFAULT_PROVIDER;

    /// Subtracted from the upstream lifetime when a token is stored
    std::chrono::seconds skew{120};

    /// Cooldown written after the provider rate-limits a refresh
    std::chrono::milliseconds default_cooldown{60000};

    /// Sleep between polls while another instance refreshes
    std::chrono::milliseconds poll_interval{500};

    /// Polls before giving up on the other instance
    unsigned int poll_attempts = 30;

    static constexpr std::chrono::seconds max_skew{60 * 60};
    static constexpr std::chrono::milliseconds max_cooldown{24 * 60 * 60 * 1000};
    static constexpr std::chrono::milliseconds max_poll_interval{60 * 1000};
    static constexpr unsigned int max_poll_attempts = 10000;

    // ==================== Factory Methods ====================

    /// Short timings for tests and local tools
    static coordinator_config fast(std::string provider = TOKENXX_DEFAULT_PROVIDER)
    {
        coordinator_config cfg;
        cfg.provider = std::move(provider);
        cfg.default_cooldown = std::chrono::milliseconds{1000};
        cfg.poll_interval = std::chrono::milliseconds{10};
        cfg.poll_attempts = 20;
        return cfg;
    }

    [[nodiscard]] result<void> validate() const
    {
        if (provider.empty())
            return fail<void>(errc::config_invalid, "provider must not be empty");
        if (skew.count() < 0 || skew > max_skew)
            return fail<void>(errc::config_invalid, "skew out of range", "0..3600 s");
        if (default_cooldown.count() <= 0 || default_cooldown > max_cooldown)
            return fail<void>(errc::config_invalid, "default cooldown out of range", "1..86400000 ms");
        if (poll_interval.count() <= 0 || poll_interval > max_poll_interval)
            return fail<void>(errc::config_invalid, "poll interval out of range", "1..60000 ms");
        if (poll_attempts > max_poll_attempts)
            return fail<void>(errc::config_invalid, "too many poll attempts", "at most 10000");
        return ok();
    }
};

} // namespace tokenxx
