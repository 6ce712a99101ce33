/*

retry_policy.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Attempt budget and backoff for Postgres statements that fail because the
session was lost. The default matches the production store: three attempts,
waiting 2s then 4s, never more than 8s.

*/


#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <random>

namespace tokenxx::detail
{

struct retry_policy
{
    /// Total attempts including the first one (1 = no retry)
    unsigned int max_attempts = 3;

    std::chrono::milliseconds initial_delay{2000};
    std::chrono::milliseconds max_delay{8000};
    double backoff_multiplier = 2.0;

    /// Relative spread applied to every delay, 0.25 = +/-25%
    double jitter_factor = 0.0;

    static retry_policy disabled()
    {
        return retry_policy{.max_attempts = 1};
    }

    /// Same pause between all attempts
    static retry_policy fixed(unsigned int attempts, std::chrono::milliseconds delay)
    {
        return retry_policy{.max_attempts = attempts, .initial_delay = delay, .max_delay = delay, .backoff_multiplier = 1.0};
    }

    static retry_policy exponential_backoff(unsigned int attempts = 3,
        std::chrono::milliseconds initial = std::chrono::milliseconds{2000},
        std::chrono::milliseconds cap = std::chrono::milliseconds{8000},
        double multiplier = 2.0, double jitter = 0.0)
    {
        return retry_policy{attempts, initial, cap, multiplier, jitter};
    }

    /// Whether another attempt may follow failed attempt number `attempt` (1-based)
    [[nodiscard]] bool allows_retry(unsigned int attempt) const noexcept
    {
        return attempt < std::max(max_attempts, 1u);
    }

    /// Pause after failed attempt number `attempt` (1-based), capped at max_delay
    [[nodiscard]] std::chrono::milliseconds calculate_delay(unsigned int attempt) const
    {
        const double exponent = attempt > 1 ? static_cast<double>(attempt - 1) : 0.0;
        double delay_ms = std::min(static_cast<double>(initial_delay.count()) * std::pow(backoff_multiplier, exponent),
            static_cast<double>(max_delay.count()));

        if (jitter_factor > 0.0)
        {
            thread_local std::mt19937 rng(std::random_device{}());
            std::uniform_real_distribution<double> spread(1.0 - jitter_factor, 1.0 + jitter_factor);
            delay_ms *= spread(rng);
        }
        return std::min(std::chrono::milliseconds(static_cast<long long>(delay_ms)), max_delay);
    }
};

} // namespace tokenxx::detail
