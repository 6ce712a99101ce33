/*

token_coordinator.hpp
---------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Shared access token for every instance holding the same upstream credential.
The store carries the token and the provider cooldown, the distributed mutex
elects the single instance allowed to call the refresher, everybody else
polls the store until the new token shows up.

*/

#pragma once

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include <tokenxx/coordinator/coordinator_config.hpp>
#include <tokenxx/detail/exception_bridge.hpp>
#include <tokenxx/detail/log.hpp>
#include <tokenxx/detail/redact.hpp>
#include <tokenxx/detail/result.hpp>
#include <tokenxx/lock/distributed_mutex.hpp>
#include <tokenxx/oauth2/token.hpp>
#include <tokenxx/oauth2/token_refresher.hpp>
#include <tokenxx/oauth2/token_response.hpp>
#include <tokenxx/state/token_state_store.hpp>

namespace tokenxx
{

class token_coordinator
{
public:
    using clock = std::chrono::system_clock;

    token_coordinator(state::token_state_store& store, lock::distributed_mutex& mutex,
        oauth2::token_refresher& refresher, oauth2::credentials credentials,
        coordinator_config config = {})
        : store_(store),
          mutex_(mutex),
          refresher_(refresher),
          credentials_(std::move(credentials)),
          config_(std::move(config))
    {
    }

    token_coordinator(const token_coordinator&) = delete;
    token_coordinator& operator=(const token_coordinator&) = delete;

    [[nodiscard]] const coordinator_config& config() const noexcept { return config_; }

    /**
    Return a valid access token, refreshing it at most once across all
    instances.

    @return The token, or errc::rate_limited with retry_after while the
            provider cooldown is active or the refreshing instance did not
            finish in time. Refresher and backend errors are passed through.
    **/
    result<std::string> get_shared_access_token()
    {
        const auto now = clock::now();

        auto cooldown = store_.read_cooldown();
        if (!cooldown)
            return fail<std::string>(std::move(cooldown).error());
        if (now < *cooldown)
        {
            TOKENXX_DEBUG("provider '" + config_.provider + "' is cooling down");
            return fail<std::string>(cooling_down(*cooldown, now));
        }

        auto cached = store_.read_token();
        if (!cached)
            return fail<std::string>(std::move(cached).error());
        if (*cached && !(*cached)->expired(now))
            return ok(std::move((*cached)->access_token));

        auto acquired = mutex_.try_acquire(config_.provider);
        if (!acquired)
            return fail<std::string>(std::move(acquired).error());
        if (*acquired)
            return refresh_as_leader();
        return wait_for_refresh();
    }

    /// Force the shared token to be refreshed on the next call; takes no lock
    result<void> invalidate_token()
    {
        TOKENXX_INFO("invalidating shared access token of provider '" + config_.provider + "'");
        return store_.invalidate_token();
    }

private:
    [[nodiscard]] static error_info cooling_down(clock::time_point until, clock::time_point now)
    {
        return make_rate_limited(std::chrono::ceil<std::chrono::milliseconds>(until - now),
            "provider cooldown is active");
    }

    result<std::string> refresh_as_leader()
    {
        lock::scoped_release guard(mutex_, config_.provider);

        // The previous holder may have stored a token between our read and the acquire.
        auto current = store_.read_token();
        if (!current)
            return fail<std::string>(std::move(current).error());
        if (*current && !(*current)->expired(clock::now()))
            return ok(std::move((*current)->access_token));

        TOKENXX_INFO("refreshing shared access token of provider '" + config_.provider + "'");

        auto refreshed = protect([this] { return refresher_.refresh(credentials_); }, errc::refresh_failed);
        if (!refreshed)
        {
            error_info err = std::move(refreshed).error();
            if (!err.is(errc::rate_limited))
            {
                TOKENXX_ERROR("token refresh failed: " + err.to_string());
                return fail<std::string>(std::move(err));
            }

            const auto until = clock::now() + config_.default_cooldown;
            if (auto written = store_.write_cooldown(until); !written)
                TOKENXX_ERROR("cannot record provider cooldown: " + written.error().to_string());
            TOKENXX_WARN("token endpoint rate limited the refresh, cooling down for "
                + std::to_string(config_.default_cooldown.count()) + "ms");

            error_info limited = make_rate_limited(config_.default_cooldown);
            limited.detail = std::move(err.detail);
            limited.http_status = err.http_status;
            return fail<std::string>(std::move(limited));
        }

        oauth2::refreshed_token token = std::move(refreshed).value();
        token.lifetime = std::clamp(token.lifetime, std::chrono::seconds{0}, oauth2::max_token_lifetime);
        const auto expires_at = clock::now() + token.lifetime - config_.skew;
        if (auto written = store_.write_token(token.access_token, expires_at); !written)
        {
            TOKENXX_ERROR("cannot store refreshed access token: " + written.error().to_string());
            return fail<std::string>(std::move(written).error());
        }

        TOKENXX_INFO("stored access token " + detail::mask_secret(token.access_token) + ", upstream lifetime "
            + std::to_string(token.lifetime.count()) + "s");
        return ok(std::move(token.access_token));
    }

    result<std::string> wait_for_refresh()
    {
        TOKENXX_DEBUG("another instance is refreshing the token of provider '" + config_.provider + "', waiting");
        for (unsigned int attempt = 0; attempt < config_.poll_attempts; ++attempt)
        {
            std::this_thread::sleep_for(config_.poll_interval);
            const auto now = clock::now();

            auto cooldown = store_.read_cooldown();
            if (!cooldown)
                return fail<std::string>(std::move(cooldown).error());
            if (now < *cooldown)
                return fail<std::string>(cooling_down(*cooldown, now));

            auto cached = store_.read_token();
            if (!cached)
                return fail<std::string>(std::move(cached).error());
            if (*cached && !(*cached)->expired(now))
                return ok(std::move((*cached)->access_token));
        }

        TOKENXX_WARN("gave up waiting for the token refresh of provider '" + config_.provider + "'");
        return fail<std::string>(make_rate_limited(config_.default_cooldown,
            "timed out waiting for another instance to refresh the token"));
    }

    state::token_state_store& store_;
    lock::distributed_mutex& mutex_;
    oauth2::token_refresher& refresher_;
    oauth2::credentials credentials_;
    coordinator_config config_;
};

} // namespace tokenxx
