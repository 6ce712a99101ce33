/*

pg_store.hpp
------------

PostgreSQL token state store. One row per provider in oauth_tokens and
oauth_state; every write is a single INSERT ... ON CONFLICT DO UPDATE, so
concurrent instances never observe a partially written record.

*/

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <tokenxx/pg/connection.hpp>
#include <tokenxx/state/token_state_store.hpp>

namespace tokenxx::state
{

/// Tables used by pg_store; the same text ships as sql/schema.sql
inline constexpr std::string_view pg_schema_sql = R"sql(
CREATE TABLE IF NOT EXISTS oauth_tokens (
  provider        TEXT PRIMARY KEY,
  access_token    TEXT NOT NULL,
  expires_at      TIMESTAMPTZ NOT NULL,
  updated_at      TIMESTAMPTZ NOT NULL DEFAULT NOW()
);

CREATE TABLE IF NOT EXISTS oauth_state (
  provider        TEXT PRIMARY KEY,
  backoff_until   TIMESTAMPTZ,
  updated_at      TIMESTAMPTZ NOT NULL DEFAULT NOW()
);
)sql";

class pg_store : public token_state_store
{
public:
    pg_store(std::string conninfo, std::string provider,
        detail::retry_policy policy = detail::retry_policy::exponential_backoff())
        : conn_(std::move(conninfo), policy),
          provider_(std::move(provider))
    {
    }

    pg_store(const pg_store&) = delete;
    pg_store& operator=(const pg_store&) = delete;

    [[nodiscard]] const std::string& provider() const noexcept { return provider_; }

    /// Create the tables when missing and seed the provider's cooldown row
    result<void> ensure_schema()
    {
        std::lock_guard lock(mutex_);
        auto created = conn_.exec(pg_schema_sql);
        if (!created)
            return fail<void>(std::move(created).error());

        auto seeded = conn_.exec(
            "insert into oauth_state (provider, backoff_until) values ($1, null) "
            "on conflict (provider) do nothing",
            {provider_});
        if (!seeded)
            return fail<void>(std::move(seeded).error());
        return ok();
    }

    result<clock::time_point> read_cooldown() override
    {
        std::lock_guard lock(mutex_);
        auto res = conn_.exec(
            "select (extract(epoch from backoff_until) * 1000)::bigint "
            "from oauth_state where provider = $1",
            {provider_});
        if (!res)
            return fail<clock::time_point>(std::move(res).error());

        const auto ms = pg::cell_int64(*res, 0, 0);
        return ok(ms ? from_epoch_ms(*ms) : clock::time_point{});
    }

    result<void> write_cooldown(clock::time_point until) override
    {
        std::lock_guard lock(mutex_);
        auto res = conn_.exec(
            "insert into oauth_state (provider, backoff_until, updated_at) "
            "values ($1, to_timestamp($2::bigint / 1000.0), now()) "
            "on conflict (provider) do update "
            "set backoff_until = greatest(oauth_state.backoff_until, excluded.backoff_until), "
            "updated_at = now()",
            {provider_, std::to_string(to_epoch_ms(until))});
        if (!res)
            return fail<void>(std::move(res).error());
        return ok();
    }

    result<std::optional<oauth2::cached_token>> read_token() override
    {
        std::lock_guard lock(mutex_);
        auto res = conn_.exec(
            "select access_token, (extract(epoch from expires_at) * 1000)::bigint "
            "from oauth_tokens where provider = $1",
            {provider_});
        if (!res)
            return fail<std::optional<oauth2::cached_token>>(std::move(res).error());

        const auto token = pg::cell(*res, 0, 0);
        const auto expires_ms = pg::cell_int64(*res, 0, 1);
        if (!token || !expires_ms)
            return ok(std::optional<oauth2::cached_token>{});
        return ok(std::optional<oauth2::cached_token>{
            oauth2::cached_token{std::string(*token), from_epoch_ms(*expires_ms)}});
    }

    result<void> write_token(const std::string& access_token, clock::time_point expires_at) override
    {
        if (auto valid = check_token_write(access_token, expires_at); !valid)
            return valid;

        std::lock_guard lock(mutex_);
        auto res = conn_.exec(
            "insert into oauth_tokens (provider, access_token, expires_at, updated_at) "
            "values ($1, $2, to_timestamp($3::bigint / 1000.0), now()) "
            "on conflict (provider) do update "
            "set access_token = excluded.access_token, expires_at = excluded.expires_at, updated_at = now()",
            {provider_, access_token, std::to_string(to_epoch_ms(expires_at))});
        if (!res)
            return fail<void>(std::move(res).error());
        return ok();
    }

    result<void> invalidate_token() override
    {
        std::lock_guard lock(mutex_);
        auto res = conn_.exec(
            "update oauth_tokens set expires_at = now() - interval '1 day', updated_at = now() "
            "where provider = $1",
            {provider_});
        if (!res)
            return fail<void>(std::move(res).error());
        return ok();
    }

private:
    std::mutex mutex_;
    pg::connection conn_;
    std::string provider_;
};

} // namespace tokenxx::state
