/*

settings.hpp
------------

Process configuration read from TOKENXX_* environment variables.

*/

#pragma once

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <tokenxx/coordinator/coordinator_config.hpp>
#include <tokenxx/detail/log.hpp>
#include <tokenxx/detail/result.hpp>
#include <tokenxx/oauth2/refresher_config.hpp>
#include <tokenxx/oauth2/token.hpp>
#include <tokenxx/oauth2/token_endpoint.hpp>

namespace tokenxx
{

struct settings
{
    using lookup_fn = std::function<std::optional<std::string>(std::string_view)>;

    coordinator_config coordinator;
    oauth2::credentials credentials;
    oauth2::refresher_config refresher;

    /// libpq connection string; empty selects the file backends
    std::string database_url;

    /// Directory of the file backends
    std::filesystem::path state_dir;

    log::level log_level = log::level::info;

    /// Upper bound of TOKENXX_HTTP_TIMEOUT_MS
    static constexpr std::chrono::milliseconds max_http_timeout{10 * 60 * 1000};

    /// getenv-backed lookup; unset and empty variables both read as nullopt
    static std::optional<std::string> process_env(std::string_view name)
    {
        const std::string key(name);
        const char* value = std::getenv(key.c_str());
        if (value == nullptr || *value == '\0')
            return std::nullopt;
        return std::string(value);
    }

    /**
    Load settings.

    @param lookup Variable source, process_env by default.
    @return       errc::config_missing when a credential variable is absent,
                  errc::config_invalid for an unparsable or out-of-range value.
    **/
    static result<settings> from_env(const lookup_fn& lookup = process_env)
    {
        settings out;

        if (auto provider = lookup("TOKENXX_PROVIDER"))
            out.coordinator.provider = *provider;

        auto required = [&lookup](std::string_view name, std::string& target) -> result<void>
        {
            auto value = lookup(name);
            if (!value)
                return fail<void>(errc::config_missing, "required setting is not set", std::string(name));
            target = std::move(*value);
            return ok();
        };
        if (auto r = required("TOKENXX_REFRESH_TOKEN", out.credentials.refresh_token); !r)
            return fail<settings>(std::move(r).error());
        if (auto r = required("TOKENXX_CLIENT_ID", out.credentials.client_id); !r)
            return fail<settings>(std::move(r).error());
        if (auto r = required("TOKENXX_CLIENT_SECRET", out.credentials.client_secret); !r)
            return fail<settings>(std::move(r).error());

        if (auto url = lookup("TOKENXX_TOKEN_URL"))
            out.refresher.endpoint_url = *url;
        else
            out.refresher.endpoint_url = oauth2::accounts_token_url(lookup("TOKENXX_ACCOUNTS_DC").value_or("com"));
        if (auto endpoint = oauth2::token_endpoint::parse(out.refresher.endpoint_url); !endpoint)
            return fail<settings>(std::move(endpoint).error());

        for (std::string_view name : {"TOKENXX_DATABASE_URL", "DATABASE_URL", "POSTGRES_URL"})
        {
            if (auto url = lookup(name))
            {
                out.database_url = *url;
                break;
            }
        }

        if (auto dir = lookup("TOKENXX_STATE_DIR"))
            out.state_dir = *dir;
        else
            out.state_dir = default_state_dir();

        if (auto name = lookup("TOKENXX_LOG_LEVEL"))
        {
            auto lvl = log::level_from_string(*name);
            if (!lvl)
                return fail<settings>(errc::config_invalid, "unknown log level", "TOKENXX_LOG_LEVEL=" + *name);
            out.log_level = *lvl;
        }

        auto number = [&lookup](std::string_view name, std::int64_t min_value, std::int64_t max_value,
            auto apply) -> result<void>
        {
            auto text = lookup(name);
            if (!text)
                return ok();
            std::int64_t value = 0;
            const auto [ptr, ec] = std::from_chars(text->data(), text->data() + text->size(), value);
            if (ec != std::errc{} || ptr != text->data() + text->size()
                || value < min_value || value > max_value)
                return fail<void>(errc::config_invalid, "invalid numeric setting", std::string(name) + "=" + *text);
            apply(value);
            return ok();
        };

        auto& coord = out.coordinator;
        auto& refresher = out.refresher;
        for (auto r : {
                 number("TOKENXX_SKEW_SECONDS", 0, coordinator_config::max_skew.count(),
                     [&](std::int64_t v) { coord.skew = std::chrono::seconds{v}; }),
                 number("TOKENXX_COOLDOWN_MS", 1, coordinator_config::max_cooldown.count(),
                     [&](std::int64_t v) { coord.default_cooldown = std::chrono::milliseconds{v}; }),
                 number("TOKENXX_POLL_INTERVAL_MS", 1, coordinator_config::max_poll_interval.count(),
                     [&](std::int64_t v) { coord.poll_interval = std::chrono::milliseconds{v}; }),
                 number("TOKENXX_POLL_ATTEMPTS", 0, coordinator_config::max_poll_attempts,
                     [&](std::int64_t v) { coord.poll_attempts = static_cast<unsigned int>(v); }),
                 number("TOKENXX_HTTP_TIMEOUT_MS", 1, max_http_timeout.count(),
                     [&](std::int64_t v) { refresher.timeout = std::chrono::milliseconds{v}; })})
        {
            if (!r)
                return fail<settings>(std::move(r).error());
        }

        if (auto valid = out.coordinator.validate(); !valid)
            return fail<settings>(std::move(valid).error());
        return ok(std::move(out));
    }

private:
    static std::filesystem::path default_state_dir()
    {
        std::error_code ec;
        auto tmp = std::filesystem::temp_directory_path(ec);
        if (ec)
            tmp = "/tmp";
        return tmp / "tokenxx";
    }
};

} // namespace tokenxx
