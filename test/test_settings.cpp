/*

test_settings.cpp
-----------------

Environment-driven configuration.

*/

#define BOOST_TEST_MODULE settings_test

#include <boost/test/unit_test.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <tokenxx/settings.hpp>

namespace
{

tokenxx::settings::lookup_fn env_of(std::map<std::string, std::string, std::less<>> vars)
{
    return [vars = std::move(vars)](std::string_view name) -> std::optional<std::string>
    {
        auto it = vars.find(name);
        if (it == vars.end())
            return std::nullopt;
        return it->second;
    };
}

std::map<std::string, std::string, std::less<>> minimal()
{
    return {
        {"TOKENXX_REFRESH_TOKEN", "1000.refresh"},
        {"TOKENXX_CLIENT_ID", "client"},
        {"TOKENXX_CLIENT_SECRET", "secret"}};
}

} // namespace


BOOST_AUTO_TEST_CASE(defaults_from_minimal_environment)
{
    auto res = tokenxx::settings::from_env(env_of(minimal()));
    BOOST_REQUIRE(res.has_value());
    BOOST_TEST(res->coordinator.provider == "zoho");
    BOOST_TEST(res->coordinator.skew.count() == 120);
    BOOST_TEST(res->coordinator.default_cooldown.count() == 60000);
    BOOST_TEST(res->coordinator.poll_interval.count() == 500);
    BOOST_TEST(res->coordinator.poll_attempts == 30u);
    BOOST_TEST(res->refresher.endpoint_url == "https://accounts.zoho.com/oauth/v2/token");
    BOOST_TEST(res->refresher.timeout.count() == 15000);
    BOOST_TEST(res->credentials.refresh_token == "1000.refresh");
    BOOST_TEST(res->database_url.empty());
    BOOST_TEST(!res->state_dir.empty());
    BOOST_TEST((res->log_level == tokenxx::log::level::info));
}

BOOST_AUTO_TEST_CASE(missing_credential_is_reported)
{
    auto vars = minimal();
    vars.erase("TOKENXX_CLIENT_SECRET");
    auto res = tokenxx::settings::from_env(env_of(vars));
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(tokenxx::to_string(res.error().code) == "config_missing");
    BOOST_TEST(res.error().detail == "TOKENXX_CLIENT_SECRET");
}

BOOST_AUTO_TEST_CASE(overrides_are_applied)
{
    auto vars = minimal();
    vars["TOKENXX_PROVIDER"] = "zoho-eu";
    vars["TOKENXX_ACCOUNTS_DC"] = "eu";
    vars["TOKENXX_STATE_DIR"] = "/var/lib/tokenxx";
    vars["TOKENXX_LOG_LEVEL"] = "debug";
    vars["TOKENXX_SKEW_SECONDS"] = "30";
    vars["TOKENXX_COOLDOWN_MS"] = "90000";
    vars["TOKENXX_POLL_INTERVAL_MS"] = "250";
    vars["TOKENXX_POLL_ATTEMPTS"] = "10";
    vars["TOKENXX_HTTP_TIMEOUT_MS"] = "5000";

    auto res = tokenxx::settings::from_env(env_of(vars));
    BOOST_REQUIRE(res.has_value());
    BOOST_TEST(res->coordinator.provider == "zoho-eu");
    BOOST_TEST(res->refresher.endpoint_url == "https://accounts.zoho.eu/oauth/v2/token");
    BOOST_TEST(res->state_dir.string() == "/var/lib/tokenxx");
    BOOST_TEST((res->log_level == tokenxx::log::level::debug));
    BOOST_TEST(res->coordinator.skew.count() == 30);
    BOOST_TEST(res->coordinator.default_cooldown.count() == 90000);
    BOOST_TEST(res->coordinator.poll_interval.count() == 250);
    BOOST_TEST(res->coordinator.poll_attempts == 10u);
    BOOST_TEST(res->refresher.timeout.count() == 5000);
}

BOOST_AUTO_TEST_CASE(explicit_token_url_wins)
{
    auto vars = minimal();
    vars["TOKENXX_ACCOUNTS_DC"] = "eu";
    vars["TOKENXX_TOKEN_URL"] = "http://127.0.0.1:9000/token";
    auto res = tokenxx::settings::from_env(env_of(vars));
    BOOST_REQUIRE(res.has_value());
    BOOST_TEST(res->refresher.endpoint_url == "http://127.0.0.1:9000/token");
}

BOOST_AUTO_TEST_CASE(database_url_fallbacks)
{
    auto vars = minimal();
    vars["POSTGRES_URL"] = "postgres://pg/b";
    BOOST_TEST(tokenxx::settings::from_env(env_of(vars))->database_url == "postgres://pg/b");

    vars["DATABASE_URL"] = "postgres://db/a";
    BOOST_TEST(tokenxx::settings::from_env(env_of(vars))->database_url == "postgres://db/a");

    vars["TOKENXX_DATABASE_URL"] = "postgres://own/c";
    BOOST_TEST(tokenxx::settings::from_env(env_of(vars))->database_url == "postgres://own/c");
}

BOOST_AUTO_TEST_CASE(invalid_values_are_rejected)
{
    const std::pair<const char*, const char*> cases[] = {
        {"TOKENXX_SKEW_SECONDS", "-1"},
        {"TOKENXX_COOLDOWN_MS", "0"},
        {"TOKENXX_POLL_INTERVAL_MS", "fast"},
        {"TOKENXX_HTTP_TIMEOUT_MS", "10s"},
        {"TOKENXX_LOG_LEVEL", "chatty"},
        {"TOKENXX_TOKEN_URL", "accounts.zoho.com"}};

    for (const auto& [name, value] : cases)
    {
        auto vars = minimal();
        vars[name] = value;
        auto res = tokenxx::settings::from_env(env_of(vars));
        BOOST_TEST_CONTEXT(name)
        {
            BOOST_REQUIRE(!res.has_value());
            BOOST_TEST(res.error().is(tokenxx::errc::config_invalid));
        }
    }
}

BOOST_AUTO_TEST_CASE(out_of_range_timings_are_rejected)
{
    const std::pair<const char*, const char*> cases[] = {
        {"TOKENXX_POLL_ATTEMPTS", "4294967296"},
        {"TOKENXX_POLL_ATTEMPTS", "10001"},
        {"TOKENXX_COOLDOWN_MS", "9223372036854775807"},
        {"TOKENXX_COOLDOWN_MS", "86400001"},
        {"TOKENXX_SKEW_SECONDS", "9223372036854775807"},
        {"TOKENXX_SKEW_SECONDS", "3601"},
        {"TOKENXX_POLL_INTERVAL_MS", "60001"},
        {"TOKENXX_HTTP_TIMEOUT_MS", "99999999999999999999"}};

    for (const auto& [name, value] : cases)
    {
        auto vars = minimal();
        vars[name] = value;
        auto res = tokenxx::settings::from_env(env_of(vars));
        BOOST_TEST_CONTEXT(name << "=" << value)
        {
            BOOST_REQUIRE(!res.has_value());
            BOOST_TEST(res.error().is(tokenxx::errc::config_invalid));
        }
    }
}

BOOST_AUTO_TEST_CASE(timing_upper_bounds_are_accepted)
{
    auto vars = minimal();
    vars["TOKENXX_POLL_ATTEMPTS"] = "10000";
    vars["TOKENXX_COOLDOWN_MS"] = "86400000";
    vars["TOKENXX_SKEW_SECONDS"] = "3600";
    vars["TOKENXX_POLL_INTERVAL_MS"] = "60000";
    auto res = tokenxx::settings::from_env(env_of(vars));
    BOOST_REQUIRE(res.has_value());
    BOOST_TEST(res->coordinator.poll_attempts == 10000u);
    BOOST_TEST(res->coordinator.default_cooldown.count() == 86400000);
}

BOOST_AUTO_TEST_CASE(coordinator_config_bounds)
{
    using namespace std::chrono_literals;

    BOOST_TEST(tokenxx::coordinator_config{}.validate().has_value());
    BOOST_TEST(tokenxx::coordinator_config::fast().validate().has_value());

    auto attempts = tokenxx::coordinator_config::fast();
    attempts.poll_attempts = 4000000000u;
    BOOST_TEST(attempts.validate().error().is(tokenxx::errc::config_invalid));

    auto cooldown = tokenxx::coordinator_config::fast();
    cooldown.default_cooldown = 25h;
    BOOST_TEST(cooldown.validate().error().is(tokenxx::errc::config_invalid));

    auto skew = tokenxx::coordinator_config::fast();
    skew.skew = 2h;
    BOOST_TEST(skew.validate().error().is(tokenxx::errc::config_invalid));
}
