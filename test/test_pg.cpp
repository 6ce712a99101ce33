/*

test_pg.cpp
-----------

PostgreSQL store and advisory mutex. Cases needing a server run only when
TOKENXX_TEST_DATABASE_URL holds a libpq connection string; without one a
plain ctest run skips them and none of the SQL reaches a server. Point the
tests at a scratch database either way:

    TOKENXX_TEST_DATABASE_URL="host=localhost dbname=tokenxx_test" ctest -R test_pg
    cmake -DTOKENXX_TEST_DATABASE_URL="host=localhost dbname=tokenxx_test" ...

*/

#define BOOST_TEST_MODULE pg_test

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>

#include <unistd.h>

#include <tokenxx/coordinator/token_coordinator.hpp>
#include <tokenxx/lock/pg_advisory_mutex.hpp>
#include <tokenxx/state/pg_store.hpp>
#include "test_support.hpp"

using namespace std::chrono_literals;
namespace utf = boost::unit_test;

namespace
{

std::string database_url()
{
    const char* url = std::getenv("TOKENXX_TEST_DATABASE_URL");
    return url != nullptr ? std::string(url) : std::string();
}

utf::assertion_result database_configured(utf::test_unit_id)
{
    utf::assertion_result res(!database_url().empty());
    res.message() << "TOKENXX_TEST_DATABASE_URL is not set";
    return res;
}

// Rows are keyed by provider, so each run works on its own rows.
std::string unique_provider(const std::string& suffix)
{
    return "tokenxx-test-" + std::to_string(::getpid()) + "-" + suffix;
}

const std::string unreachable = "host=127.0.0.1 port=1 connect_timeout=1";

} // namespace


BOOST_AUTO_TEST_CASE(advisory_key_is_stable)
{
    static_assert(tokenxx::lock::advisory_key("zoho") == tokenxx::lock::advisory_key("zoho"));
    BOOST_TEST(tokenxx::lock::advisory_key("") == static_cast<std::int32_t>(2166136261u));
    BOOST_TEST(tokenxx::lock::advisory_key("zoho") != tokenxx::lock::advisory_key("zoho-eu"));
}

BOOST_AUTO_TEST_CASE(shipped_schema_matches_embedded_schema)
{
    std::ifstream in(TOKENXX_SCHEMA_FILE);
    BOOST_REQUIRE(in.good());
    const std::string file((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    BOOST_TEST(file.find(tokenxx::state::pg_schema_sql) != std::string::npos);
}

BOOST_AUTO_TEST_CASE(unreachable_server_is_store_error)
{
    tokenxx::state::pg_store store(unreachable, "zoho", tokenxx::detail::retry_policy::disabled());
    auto cooldown = store.read_cooldown();
    BOOST_REQUIRE(!cooldown.has_value());
    BOOST_TEST(cooldown.error().is(tokenxx::errc::store_failed));
}

BOOST_AUTO_TEST_CASE(unreachable_server_is_lock_error)
{
    tokenxx::lock::pg_advisory_mutex mutex(unreachable);
    auto acquired = mutex.try_acquire("zoho");
    BOOST_REQUIRE(!acquired.has_value());
    BOOST_TEST(acquired.error().is(tokenxx::errc::lock_failed));
}

BOOST_AUTO_TEST_CASE(token_round_trip, *utf::precondition(database_configured))
{
    tokenxx::state::pg_store store(database_url(), unique_provider("token"));
    BOOST_REQUIRE(store.ensure_schema().has_value());

    auto empty = store.read_token();
    BOOST_REQUIRE(empty.has_value());
    BOOST_TEST(!empty->has_value());

    const auto expires = std::chrono::system_clock::now() + 1h;
    BOOST_REQUIRE(store.write_token("1000.abc", expires).has_value());
    BOOST_REQUIRE(store.write_token("1000.def", expires).has_value());

    auto stored = store.read_token();
    BOOST_REQUIRE(stored.has_value());
    BOOST_REQUIRE(stored->has_value());
    BOOST_TEST((*stored)->access_token == "1000.def");
    const auto drift = std::chrono::abs((*stored)->expires_at - expires);
    BOOST_TEST((drift < 2ms));

    BOOST_REQUIRE(store.invalidate_token().has_value());
    auto invalidated = store.read_token();
    BOOST_REQUIRE(invalidated.has_value());
    BOOST_REQUIRE(invalidated->has_value());
    BOOST_TEST((*invalidated)->expired(std::chrono::system_clock::now()));
}

BOOST_AUTO_TEST_CASE(cooldown_only_moves_forward, *utf::precondition(database_configured))
{
    tokenxx::state::pg_store store(database_url(), unique_provider("cooldown"));
    BOOST_REQUIRE(store.ensure_schema().has_value());

    auto initial = store.read_cooldown();
    BOOST_REQUIRE(initial.has_value());
    BOOST_TEST((*initial == tokenxx::state::clock::time_point{}));

    const auto later = std::chrono::system_clock::now() + 10min;
    BOOST_REQUIRE(store.write_cooldown(later).has_value());
    BOOST_REQUIRE(store.write_cooldown(later - 5min).has_value());

    auto current = store.read_cooldown();
    BOOST_REQUIRE(current.has_value());
    BOOST_TEST((std::chrono::abs(*current - later) < 2ms));
}

BOOST_AUTO_TEST_CASE(schema_setup_is_idempotent, *utf::precondition(database_configured))
{
    tokenxx::state::pg_store store(database_url(), unique_provider("schema"));
    BOOST_REQUIRE(store.ensure_schema().has_value());
    BOOST_REQUIRE(store.write_cooldown(std::chrono::system_clock::now() + 1min).has_value());
    BOOST_REQUIRE(store.ensure_schema().has_value());

    auto cooldown = store.read_cooldown();
    BOOST_REQUIRE(cooldown.has_value());
    BOOST_TEST((*cooldown > std::chrono::system_clock::now()));
}

BOOST_AUTO_TEST_CASE(advisory_lock_excludes_other_sessions, *utf::precondition(database_configured))
{
    const std::string key = unique_provider("lock");
    tokenxx::lock::pg_advisory_mutex first(database_url());
    tokenxx::lock::pg_advisory_mutex second(database_url());

    auto a = first.try_acquire(key);
    BOOST_REQUIRE(a.has_value());
    BOOST_TEST(*a);

    auto again = first.try_acquire(key);
    BOOST_REQUIRE(again.has_value());
    BOOST_TEST(!*again);

    auto b = second.try_acquire(key);
    BOOST_REQUIRE(b.has_value());
    BOOST_TEST(!*b);

    BOOST_REQUIRE(first.release(key).has_value());
    BOOST_REQUIRE(first.release(key).has_value());

    auto c = second.try_acquire(key);
    BOOST_REQUIRE(c.has_value());
    BOOST_TEST(*c);
    BOOST_REQUIRE(second.release(key).has_value());
}

BOOST_AUTO_TEST_CASE(coordinator_over_postgres, *utf::precondition(database_configured))
{
    const std::string provider = unique_provider("coordinator");
    tokenxx::state::pg_store store(database_url(), provider);
    BOOST_REQUIRE(store.ensure_schema().has_value());
    tokenxx::lock::pg_advisory_mutex mutex(database_url());
    tokenxx::test::scripted_refresher refresher(tokenxx::test::always_token("1000.pg"));

    tokenxx::token_coordinator coordinator(store, mutex, refresher,
        {"refresh", "client", "secret"}, tokenxx::coordinator_config::fast(provider));

    auto first = coordinator.get_shared_access_token();
    BOOST_REQUIRE(first.has_value());
    BOOST_TEST(*first == "1000.pg");

    auto second = coordinator.get_shared_access_token();
    BOOST_REQUIRE(second.has_value());
    BOOST_TEST(refresher.calls() == 1);
}
