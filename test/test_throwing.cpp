/*

test_throwing.cpp
-----------------

Exception front-end over result<T>.

*/

#define BOOST_TEST_MODULE throwing_test

#include <boost/test/unit_test.hpp>

#include <tokenxx/throwing.hpp>
#include "test_support.hpp"

using namespace std::chrono_literals;


BOOST_AUTO_TEST_CASE(unwrap_returns_value)
{
    BOOST_TEST(tokenxx::unwrap(tokenxx::result<int>(7)) == 7);
    BOOST_CHECK_NO_THROW(tokenxx::unwrap(tokenxx::ok()));
}

BOOST_AUTO_TEST_CASE(unwrap_throws_error_info)
{
    try
    {
        (void)tokenxx::unwrap(tokenxx::fail<int>(tokenxx::errc::store_failed, "disk full"));
        BOOST_FAIL("expected an exception");
    }
    catch (const tokenxx::rate_limited_error&)
    {
        BOOST_FAIL("store failure must not be reported as rate limiting");
    }
    catch (const tokenxx::exception& e)
    {
        BOOST_TEST((e.code() == tokenxx::errc::store_failed));
        BOOST_TEST(std::string(e.what()) == "[store_failed] disk full");
    }
}

BOOST_AUTO_TEST_CASE(rate_limiting_has_its_own_type)
{
    BOOST_CHECK_EXCEPTION(tokenxx::unwrap(tokenxx::fail<void>(tokenxx::make_rate_limited(2500ms))),
        tokenxx::rate_limited_error,
        [](const tokenxx::rate_limited_error& e) { return e.retry_after() == 2500ms; });
}

BOOST_AUTO_TEST_CASE(shared_access_token_throws_during_cooldown)
{
    tokenxx::state::memory_store store;
    tokenxx::test::counting_mutex mutex;
    tokenxx::test::scripted_refresher refresher(tokenxx::test::always_token("1000.abc"));
    tokenxx::token_coordinator coordinator(store, mutex, refresher, {"refresh", "client", "secret"},
        tokenxx::coordinator_config::fast());

    BOOST_TEST(tokenxx::shared_access_token(coordinator) == "1000.abc");

    BOOST_REQUIRE(store.invalidate_token().has_value());
    BOOST_REQUIRE(store.write_cooldown(std::chrono::system_clock::now() + 1min).has_value());
    BOOST_CHECK_THROW((void)tokenxx::shared_access_token(coordinator), tokenxx::rate_limited_error);
    BOOST_TEST(refresher.calls() == 1);
}
