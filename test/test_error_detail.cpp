/*

test_error_detail.cpp
---------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE error_detail_test

#include <boost/test/unit_test.hpp>

#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <system_error>

#include <tokenxx/detail/error_detail.hpp>
#include <tokenxx/detail/exception_bridge.hpp>
#include <tokenxx/detail/result.hpp>


BOOST_AUTO_TEST_CASE(error_detail_key_values)
{
    tokenxx::detail::error_detail detail;
    detail.add("stage", "connect").add_int("status", 429);
    BOOST_TEST(detail.str() == "stage=connect\nstatus=429\n");
}

BOOST_AUTO_TEST_CASE(error_detail_error_code)
{
    tokenxx::detail::error_detail detail;
    detail.add_ec("error", std::make_error_code(std::errc::connection_refused));
    const std::string text = detail.str();
    BOOST_TEST(text.starts_with("error=" + std::to_string(static_cast<int>(std::errc::connection_refused)) + " "));
}

BOOST_AUTO_TEST_CASE(error_detail_body_is_redacted_and_flattened)
{
    tokenxx::detail::error_detail detail;
    detail.add_body("body", "{\"access_token\":\"1000.secret\",\n\"error\":\"x\"}");
    BOOST_TEST(detail.str() == "body={\"access_token\":\"<redacted>\", \"error\":\"x\"}\n");
}

BOOST_AUTO_TEST_CASE(error_detail_body_is_capped)
{
    tokenxx::detail::error_detail detail;
    detail.add_body("body", std::string(tokenxx::detail::max_detail_body + 100, 'a'));
    BOOST_TEST(detail.str().size() == 5 + tokenxx::detail::max_detail_body + 3 + 1);
}

BOOST_AUTO_TEST_CASE(error_info_to_string)
{
    auto limited = tokenxx::make_rate_limited(std::chrono::milliseconds{1500});
    BOOST_TEST(limited.to_string() == "[rate_limited] upstream token endpoint is rate limited (retry after 1500ms)");

    auto negative = tokenxx::make_rate_limited(std::chrono::milliseconds{-5});
    BOOST_TEST(negative.retry_after.count() == 0);

    auto failed = tokenxx::make_error(tokenxx::errc::refresh_failed, "rejected");
    failed.http_status = 400;
    BOOST_TEST(failed.to_string() == "[refresh_failed] rejected (http 400)");
}

BOOST_AUTO_TEST_CASE(protect_converts_exceptions)
{
    auto res = tokenxx::protect([]() -> tokenxx::result<int>
    {
        throw std::runtime_error("kaboom");
    }, tokenxx::errc::internal_error);

    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(tokenxx::to_string(res.error().code) == "internal_error");
    BOOST_TEST(res.error().message == "kaboom");
}

BOOST_AUTO_TEST_CASE(protect_keeps_system_error_code)
{
    auto res = tokenxx::protect([]() -> tokenxx::result<void>
    {
        throw std::system_error(std::make_error_code(std::errc::timed_out), "read");
    }, tokenxx::errc::refresh_failed);

    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().is(tokenxx::errc::refresh_failed));
    BOOST_TEST((res.error().sys == std::make_error_code(std::errc::timed_out)));
}

BOOST_AUTO_TEST_CASE(protect_passes_values_through)
{
    auto res = tokenxx::protect([] { return tokenxx::ok(7); }, tokenxx::errc::internal_error);
    BOOST_TEST(res.value() == 7);
}

BOOST_AUTO_TEST_CASE(error_detail_lookup)
{
    const std::string text = tokenxx::detail::error_detail()
        .add("stage", "timeout")
        .add_ms("timeout", std::chrono::milliseconds{15000})
        .add("stage_two", "ignored")
        .str();

    BOOST_TEST(text == "stage=timeout\ntimeout=15000ms\nstage_two=ignored\n");
    BOOST_TEST(tokenxx::detail::error_detail::find(text, "timeout").value() == "15000ms");
    BOOST_TEST(tokenxx::detail::error_detail::find(text, "stage").value() == "timeout");
    BOOST_TEST(!tokenxx::detail::error_detail::find(text, "body").has_value());
}

BOOST_AUTO_TEST_CASE(protect_recognizes_boost_system_errors)
{
    auto res = tokenxx::protect([]() -> tokenxx::result<void>
    {
        throw boost::system::system_error(boost::asio::error::connection_refused, "connect");
    }, tokenxx::errc::refresh_failed);

    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().sys.value() == static_cast<int>(boost::asio::error::connection_refused));
    BOOST_TEST(tokenxx::detail::error_detail::find(res.error().detail, "exception").value() == "boost_system_error");
}
