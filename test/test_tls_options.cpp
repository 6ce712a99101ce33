/*

test_tls_options.cpp
--------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE tls_options_test

#include <boost/test/unit_test.hpp>
#include <tokenxx/net/tls_options.hpp>


BOOST_AUTO_TEST_CASE(default_options_build_a_verifying_context)
{
    tokenxx::net::tls_options options;
    BOOST_TEST((options.verify == tokenxx::net::verify_mode::peer));
    BOOST_TEST(options.verify_host);

    auto ctx = tokenxx::net::make_client_context(options);
    BOOST_REQUIRE(ctx.has_value());
    BOOST_TEST(SSL_CTX_get_min_proto_version(ctx->native_handle()) == TLS1_2_VERSION);
    BOOST_TEST((SSL_CTX_get_verify_mode(ctx->native_handle()) & SSL_VERIFY_PEER) != 0);
}

BOOST_AUTO_TEST_CASE(missing_ca_file_is_config_error)
{
    tokenxx::net::tls_options options;
    options.use_default_verify_paths = false;
    options.ca_files.push_back("/nonexistent/tokenxx-ca.pem");

    auto ctx = tokenxx::net::make_client_context(options);
    BOOST_REQUIRE(!ctx.has_value());
    BOOST_TEST(tokenxx::to_string(ctx.error().code) == "config_invalid");
    BOOST_TEST(ctx.error().detail.find("/nonexistent/tokenxx-ca.pem") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(bad_cipher_list_is_config_error)
{
    tokenxx::net::tls_options options;
    options.cipher_list = "NOT-A-CIPHER";

    auto ctx = tokenxx::net::make_client_context(options);
    BOOST_REQUIRE(!ctx.has_value());
    BOOST_TEST(ctx.error().is(tokenxx::errc::config_invalid));
}

BOOST_AUTO_TEST_CASE(verification_can_be_disabled)
{
    tokenxx::net::tls_options options;
    options.verify = tokenxx::net::verify_mode::none;
    options.use_default_verify_paths = false;

    auto ctx = tokenxx::net::make_client_context(options);
    BOOST_REQUIRE(ctx.has_value());
    BOOST_TEST(SSL_CTX_get_verify_mode(ctx->native_handle()) == SSL_VERIFY_NONE);
}
