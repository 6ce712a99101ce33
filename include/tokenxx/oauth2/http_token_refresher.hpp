/*

http_token_refresher.hpp
------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

token_refresher that posts the refresh grant to the provider over HTTPS.
Each call runs its own io_context so the coordinator stays synchronous.

*/

#pragma once

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <tokenxx/detail/asio_decl.hpp>
#include <tokenxx/detail/error_detail.hpp>
#include <tokenxx/detail/exception_bridge.hpp>
#include <tokenxx/detail/log.hpp>
#include <tokenxx/detail/redact.hpp>
#include <tokenxx/detail/result.hpp>
#include <tokenxx/net/tls_options.hpp>
#include <tokenxx/oauth2/form.hpp>
#include <tokenxx/oauth2/refresher_config.hpp>
#include <tokenxx/oauth2/token_endpoint.hpp>
#include <tokenxx/oauth2/token_refresher.hpp>
#include <tokenxx/oauth2/token_response.hpp>

namespace tokenxx::oauth2
{

class http_token_refresher : public token_refresher
{
public:
    explicit http_token_refresher(refresher_config config)
        : config_(std::move(config))
    {
    }

    [[nodiscard]] const refresher_config& config() const noexcept { return config_; }

    result<refreshed_token> refresh(const credentials& creds) override
    {
        if (!creds.complete())
            return fail<refreshed_token>(errc::config_missing, "refresh token, client id and client secret are required");

        auto endpoint = token_endpoint::parse(config_.endpoint_url);
        if (!endpoint)
            return fail<refreshed_token>(std::move(endpoint).error());

        std::optional<asio::ssl::context> tls;
        if (endpoint->use_tls)
        {
            auto made = net::make_client_context(config_.tls);
            if (!made)
                return fail<refreshed_token>(std::move(made).error());
            tls.emplace(std::move(made).value());
        }

        const std::string body = form_urlencode({
            {"refresh_token", creds.refresh_token},
            {"client_id", creds.client_id},
            {"client_secret", creds.client_secret},
            {"grant_type", "refresh_token"}});

        TOKENXX_TRACE_SEND("HTTP", "POST " + endpoint->host_header() + endpoint->target
            + " " + tokenxx::detail::redact_form_body(body));

        std::optional<result<http_reply>> outcome;
        asio::io_context ctx;
        asio::co_spawn(ctx,
            exchange(*endpoint, tls ? &*tls : nullptr, body),
            [&outcome](std::exception_ptr eptr, result<http_reply> res)
            {
                if (eptr)
                    outcome.emplace(fail<http_reply>(from_exception(eptr, errc::refresh_failed)));
                else
                    outcome.emplace(std::move(res));
            });

        // The stream deadline covers connect..read; this also bounds name resolution.
        ctx.run_for(config_.timeout + std::chrono::milliseconds{250});

        if (!outcome)
        {
            return fail<refreshed_token>(errc::refresh_failed, "token request timed out",
                tokenxx::detail::error_detail()
                    .add("stage", "timeout")
                    .add_ms("timeout", config_.timeout)
                    .str());
        }
        if (!*outcome)
            return fail<refreshed_token>(std::move(*outcome).error());

        const http_reply& reply = outcome->value();
        TOKENXX_TRACE_RECV("HTTP", std::to_string(reply.status) + " " + reply.body);
        TOKENXX_DEBUG("token endpoint answered with status " + std::to_string(reply.status));
        return parse_token_response(reply.status, reply.body, config_.fallback_lifetime);
    }

private:
    struct http_reply
    {
        int status = 0;
        std::string body;
    };

    [[nodiscard]] static result<http_reply> transport_failure(std::string_view stage, const asio::error_code& ec)
    {
        return fail<http_reply>(errc::refresh_failed, "token request failed during " + std::string(stage),
            tokenxx::detail::error_detail()
                .add("stage", stage)
                .add_ec("error", ec)
                .str(),
            ec);
    }

    asio::awaitable<result<http_reply>> exchange(const token_endpoint& ep, asio::ssl::context* tls, const std::string& body)
    {
        auto executor = co_await asio::this_coro::executor;

        asio::tcp::resolver resolver(executor);
        auto [rec, endpoints] = co_await resolver.async_resolve(ep.host, ep.service, asio::use_nothrow_awaitable);
        if (rec)
            co_return transport_failure("resolve", rec);

        if (tls == nullptr)
        {
            beast::tcp_stream stream(executor);
            stream.expires_after(config_.timeout);
            auto [cec, peer] = co_await stream.async_connect(endpoints, asio::use_nothrow_awaitable);
            if (cec)
                co_return transport_failure("connect", cec);

            auto reply = co_await round_trip(stream, ep, body);
            asio::error_code ignored;
            stream.socket().shutdown(asio::tcp::socket::shutdown_both, ignored);
            co_return reply;
        }

        beast::tls_stream stream(executor, *tls);
        beast::get_lowest_layer(stream).expires_after(config_.timeout);

        if (!SSL_set_tlsext_host_name(stream.native_handle(), ep.host.c_str()))
        {
            const asio::error_code sni_ec(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category());
            co_return transport_failure("sni", sni_ec);
        }
        if (config_.tls.verify == net::verify_mode::peer && config_.tls.verify_host)
            stream.set_verify_callback(asio::ssl::host_name_verification(ep.host));

        auto [cec, peer] = co_await beast::get_lowest_layer(stream).async_connect(endpoints, asio::use_nothrow_awaitable);
        if (cec)
            co_return transport_failure("connect", cec);

        auto [hec] = co_await stream.async_handshake(asio::ssl::stream_base::client, asio::use_nothrow_awaitable);
        if (hec)
            co_return transport_failure("handshake", hec);

        auto reply = co_await round_trip(stream, ep, body);

        auto [sec] = co_await stream.async_shutdown(asio::use_nothrow_awaitable);
        if (sec && sec != asio::ssl::error::stream_truncated)
            TOKENXX_DEBUG("TLS shutdown with token endpoint: " + sec.message());
        co_return reply;
    }

    template<class Stream>
    asio::awaitable<result<http_reply>> round_trip(Stream& stream, const token_endpoint& ep, const std::string& body)
    {
        namespace http = beast::http;

        beast::form_request req{http::verb::post, ep.target, 11};
        req.set(http::field::host, ep.host_header());
        req.set(http::field::user_agent, config_.user_agent);
        req.set(http::field::content_type, "application/x-www-form-urlencoded");
        req.set(http::field::accept, "application/json");
        req.body() = body;
        req.prepare_payload();

        auto [wec, written] = co_await http::async_write(stream, req, asio::use_nothrow_awaitable);
        if (wec)
            co_return transport_failure("write", wec);

        beast::flat_buffer buffer;
        beast::json_response res;
        auto [rdec, read] = co_await http::async_read(stream, buffer, res, asio::use_nothrow_awaitable);
        if (rdec)
            co_return transport_failure("read", rdec);

        http_reply reply;
        reply.status = static_cast<int>(res.result_int());
        reply.body = std::move(res.body());
        co_return ok(std::move(reply));
    }

    refresher_config config_;
};

} // namespace tokenxx::oauth2
