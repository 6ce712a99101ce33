/*

tls_options.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

TLS client settings for the token endpoint and the code that turns them into
a configured ssl::context.

*/

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <openssl/ssl.h>

#include <tokenxx/detail/asio_decl.hpp>
#include <tokenxx/detail/error_detail.hpp>
#include <tokenxx/detail/result.hpp>

namespace tokenxx::net
{

enum class verify_mode
{
    none,
    peer
};

struct tls_options
{
    verify_mode verify = verify_mode::peer;
    bool verify_host = true;
    std::optional<int> min_tls_version = TLS1_2_VERSION;
    std::string cipher_list;
    bool use_default_verify_paths = true;
    std::vector<std::string> ca_files;
    std::vector<std::string> ca_paths;
};

/**
Load the CA material named by the options into ctx.

@return errc::config_invalid naming the file or directory that failed.
**/
inline result<void> configure_trust_store(tokenxx::asio::ssl::context& ctx, const tls_options& options)
{
    auto rejected = [](std::string_view what, std::string_view source, const tokenxx::asio::error_code& ec)
    {
        return fail<void>(errc::config_invalid, "cannot load TLS trust store",
            detail::error_detail().add(what, source).add_ec("error", ec).str(), ec);
    };

    tokenxx::asio::error_code ec;
    if (options.use_default_verify_paths)
    {
        ctx.set_default_verify_paths(ec);
        if (ec)
            return rejected("source", "default verify paths", ec);
    }

    for (const auto& file : options.ca_files)
    {
        if (file.empty())
            continue;
        ctx.load_verify_file(file, ec);
        if (ec)
            return rejected("ca_file", file, ec);
    }
    for (const auto& path : options.ca_paths)
    {
        if (path.empty())
            continue;
        ctx.add_verify_path(path, ec);
        if (ec)
            return rejected("ca_path", path, ec);
    }
    return ok();
}

/**
Build a client context from the options: protocol floor, cipher list,
trust store and peer verification.
**/
inline result<tokenxx::asio::ssl::context> make_client_context(const tls_options& options)
{
    tokenxx::asio::ssl::context ctx(tokenxx::asio::ssl::context::tls_client);

    if (options.min_tls_version
        && SSL_CTX_set_min_proto_version(ctx.native_handle(), *options.min_tls_version) != 1)
        return fail<tokenxx::asio::ssl::context>(errc::config_invalid, "unsupported minimum TLS version",
            std::to_string(*options.min_tls_version));

    if (!options.cipher_list.empty()
        && SSL_CTX_set_cipher_list(ctx.native_handle(), options.cipher_list.c_str()) != 1)
        return fail<tokenxx::asio::ssl::context>(errc::config_invalid, "invalid TLS cipher list", options.cipher_list);

    if (auto trust = configure_trust_store(ctx, options); !trust)
        return fail<tokenxx::asio::ssl::context>(std::move(trust).error());

    ctx.set_verify_mode(options.verify == verify_mode::peer
        ? tokenxx::asio::ssl::verify_peer
        : tokenxx::asio::ssl::verify_none);
    return ok(std::move(ctx));
}

} // namespace tokenxx::net
