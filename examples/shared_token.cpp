/*

shared_token.cpp
----------------

Prints the shared access token (masked) for the provider configured through
TOKENXX_* variables. Uses Postgres when a database URL is set, the state
directory otherwise.

    tokenxx_shared_token              get the token
    tokenxx_shared_token invalidate   force the next call to refresh


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <iostream>
#include <memory>
#include <string_view>
#include <tokenxx/detail/redact.hpp>
#include <tokenxx/tokenxx.hpp>
#include "example_util.hpp"


using tokenxx::settings;
using tokenxx::token_coordinator;
using std::cout;
using std::endl;


int main(int argc, char* argv[])
{
    auto loaded = settings::from_env();
    if (!loaded)
        return report_error(loaded.error());
    const settings& cfg = *loaded;
    tokenxx::log::logger::instance().configure(cfg.log_level);

    std::unique_ptr<tokenxx::state::token_state_store> store;
    std::unique_ptr<tokenxx::lock::distributed_mutex> mutex;
    if (!cfg.database_url.empty())
    {
        auto pg = std::make_unique<tokenxx::state::pg_store>(cfg.database_url, cfg.coordinator.provider);
        if (auto schema = pg->ensure_schema(); !schema)
            return report_error(schema.error());
        store = std::move(pg);
        mutex = std::make_unique<tokenxx::lock::pg_advisory_mutex>(cfg.database_url);
        cout << "backend: postgres" << endl;
    }
    else
    {
        store = std::make_unique<tokenxx::state::file_store>(cfg.state_dir, cfg.coordinator.provider);
        mutex = std::make_unique<tokenxx::lock::file_mutex>(cfg.state_dir);
        cout << "backend: " << cfg.state_dir.string() << endl;
    }

    tokenxx::oauth2::http_token_refresher refresher(cfg.refresher);
    token_coordinator coordinator(*store, *mutex, refresher, cfg.credentials, cfg.coordinator);

    if (argc > 1 && std::string_view(argv[1]) == "invalidate")
    {
        auto invalidated = coordinator.invalidate_token();
        if (!invalidated)
            return report_error(invalidated.error());
        cout << "token of provider '" << cfg.coordinator.provider << "' invalidated" << endl;
        return 0;
    }

    auto token = coordinator.get_shared_access_token();
    if (!token)
        return report_error(token.error());

    cout << "access token: " << tokenxx::detail::mask_secret(*token) << endl;
    return 0;
}
