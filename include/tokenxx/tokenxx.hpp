/*

tokenxx.hpp
-----------

Umbrella header: every public tokenxx component.

*/

#pragma once

#include <tokenxx/config.hpp>
#include <tokenxx/settings.hpp>

#include <tokenxx/detail/log.hpp>
#include <tokenxx/detail/result.hpp>

#include <tokenxx/state/token_state_store.hpp>
#include <tokenxx/state/memory_store.hpp>
#include <tokenxx/state/file_store.hpp>
#include <tokenxx/state/pg_store.hpp>

#include <tokenxx/lock/distributed_mutex.hpp>
#include <tokenxx/lock/memory_mutex.hpp>
#include <tokenxx/lock/file_mutex.hpp>
#include <tokenxx/lock/pg_advisory_mutex.hpp>

#include <tokenxx/oauth2/token.hpp>
#include <tokenxx/oauth2/token_refresher.hpp>
#include <tokenxx/oauth2/http_token_refresher.hpp>

#include <tokenxx/coordinator/coordinator_config.hpp>
#include <tokenxx/coordinator/token_coordinator.hpp>
#include <tokenxx/coordinator/token_retry.hpp>
#include <tokenxx/coordinator/http_mapping.hpp>

#if TOKENXX_THROWING_ENABLED
#include <tokenxx/throwing.hpp>
#endif

// Utilities
#include <tokenxx/cache/stale_cache.hpp>
