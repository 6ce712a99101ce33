/*

config.hpp
----------

Build-time switches and version of tokenxx.

Define TOKENXX_NO_EXCEPTIONS to disable exception-based wrappers.
Define TOKENXX_DEFAULT_PROVIDER to change the provider id used when the
configuration names none.

*/

#pragma once

#define TOKENXX_VERSION_MAJOR 0
#define TOKENXX_VERSION_MINOR 1
#define TOKENXX_VERSION_PATCH 0
#define TOKENXX_VERSION_STRING "0.1.0"

#if defined(TOKENXX_NO_EXCEPTIONS)
#define TOKENXX_THROWING_ENABLED 0
#else
#define TOKENXX_THROWING_ENABLED 1
#endif

#if !defined(TOKENXX_DEFAULT_PROVIDER)
#define TOKENXX_DEFAULT_PROVIDER "zoho"
#endif
