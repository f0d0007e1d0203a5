#pragma once
#include <sqlite3.h>

// Set from the project version by the build
#ifndef REMBED_VERSION
#error "REMBED_VERSION must be defined by the build"
#endif

// Subtype tag for float32 vector blobs, as read by sqlite-vec
#define REMBED_FLOAT32_SUBTYPE 223

// Pointer type name carried by rembed_client_options() values
#define REMBED_CLIENT_OPTIONS_POINTER "rembed_client_options"

#ifdef __cplusplus
extern "C" {
#endif

// Loadable-extension entry point. Registers the rembed_* SQL functions and
// the rembed_clients module on db. State lives until the connection closes.
int sqlite3_rembed_init(sqlite3* db, char** pzErrMsg, const sqlite3_api_routines* pApi);

#ifdef __cplusplus
}
#endif
