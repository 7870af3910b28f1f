// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Version information which is visible to HTTP clients.
 */

#pragma once

#define WEBCACHE_VERSION_MAJOR 0
#define WEBCACHE_VERSION_MINOR 1
#define WEBCACHE_VERSION_PATCH 2

#define WEBCACHE_VERSION "0.1.2"

/**
 * The value of the "X-Cache-By" response header which marks a
 * response served from the cache.
 */
#define WEBCACHE_CACHE_BY "WebCache" WEBCACHE_VERSION
