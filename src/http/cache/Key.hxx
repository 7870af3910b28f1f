// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>

struct CacheRule;

/**
 * The pair of store keys which make up one cache entry.
 */
struct CacheKey {
	/**
	 * The key of the response body.
	 */
	std::string body;

	/**
	 * The key of the "Content-Type" response header.
	 */
	std::string content_type;
};

/**
 * Build the keys for the given request URI: "wc_" URL "_" version,
 * plus the suffix "_ct" for the content type.  If the rule ignores
 * the query string, only the path is used.
 */
CacheKey
MakeCacheKey(std::string_view uri, const CacheRule &rule,
	     std::string_view version);
