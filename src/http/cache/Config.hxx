// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

/**
 * One URL rule.  Unset options are inherited from #WebCacheConfig.
 */
struct WebCacheRuleConfig {
	/**
	 * A PCRE2 regular expression which is matched against the
	 * path of the request URI.
	 */
	std::string pattern;

	std::optional<std::chrono::milliseconds> max_age;

	std::optional<bool> ignore_querystring;

	/**
	 * Send "Cache-Control: public, max-age=..." with cached
	 * responses?
	 */
	std::optional<bool> client_cache;
};

struct WebCacheConfig {
	/**
	 * The default time to live of cache entries.  Zero means the
	 * entries never expire.
	 */
	std::chrono::milliseconds max_age = std::chrono::minutes(5);

	/**
	 * Appended to all cache keys.  Changing it invalidates all
	 * existing cache entries.
	 */
	std::string version;

	bool ignore_querystring = false;

	bool client_cache = false;

	/**
	 * The rules in declaration order; the last matching one is
	 * applied.
	 */
	std::vector<WebCacheRuleConfig> rules;
};
