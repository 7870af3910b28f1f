// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "pcre/Regex.hxx"

#include <chrono>
#include <string_view>
#include <vector>

struct HttpRequest;
struct WebCacheConfig;
struct WebCacheRuleConfig;

/**
 * A compiled #WebCacheRuleConfig with all defaults applied.
 */
struct CacheRule {
	UniqueRegex regex;

	std::chrono::milliseconds max_age;

	bool ignore_querystring;

	bool client_cache;

	/**
	 * Throws Pcre2Error if the pattern is malformed.
	 */
	CacheRule(const WebCacheRuleConfig &config,
		  const WebCacheConfig &defaults);

	[[gnu::pure]]
	bool Match(std::string_view path) const noexcept {
		return regex.Match(path);
	}
};

class CacheRuleList {
	std::vector<CacheRule> rules;

public:
	/**
	 * Compile all rules of the given configuration.
	 *
	 * Throws std::invalid_argument if there are no rules,
	 * Pcre2Error if a pattern is malformed.
	 */
	explicit CacheRuleList(const WebCacheConfig &config);

	std::size_t size() const noexcept {
		return rules.size();
	}

	/**
	 * Find the last rule which matches the given path.
	 *
	 * @return the rule or nullptr if none matches
	 */
	[[gnu::pure]]
	const CacheRule *Match(std::string_view path) const noexcept;

	/**
	 * Find the rule which applies to the given request.  Only
	 * "GET" requests are considered; the rules are matched against
	 * the path of the URI, without the query string.
	 *
	 * @return the rule or nullptr if the request shall not be
	 * cached
	 */
	[[gnu::pure]]
	const CacheRule *Lookup(const HttpRequest &request) const noexcept;
};
