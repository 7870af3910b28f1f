// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Rule.hxx"
#include "Config.hxx"
#include "http/Request.hxx"
#include "uri/Extract.hxx"

#include <stdexcept>

CacheRule::CacheRule(const WebCacheRuleConfig &config,
		     const WebCacheConfig &defaults)
	:regex(config.pattern, RegexOptions{}),
	 max_age(config.max_age.value_or(defaults.max_age)),
	 ignore_querystring(config.ignore_querystring.value_or(defaults.ignore_querystring)),
	 client_cache(config.client_cache.value_or(defaults.client_cache))
{
	if (max_age.count() < 0)
		max_age = {};
}

CacheRuleList::CacheRuleList(const WebCacheConfig &config)
{
	if (config.rules.empty())
		throw std::invalid_argument("rules must not empty");

	rules.reserve(config.rules.size());
	for (const auto &i : config.rules)
		rules.emplace_back(i, config);
}

const CacheRule *
CacheRuleList::Match(std::string_view path) const noexcept
{
	const CacheRule *result = nullptr;

	/* no early return: later rules override earlier ones */
	for (const auto &rule : rules)
		if (rule.Match(path))
			result = &rule;

	return result;
}

const CacheRule *
CacheRuleList::Lookup(const HttpRequest &request) const noexcept
{
	if (request.method != HttpMethod::GET)
		return nullptr;

	return Match(UriPathname(request.uri));
}
