// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Key.hxx"
#include "Rule.hxx"
#include "uri/Extract.hxx"

CacheKey
MakeCacheKey(std::string_view uri, const CacheRule &rule,
	     std::string_view version)
{
	const std::string_view url = rule.ignore_querystring
		? UriPathname(uri)
		: UriPathAndQuery(uri);

	CacheKey key;
	key.body.reserve(3 + url.size() + 1 + version.size());
	key.body.append("wc_");
	key.body.append(url);
	key.body.push_back('_');
	key.body.append(version);

	key.content_type = key.body + "_ct";
	return key;
}
