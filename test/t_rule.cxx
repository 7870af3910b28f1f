// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "http/cache/Rule.hxx"
#include "http/cache/Key.hxx"
#include "http/cache/Config.hxx"
#include "http/Request.hxx"

#include <gtest/gtest.h>

using std::chrono_literals::operator""ms;

static WebCacheConfig
MakeConfig()
{
	WebCacheConfig config;
	config.version = "2012";
	config.rules = {
		{ R"(^/article/\w+)", 3600000ms, true, true },
		{ "^/$", 100ms, std::nullopt, std::nullopt },
		{ "^/comments?", std::nullopt, std::nullopt, std::nullopt },
	};
	return config;
}

static HttpRequest
MakeRequest(HttpMethod method, const char *uri)
{
	HttpRequest request;
	request.method = method;
	request.uri = uri;
	return request;
}

TEST(CacheRule, Empty)
{
	WebCacheConfig config;
	ASSERT_THROW(CacheRuleList{config}, std::invalid_argument);
}

TEST(CacheRule, BadPattern)
{
	WebCacheConfig config;
	config.rules.push_back({"^/foo(", {}, {}, {}});
	ASSERT_THROW(CacheRuleList{config}, Pcre2Error);
}

TEST(CacheRule, Defaults)
{
	const auto config = MakeConfig();
	const CacheRuleList rules(config);
	ASSERT_EQ(rules.size(), 3u);

	const auto *rule = rules.Match("/article/foo");
	ASSERT_NE(rule, nullptr);
	ASSERT_EQ(rule->max_age, 3600000ms);
	ASSERT_TRUE(rule->ignore_querystring);
	ASSERT_TRUE(rule->client_cache);

	rule = rules.Match("/");
	ASSERT_NE(rule, nullptr);
	ASSERT_EQ(rule->max_age, 100ms);
	ASSERT_FALSE(rule->ignore_querystring);
	ASSERT_FALSE(rule->client_cache);

	/* global defaults */
	rule = rules.Match("/comments");
	ASSERT_NE(rule, nullptr);
	ASSERT_EQ(rule->max_age, 300000ms);
	ASSERT_FALSE(rule->ignore_querystring);
	ASSERT_FALSE(rule->client_cache);
}

TEST(CacheRule, GlobalDefaults)
{
	WebCacheConfig config;
	config.max_age = 5000ms;
	config.ignore_querystring = true;
	config.client_cache = true;
	config.rules.push_back({"^/a", {}, false, {}});

	const CacheRuleList rules(config);
	const auto *rule = rules.Match("/a");
	ASSERT_NE(rule, nullptr);
	ASSERT_EQ(rule->max_age, 5000ms);
	ASSERT_FALSE(rule->ignore_querystring);
	ASSERT_TRUE(rule->client_cache);
}

TEST(CacheRule, NoMatch)
{
	const auto config = MakeConfig();
	const CacheRuleList rules(config);

	ASSERT_EQ(rules.Match("/foo"), nullptr);
	ASSERT_EQ(rules.Match("/article/"), nullptr);
	ASSERT_EQ(rules.Match(""), nullptr);
}

TEST(CacheRule, LastMatchWins)
{
	WebCacheConfig config;
	config.rules = {
		{ "^/a", 1000ms, {}, {} },
		{ "^/a/b", 2000ms, {}, {} },
		{ "^/a", 3000ms, {}, {} },
		{ "^/x", 4000ms, {}, {} },
	};

	const CacheRuleList rules(config);

	const auto *rule = rules.Match("/a/b");
	ASSERT_NE(rule, nullptr);
	ASSERT_EQ(rule->max_age, 3000ms);

	rule = rules.Match("/x");
	ASSERT_NE(rule, nullptr);
	ASSERT_EQ(rule->max_age, 4000ms);
}

TEST(CacheRule, Unanchored)
{
	WebCacheConfig config;
	config.rules.push_back({"foo", {}, {}, {}});

	const CacheRuleList rules(config);
	ASSERT_NE(rules.Match("/bar/foo/"), nullptr);
	ASSERT_EQ(rules.Match("/bar/"), nullptr);
}

TEST(CacheRule, Lookup)
{
	const auto config = MakeConfig();
	const CacheRuleList rules(config);

	ASSERT_NE(rules.Lookup(MakeRequest(HttpMethod::GET, "/")), nullptr);

	/* only GET requests are cached */
	ASSERT_EQ(rules.Lookup(MakeRequest(HttpMethod::POST, "/")), nullptr);
	ASSERT_EQ(rules.Lookup(MakeRequest(HttpMethod::PUT, "/")), nullptr);
	ASSERT_EQ(rules.Lookup(MakeRequest(HttpMethod::DELETE, "/")), nullptr);
	ASSERT_EQ(rules.Lookup(MakeRequest(HttpMethod::HEAD, "/")), nullptr);

	/* the query string is not matched */
	ASSERT_NE(rules.Lookup(MakeRequest(HttpMethod::GET, "/?foo=bar")), nullptr);
	ASSERT_EQ(rules.Lookup(MakeRequest(HttpMethod::GET, "/foo?/article/x")), nullptr);

	/* absolute URI */
	ASSERT_NE(rules.Lookup(MakeRequest(HttpMethod::GET, "http://localhost/comments?x")), nullptr);
}

TEST(CacheKey, Basic)
{
	const auto config = MakeConfig();
	const CacheRuleList rules(config);
	const auto &comments = *rules.Match("/comments");

	auto key = MakeCacheKey("/comments", comments, "2012");
	ASSERT_EQ(key.body, "wc_/comments_2012");
	ASSERT_EQ(key.content_type, "wc_/comments_2012_ct");

	key = MakeCacheKey("/comments?foo=bar", comments, "");
	ASSERT_EQ(key.body, "wc_/comments?foo=bar_");
	ASSERT_EQ(key.content_type, "wc_/comments?foo=bar__ct");
}

TEST(CacheKey, QueryString)
{
	const auto config = MakeConfig();
	const CacheRuleList rules(config);
	const auto &article = *rules.Match("/article/foo");
	const auto &comments = *rules.Match("/comments");

	/* ignored query string: both requests share one entry */
	ASSERT_EQ(MakeCacheKey("/article/foo?x=1", article, "2012").body,
		  MakeCacheKey("/article/foo?y=2", article, "2012").body);
	ASSERT_EQ(MakeCacheKey("/article/foo?x=1", article, "2012").body,
		  "wc_/article/foo_2012");

	/* significant query string */
	ASSERT_NE(MakeCacheKey("/comments?x=1", comments, "2012").body,
		  MakeCacheKey("/comments?y=2", comments, "2012").body);
}

TEST(CacheKey, Isolation)
{
	const auto config = MakeConfig();
	const CacheRuleList rules(config);
	const auto &comments = *rules.Match("/comments");

	ASSERT_NE(MakeCacheKey("/comments", comments, "1").body,
		  MakeCacheKey("/comments", comments, "2").body);
	ASSERT_NE(MakeCacheKey("/comment", comments, "1").body,
		  MakeCacheKey("/comments", comments, "1").body);
}
