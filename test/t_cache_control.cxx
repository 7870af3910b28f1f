// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "http/CacheControl.hxx"

#include <gtest/gtest.h>

TEST(CacheControl, Flags)
{
	const auto d = ParseCacheControl("public, no-cache");
	ASSERT_EQ(d.size(), 2u);
	ASSERT_TRUE(d.contains("public"));
	ASSERT_FALSE(d.at("public").has_value());
	ASSERT_TRUE(d.contains("no-cache"));
	ASSERT_FALSE(d.at("no-cache").has_value());
}

TEST(CacheControl, Values)
{
	const auto d = ParseCacheControl("public, max-age=3600,s-maxage = 60");
	ASSERT_EQ(d.size(), 3u);
	ASSERT_EQ(d.at("max-age"), 3600);
	ASSERT_EQ(d.at("s-maxage"), 60);
}

TEST(CacheControl, LeadingInteger)
{
	/* trailing garbage is ignored, a non-numeric value makes a
	   flag */
	const auto d = ParseCacheControl("max-age=12abc, private=\"foo\", x=-5, y=1=2");
	ASSERT_EQ(d.at("max-age"), 12);
	ASSERT_FALSE(d.at("private").has_value());
	ASSERT_EQ(d.at("x"), -5);
	ASSERT_EQ(d.at("y"), 1);
}

TEST(CacheControl, Overflow)
{
	/* too large for an integer: the directive becomes a flag */
	const auto d = ParseCacheControl("max-age=9999999999999999999999999, no-cache, s-maxage=+7, x=+-1");
	ASSERT_TRUE(d.contains("max-age"));
	ASSERT_FALSE(d.at("max-age").has_value());
	ASSERT_TRUE(d.contains("no-cache"));
	ASSERT_EQ(d.at("s-maxage"), 7);
	ASSERT_FALSE(d.at("x").has_value());

	ASSERT_TRUE(CacheControlHasNoCache("max-age=99999999999999999999, no-cache"));
}

TEST(CacheControl, CaseInsensitive)
{
	const auto d = ParseCacheControl("No-Cache, MAX-AGE=1");
	ASSERT_TRUE(d.contains("no-cache"));
	ASSERT_EQ(d.at("max-age"), 1);
}

TEST(CacheControl, Empty)
{
	ASSERT_TRUE(ParseCacheControl("").empty());
	ASSERT_TRUE(ParseCacheControl(" , ,").empty());
	ASSERT_EQ(ParseCacheControl(",public,").size(), 1u);
}

TEST(CacheControl, LastWins)
{
	const auto d = ParseCacheControl("max-age=1, max-age=2");
	ASSERT_EQ(d.size(), 1u);
	ASSERT_EQ(d.at("max-age"), 2);
}

TEST(CacheControl, HasNoCache)
{
	ASSERT_FALSE(CacheControlHasNoCache(nullptr));
	ASSERT_FALSE(CacheControlHasNoCache(""));
	ASSERT_FALSE(CacheControlHasNoCache("public, max-age=60"));
	ASSERT_FALSE(CacheControlHasNoCache("no-store"));
	ASSERT_TRUE(CacheControlHasNoCache("no-cache"));
	ASSERT_TRUE(CacheControlHasNoCache("private, no-cache"));
	ASSERT_TRUE(CacheControlHasNoCache("no-cache=\"set-cookie\""));

	/* the value does not matter */
	ASSERT_TRUE(CacheControlHasNoCache("no-cache=0"));
}
