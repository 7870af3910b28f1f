// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Config.hxx"
#include "io/ConfigParser.hxx"

/**
 * Parser for the web cache configuration file:
 *
 *     max_age 300000
 *     version "2012"
 *     ignore_querystring no
 *     client_cache no
 *     rule "^/article/\w+" {
 *       max_age 3600000
 *       ignore_querystring yes
 *     }
 *
 * Durations are milliseconds.  Rule patterns are quoted; backslash
 * sequences other than the quote escapes are passed to the regex
 * compiler unchanged.
 */
class WebCacheConfigParser final : public NestedConfigParser {
	WebCacheConfig &config;

	class Rule;

public:
	explicit WebCacheConfigParser(WebCacheConfig &_config) noexcept
		:config(_config) {}

	/* virtual methods from class ConfigParser */
	void Finish() override;

protected:
	/* virtual methods from class NestedConfigParser */
	void ParseLine2(FileLineParser &line) override;
};

/**
 * Load and parse the specified configuration file.
 *
 * Throws on error.
 */
WebCacheConfig
LoadWebCacheConfigFile(const boost::filesystem::path &path);
