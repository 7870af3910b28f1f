// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Parser for the "Cache-Control" header.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

/**
 * Maps a directive name (lower case) to its integer value.  A
 * directive without a value (or with a value which is not an integer)
 * maps to std::nullopt, i.e. it is a plain flag.
 */
using CacheControlDirectives =
	std::map<std::string, std::optional<long>, std::less<>>;

/**
 * Parse a "Cache-Control" header value, e.g. "public, max-age=60".
 * Empty tokens are skipped; this function never fails.
 */
CacheControlDirectives
ParseCacheControl(std::string_view value);

/**
 * Does the given "Cache-Control" value contain the "no-cache"
 * directive?  A nullptr value means the header is absent.
 */
bool
CacheControlHasNoCache(const char *value);
