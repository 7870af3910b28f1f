// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Extract parts of an URI.
 */

#pragma once

#include <string_view>

/**
 * Return the path and query string of an URI, i.e. skip the scheme
 * and the authority of an absolute-form URI
 * ("http://host/path?query").  Any other URI is returned as-is; in
 * particular, "//a/b" is an origin-form path, not a network-path
 * reference.
 */
[[gnu::pure]]
std::string_view
UriPathAndQuery(std::string_view uri) noexcept;

/**
 * Return the path of an URI, without scheme, authority, query string
 * and fragment.
 */
[[gnu::pure]]
std::string_view
UriPathname(std::string_view uri) noexcept;
