// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Extract.hxx"

static constexpr bool
IsValidSchemeStart(char ch) noexcept
{
	return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

static constexpr bool
IsValidSchemeChar(char ch) noexcept
{
	return IsValidSchemeStart(ch) || (ch >= '0' && ch <= '9') ||
		ch == '+' || ch == '.' || ch == '-';
}

[[gnu::pure]]
static bool
IsValidScheme(std::string_view s) noexcept
{
	if (s.empty() || !IsValidSchemeStart(s.front()))
		return false;

	for (char ch : s.substr(1))
		if (!IsValidSchemeChar(ch))
			return false;

	return true;
}

/**
 * Return the URI part after "scheme://" of an absolute-form URI, or
 * an empty string_view with nullptr data if there is no scheme.  A
 * leading "//" without a scheme is part of an origin-form path.
 */
[[gnu::pure]]
static std::string_view
UriAfterScheme(std::string_view uri) noexcept
{
	const auto colon = uri.find(':');
	if (colon == uri.npos || !IsValidScheme(uri.substr(0, colon)))
		return {};

	const auto rest = uri.substr(colon + 1);
	if (!rest.starts_with("//"))
		return {};

	return rest.substr(2);
}

std::string_view
UriPathAndQuery(std::string_view uri) noexcept
{
	const auto after = UriAfterScheme(uri);
	if (after.data() == nullptr)
		return uri;

	const auto slash = after.find_first_of("/?");
	if (slash == after.npos)
		return {};

	return after.substr(slash);
}

std::string_view
UriPathname(std::string_view uri) noexcept
{
	uri = UriPathAndQuery(uri);

	const auto end = uri.find_first_of("?#");
	if (end != uri.npos)
		uri = uri.substr(0, end);

	return uri;
}
