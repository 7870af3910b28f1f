// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CacheControl.hxx"

#include <charconv>

static constexpr bool
IsWhitespace(char ch) noexcept
{
	return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n';
}

static constexpr std::string_view
Strip(std::string_view s) noexcept
{
	while (!s.empty() && IsWhitespace(s.front()))
		s.remove_prefix(1);
	while (!s.empty() && IsWhitespace(s.back()))
		s.remove_suffix(1);
	return s;
}

static std::string
ToLowerASCII(std::string_view s)
{
	std::string result{s};
	for (auto &ch : result)
		if (ch >= 'A' && ch <= 'Z')
			ch += 'a' - 'A';
	return result;
}

/**
 * Parse the leading decimal integer of the given string, after
 * optional whitespace and sign; trailing garbage is ignored.  Values
 * which do not fit into a long are not integers.
 */
static std::optional<long>
ParseLeadingInteger(std::string_view s) noexcept
{
	s = Strip(s);

	/* std::from_chars() accepts '-' but not '+' */
	if (s.starts_with('+') && !s.substr(1).starts_with('-'))
		s.remove_prefix(1);

	long value;
	const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(),
					       value);
	if (ec != std::errc{})
		return std::nullopt;

	return value;
}

CacheControlDirectives
ParseCacheControl(std::string_view value)
{
	CacheControlDirectives result;

	while (!value.empty()) {
		std::string_view token;
		const auto comma = value.find(',');
		if (comma == value.npos) {
			token = value;
			value = {};
		} else {
			token = value.substr(0, comma);
			value = value.substr(comma + 1);
		}

		std::optional<long> directive_value;

		const auto eq = token.find('=');
		if (eq != token.npos) {
			auto v = token.substr(eq + 1);

			/* only the part up to the next '=' counts */
			const auto eq2 = v.find('=');
			if (eq2 != v.npos)
				v = v.substr(0, eq2);

			directive_value = ParseLeadingInteger(v);
			token = token.substr(0, eq);
		}

		token = Strip(token);
		if (token.empty())
			continue;

		result.insert_or_assign(ToLowerASCII(token), directive_value);
	}

	return result;
}

bool
CacheControlHasNoCache(const char *value)
{
	return value != nullptr &&
		ParseCacheControl(value).contains("no-cache");
}
