// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "LineParser.hxx"

#include <string.h>

LineParser::LineParser(char *_p) noexcept
	:p(_p)
{
	SkipWhitespace();

	std::size_t length = strlen(p);
	while (length > 0 && IsWhitespace(p[length - 1]))
		--length;
	p[length] = 0;
}

inline void
LineParser::SkipWhitespace() noexcept
{
	while (IsWhitespace(*p))
		++p;
}

void
LineParser::ExpectSymbolAndEol(char symbol)
{
	if (!SkipSymbol(symbol))
		throw Error(std::string("'") + symbol + "' expected");

	SkipWhitespace();
	if (!IsEnd())
		throw Error(std::string("Unexpected tokens after '")
			    + symbol + "': " + p);
}

bool
LineParser::SkipSymbol(char symbol) noexcept
{
	if (front() != symbol)
		return false;

	++p;
	return true;
}

bool
LineParser::SkipWord(const char *word) noexcept
{
	const std::size_t length = strlen(word);
	if (length == 0 || strncmp(p, word, length) != 0)
		return false;

	const char next = p[length];
	if (next != 0 && !IsWhitespace(next))
		return false;

	p += length;
	SkipWhitespace();
	return true;
}

template<typename P>
inline char *
LineParser::NextToken(P &&predicate) noexcept
{
	char *const start = p;
	char *end = start;
	while (predicate(*end))
		++end;

	if (end == start)
		return nullptr;

	if (*end != 0) {
		if (!IsWhitespace(*end))
			/* garbage glued to the token */
			return nullptr;

		*end++ = 0;
	}

	p = end;
	SkipWhitespace();
	return start;
}

inline char *
LineParser::NextQuoted(char quote) noexcept
{
	char *const start = p + 1;
	char *const end = strchr(start, quote);
	if (end == nullptr)
		return nullptr;

	*end = 0;
	p = end + 1;
	SkipWhitespace();
	return start;
}

const char *
LineParser::NextWord() noexcept
{
	return NextToken(IsWordChar);
}

char *
LineParser::NextValue() noexcept
{
	if (IsQuote(front()))
		return NextQuoted(front());

	return NextToken(IsValueChar);
}

/**
 * Translate the character following a backslash.
 *
 * @return the replacement or 0 if the sequence shall be kept
 */
static constexpr char
TranslateEscape(char ch) noexcept
{
	switch (ch) {
	case 'r':
		return '\r';

	case 'n':
		return '\n';

	case '\\':
	case '\'':
	case '"':
		return ch;

	default:
		return 0;
	}
}

char *
LineParser::NextUnescape() noexcept
{
	const char quote = front();
	if (!IsQuote(quote))
		return nullptr;

	char *const value = p + 1;
	char *out = value;

	for (const char *in = value; *in != 0; ++in) {
		if (*in == quote) {
			*out = 0;
			p = const_cast<char *>(in) + 1;
			SkipWhitespace();
			return value;
		}

		if (*in != '\\') {
			*out++ = *in;
			continue;
		}

		const char escaped = *++in;
		if (escaped == 0)
			break;

		if (const char translated = TranslateEscape(escaped);
		    translated != 0) {
			*out++ = translated;
		} else {
			/* regular expressions need these */
			*out++ = '\\';
			*out++ = escaped;
		}
	}

	/* not terminated */
	return nullptr;
}

bool
LineParser::NextBool()
{
	const char *value = NextValue();
	if (value != nullptr) {
		if (strcmp(value, "yes") == 0)
			return true;

		if (strcmp(value, "no") == 0)
			return false;
	}

	throw Error("yes/no expected");
}

const char *
LineParser::ExpectWord()
{
	const char *word = NextWord();
	if (word == nullptr)
		throw Error("Word expected");

	return word;
}

char *
LineParser::ExpectValue()
{
	char *value = NextValue();
	if (value == nullptr || *value == 0)
		throw Error("Value expected");

	return value;
}
