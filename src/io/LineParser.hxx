// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <stdexcept>
#include <string>

/**
 * Splits one line of a configuration file into tokens.  Words,
 * values and quoted strings are null-terminated in place, therefore
 * the buffer must be writable and must outlive all returned
 * pointers.  Leading and trailing whitespace is removed by the
 * constructor.
 */
class LineParser {
	char *p;

public:
	using Error = std::runtime_error;

	explicit LineParser(char *_p) noexcept;

	LineParser(const LineParser &) = delete;
	LineParser &operator=(const LineParser &) = delete;

	char front() const noexcept {
		return *p;
	}

	bool IsEnd() const noexcept {
		return front() == 0;
	}

	void ExpectEnd() {
		if (!IsEnd())
			throw Error(std::string("Unexpected tokens at end of line: ") + p);
	}

	/**
	 * Expect the given character as the last token of the line.
	 */
	void ExpectSymbolAndEol(char symbol);

	/**
	 * Skip the given character if it is the next one.
	 */
	bool SkipSymbol(char symbol) noexcept;

	/**
	 * Skip the given word if it is the next token.  Returns false
	 * (and consumes nothing) if the next token is something else.
	 */
	bool SkipWord(const char *word) noexcept;

	/**
	 * Parse an identifier (letters, digits and underscores).
	 *
	 * @return nullptr if the next token is not a word
	 */
	const char *NextWord() noexcept;

	/**
	 * Parse a word which may also contain '.', '-' and ':', or a
	 * quoted string without escapes.
	 *
	 * @return nullptr on mismatch
	 */
	char *NextValue() noexcept;

	/**
	 * Parse a quoted string, resolving the escapes \\r, \\n, \\\\
	 * and backslash-quote.  Other backslash sequences are kept
	 * verbatim.
	 *
	 * @return nullptr if there is no quoted string or if it is not
	 * terminated
	 */
	char *NextUnescape() noexcept;

	/**
	 * Throws #Error if the next token is not "yes" or "no".
	 */
	bool NextBool();

	const char *ExpectWord();

	/**
	 * Expect a non-empty value (see NextValue()).
	 */
	char *ExpectValue();

	char *ExpectValueAndEnd() {
		char *value = ExpectValue();
		ExpectEnd();
		return value;
	}

private:
	void SkipWhitespace() noexcept;

	/**
	 * Consume a token of characters accepted by the given
	 * predicate.  The token must be followed by whitespace or by
	 * the end of the line.
	 */
	template<typename P>
	char *NextToken(P &&predicate) noexcept;

	char *NextQuoted(char quote) noexcept;

	static constexpr bool IsWhitespace(char ch) noexcept {
		return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n';
	}

	static constexpr bool IsWordChar(char ch) noexcept {
		return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
			(ch >= '0' && ch <= '9') || ch == '_';
	}

	static constexpr bool IsValueChar(char ch) noexcept {
		return IsWordChar(ch) || ch == '.' || ch == '-' || ch == ':';
	}

	static constexpr bool IsQuote(char ch) noexcept {
		return ch == '"' || ch == '\'';
	}
};
