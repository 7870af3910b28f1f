// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

class Pcre2Error : public std::runtime_error {
	int code;

public:
	Pcre2Error(int _code, const std::string &msg) noexcept
		:std::runtime_error(msg), code(_code) {}

	int GetCode() const noexcept {
		return code;
	}
};

struct RegexOptions {
	bool anchored = false;
	bool caseless = false;
};

/**
 * Wrapper for a compiled PCRE2 regular expression.
 */
class UniqueRegex {
	pcre2_code_8 *re = nullptr;

public:
	UniqueRegex() = default;

	/**
	 * Throws Pcre2Error on error.
	 */
	UniqueRegex(std::string_view pattern, RegexOptions options) {
		Compile(pattern, options);
	}

	UniqueRegex(UniqueRegex &&src) noexcept
		:re(std::exchange(src.re, nullptr)) {}

	~UniqueRegex() noexcept {
		if (re != nullptr)
			pcre2_code_free_8(re);
	}

	UniqueRegex &operator=(UniqueRegex &&src) noexcept {
		using std::swap;
		swap(re, src.re);
		return *this;
	}

	bool IsDefined() const noexcept {
		return re != nullptr;
	}

	/**
	 * Throws Pcre2Error on error.
	 */
	void Compile(std::string_view pattern, RegexOptions options);

	/**
	 * Does the expression match somewhere in the given string?
	 * Unless the expression was compiled with "anchored", the
	 * match may start anywhere.
	 */
	[[gnu::pure]]
	bool Match(std::string_view s) const noexcept;
};
