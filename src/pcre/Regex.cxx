// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Regex.hxx"

#include <memory>

#include <assert.h>

static std::string
GetErrorMessage(int code)
{
	PCRE2_UCHAR8 buffer[256];
	int length = pcre2_get_error_message_8(code, buffer, sizeof(buffer));
	if (length < 0)
		return "Unknown PCRE2 error";

	return {(const char *)buffer, (std::size_t)length};
}

void
UniqueRegex::Compile(std::string_view pattern, RegexOptions options)
{
	uint32_t flags = 0;
	if (options.anchored)
		flags |= PCRE2_ANCHORED;
	if (options.caseless)
		flags |= PCRE2_CASELESS;

	int error_number;
	PCRE2_SIZE error_offset;
	auto *new_re = pcre2_compile_8((PCRE2_SPTR8)pattern.data(),
				       pattern.size(), flags,
				       &error_number, &error_offset,
				       nullptr);
	if (new_re == nullptr)
		throw Pcre2Error(error_number,
				 "Error in regex at offset " +
				 std::to_string(error_offset) + ": " +
				 GetErrorMessage(error_number));

	if (re != nullptr)
		pcre2_code_free_8(re);
	re = new_re;
}

struct MatchDataDeleter {
	void operator()(pcre2_match_data_8 *md) const noexcept {
		pcre2_match_data_free_8(md);
	}
};

bool
UniqueRegex::Match(std::string_view s) const noexcept
{
	assert(re != nullptr);

	const std::unique_ptr<pcre2_match_data_8, MatchDataDeleter>
		match_data(pcre2_match_data_create_from_pattern_8(re, nullptr));
	if (!match_data)
		return false;

	int n = pcre2_match_8(re, (PCRE2_SPTR8)s.data(), s.size(),
			      0, 0, match_data.get(), nullptr);
	return n >= 0;
}
