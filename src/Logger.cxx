// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"

#include <fmt/core.h>

#include <stdio.h>

static unsigned log_level = 1;

void
SetLogLevel(unsigned level) noexcept
{
	log_level = level;
}

unsigned
GetLogLevel() noexcept
{
	return log_level;
}

void
LogLine(std::string_view domain, std::string_view msg) noexcept
{
	if (domain.empty())
		fmt::print(stderr, "{}\n", msg);
	else
		fmt::print(stderr, "[{}] {}\n", domain, msg);
}

static void
AppendNested(std::string &result, const std::exception &e) noexcept
{
	if (!result.empty())
		result += "; ";
	result += e.what();

	try {
		std::rethrow_if_nested(e);
	} catch (const std::exception &nested) {
		AppendNested(result, nested);
	} catch (...) {
		result += "; Unrecognized nested exception";
	}
}

std::string
GetFullMessage(const std::exception &e) noexcept
{
	std::string result;
	AppendNested(result, e);
	return result;
}

std::string
GetFullMessage(std::exception_ptr ep) noexcept
{
	if (!ep)
		return "Unknown error";

	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		return GetFullMessage(e);
	} catch (const char *s) {
		return s;
	} catch (...) {
		return "Unrecognized exception";
	}
}
