// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Level based logging to stderr.
 *
 * Levels: 1 = errors and warnings, 2 = notable events, 3 = less
 * important events, 4 = per-request decisions, 5 = debugging.
 */

#pragma once

#include <fmt/format.h>

#include <exception>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

/**
 * Change the global verbosity.  Lines with a level above this value
 * are discarded.  The default is 1.
 */
void
SetLogLevel(unsigned level) noexcept;

[[gnu::pure]]
unsigned
GetLogLevel() noexcept;

[[gnu::pure]]
inline bool
IsLogLevelVisible(unsigned level) noexcept
{
	return level <= GetLogLevel();
}

/**
 * Write one line to stderr.  The level is not checked.
 */
void
LogLine(std::string_view domain, std::string_view msg) noexcept;

/**
 * Obtain the message of the given exception, including the messages
 * of all nested exceptions.
 */
std::string
GetFullMessage(std::exception_ptr ep) noexcept;

std::string
GetFullMessage(const std::exception &e) noexcept;

/**
 * Allows passing a std::exception_ptr to LogConcat(); it is
 * formatted with GetFullMessage().
 */
template<>
struct fmt::formatter<std::exception_ptr> : fmt::formatter<std::string_view> {
	template<typename FormatContext>
	auto format(const std::exception_ptr &ep, FormatContext &ctx) const {
		return fmt::formatter<std::string_view>::format(GetFullMessage(ep),
								ctx);
	}
};

/**
 * Format all arguments into one line and log it with the given
 * domain.  Arguments may be anything {fmt} can format.
 */
template<typename... Args>
void
LogConcat(unsigned level, std::string_view domain, Args&&... args) noexcept
{
	if (!IsLogLevelVisible(level))
		return;

	fmt::memory_buffer buffer;
	(fmt::format_to(std::back_inserter(buffer), "{}",
			std::forward<Args>(args)), ...);
	LogLine(domain, {buffer.data(), buffer.size()});
}

/**
 * A logger bound to a domain name which prefixes all lines.
 */
class Logger {
	std::string domain;

public:
	explicit Logger(std::string_view _domain) noexcept
		:domain(_domain) {}

	const std::string &GetDomain() const noexcept {
		return domain;
	}

	template<typename... Args>
	void operator()(unsigned level, Args&&... args) const noexcept {
		LogConcat(level, domain, std::forward<Args>(args)...);
	}
};
