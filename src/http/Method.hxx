// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <string_view>

enum class HttpMethod : uint_least8_t {
	UNKNOWN,
	HEAD,
	GET,
	POST,
	PUT,
	DELETE,
	OPTIONS,
	TRACE,
	PATCH,
};

/**
 * Parse an upper-case method name.  Returns HttpMethod::UNKNOWN if
 * the name is not recognized.
 */
[[gnu::pure]]
HttpMethod
ParseHttpMethod(std::string_view name) noexcept;

[[gnu::const]]
const char *
HttpMethodToString(HttpMethod method) noexcept;
