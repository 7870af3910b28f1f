// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Method.hxx"

static constexpr HttpMethod all_methods[] = {
	HttpMethod::HEAD,
	HttpMethod::GET,
	HttpMethod::POST,
	HttpMethod::PUT,
	HttpMethod::DELETE,
	HttpMethod::OPTIONS,
	HttpMethod::TRACE,
	HttpMethod::PATCH,
};

HttpMethod
ParseHttpMethod(std::string_view name) noexcept
{
	for (const auto method : all_methods)
		if (name == HttpMethodToString(method))
			return method;

	return HttpMethod::UNKNOWN;
}

const char *
HttpMethodToString(HttpMethod method) noexcept
{
	switch (method) {
	case HttpMethod::UNKNOWN:
		break;

	case HttpMethod::HEAD:
		return "HEAD";

	case HttpMethod::GET:
		return "GET";

	case HttpMethod::POST:
		return "POST";

	case HttpMethod::PUT:
		return "PUT";

	case HttpMethod::DELETE:
		return "DELETE";

	case HttpMethod::OPTIONS:
		return "OPTIONS";

	case HttpMethod::TRACE:
		return "TRACE";

	case HttpMethod::PATCH:
		return "PATCH";
	}

	return nullptr;
}
