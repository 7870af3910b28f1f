// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Method.hxx"
#include "HeaderMap.hxx"

#include <string>

/**
 * An incoming HTTP request, already parsed by the server which hosts
 * the request handlers.
 */
struct HttpRequest {
	HttpMethod method = HttpMethod::GET;

	/**
	 * The request URI: path and optional query string.
	 */
	std::string uri;

	HeaderMap headers;
};
