// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Rule.hxx"
#include "http/Handler.hxx"
#include "Logger.hxx"

#include <string>

struct WebCacheConfig;
class CacheStore;

/**
 * A #HttpRequestHandler which caches the responses of another
 * handler.
 *
 * For a "GET" request which matches a rule, the body and the content
 * type are looked up in the #CacheStore.  If the body is found (and
 * the client did not send "Cache-Control: no-cache"), it is served
 * from the cache and the "next" handler is not invoked.  Otherwise,
 * the request is forwarded to the "next" handler, and a successful
 * response ("200 OK" with a content type, a non-empty body and no
 * "Cache-Control: no-cache") is stored.
 *
 * Store errors are logged and make the request bypass the cache; they
 * are never reported to the client.
 */
class WebCache final : public HttpRequestHandler {
	class Request;

	CacheStore &store;
	HttpRequestHandler &next;

	const CacheRuleList rules;

	const std::string version;

	const Logger logger;

public:
	/**
	 * Throws std::invalid_argument if the configuration has no
	 * rules, Pcre2Error if a rule pattern is malformed.
	 */
	WebCache(CacheStore &_store, HttpRequestHandler &_next,
		 const WebCacheConfig &config);

	WebCache(const WebCache &) = delete;
	WebCache &operator=(const WebCache &) = delete;

	/* virtual methods from class HttpRequestHandler */
	void HandleHttpRequest(HttpRequest &request,
			       HttpResponseSink &response) noexcept override;
};
