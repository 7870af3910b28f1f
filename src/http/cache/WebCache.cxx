// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "WebCache.hxx"
#include "Config.hxx"
#include "Key.hxx"
#include "Lookup.hxx"
#include "CaptureSink.hxx"
#include "store/Store.hxx"
#include "http/CacheControl.hxx"
#include "http/CommonHeaders.hxx"
#include "http/Request.hxx"
#include "http/ResponseSink.hxx"
#include "webcache/Version.hxx"

#include <fmt/format.h>

#include <optional>

class WebCache::Request final : CacheLookupHandler, public CaptureSinkHandler {
	WebCache &cache;

	HttpRequest &request;
	HttpResponseSink &response;

	const CacheRule &rule;

	const CacheKey key;

	CacheLookup lookup;

	/**
	 * Only set after a cache miss, while the "next" handler
	 * generates the response.
	 */
	std::optional<CaptureSink> capture;

	/**
	 * Has the response been finished?  Together with
	 * CacheLookup::IsPending(), this decides when this object can
	 * be destroyed.
	 */
	bool finished = false;

public:
	Request(WebCache &_cache,
		HttpRequest &_request, HttpResponseSink &_response,
		const CacheRule &_rule) noexcept
		:cache(_cache),
		 request(_request), response(_response),
		 rule(_rule),
		 key(MakeCacheKey(request.uri, rule, cache.version)),
		 lookup(*this) {}

	Request(const Request &) = delete;
	Request &operator=(const Request &) = delete;

	void Start() noexcept {
		lookup.Start(cache.store, key);
	}

private:
	void Destroy() noexcept {
		delete this;
	}

	void DestroyIfIdle() noexcept {
		if (finished && !lookup.IsPending())
			Destroy();
	}

	[[gnu::pure]]
	bool IsNoCacheRequest() const noexcept {
		return CacheControlHasNoCache(request.headers.Get(cache_control_header));
	}

	void ServeCached(std::string &&body,
			 std::optional<std::string> &&content_type) noexcept;

	/**
	 * Forward the request to the "next" handler and capture its
	 * response.
	 */
	void Forward() noexcept;

	[[gnu::pure]]
	bool IsStorable(const CapturedResponse &r) const noexcept;

	/* virtual methods from class CacheLookupHandler */
	void OnCacheLookupDone(std::optional<std::string> body,
			       std::optional<std::string> content_type) noexcept override;
	void OnCacheLookupError(std::exception_ptr error) noexcept override;
	void OnCacheLookupIdle() noexcept override;

	/* virtual methods from class CaptureSinkHandler */
	void OnCaptureSinkEnd(CapturedResponse &&r) noexcept override;
};

inline void
WebCache::Request::ServeCached(std::string &&body,
			       std::optional<std::string> &&content_type) noexcept
{
	cache.logger(4, "hit ", key.body);

	if (content_type)
		response.SetHeader(content_type_header, *content_type);

	response.SetHeader(x_cache_by_header, WEBCACHE_CACHE_BY);

	if (rule.client_cache && rule.max_age >= std::chrono::seconds(1)) {
		const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(rule.max_age);
		response.SetHeader(cache_control_header,
				   fmt::format("public, max-age={}",
					       seconds.count()));
	}

	response.SetStatus(HttpStatus::OK);
	response.Send(body);
}

inline void
WebCache::Request::Forward() noexcept
{
	capture.emplace(response, *this);
	cache.next.HandleHttpRequest(request, *capture);
}

inline bool
WebCache::Request::IsStorable(const CapturedResponse &r) const noexcept
{
	if (r.status != HttpStatus::OK)
		return false;

	if (r.cache_control && CacheControlHasNoCache(r.cache_control->c_str()))
		return false;

	return !r.body.empty() && r.content_type && !r.content_type->empty();
}

void
WebCache::Request::OnCacheLookupDone(std::optional<std::string> body,
				     std::optional<std::string> content_type) noexcept
{
	if (body && !body->empty()) {
		if (!IsNoCacheRequest()) {
			ServeCached(std::move(*body), std::move(content_type));

			finished = true;
			DestroyIfIdle();
			return;
		}

		cache.logger(4, "ignore ", key.body);
	} else
		cache.logger(4, "miss ", key.body);

	Forward();
}

void
WebCache::Request::OnCacheLookupError(std::exception_ptr error) noexcept
{
	cache.logger(1, "Failed to read ", key.body, " from cache: ", error);

	Forward();
}

void
WebCache::Request::OnCacheLookupIdle() noexcept
{
	DestroyIfIdle();
}

void
WebCache::Request::OnCaptureSinkEnd(CapturedResponse &&r) noexcept
{
	if (IsStorable(r)) {
		cache.logger(4, "store ", key.body);

		/* fire and forget; a failed write only means that
		   the next request will be a miss */
		cache.store.Set(key.body, r.body, rule.max_age);
		cache.store.Set(key.content_type, *r.content_type,
				rule.max_age);
	} else
		cache.logger(4, "nocache ", key.body);

	finished = true;
	DestroyIfIdle();
}

WebCache::WebCache(CacheStore &_store, HttpRequestHandler &_next,
		   const WebCacheConfig &config)
	:store(_store), next(_next),
	 rules(config),
	 version(config.version),
	 logger("webcache") {}

void
WebCache::HandleHttpRequest(HttpRequest &request,
			    HttpResponseSink &response) noexcept
{
	const CacheRule *rule = rules.Lookup(request);
	if (rule == nullptr) {
		next.HandleHttpRequest(request, response);
		return;
	}

	auto *r = new Request(*this, request, response, *rule);
	r->Start();
}
