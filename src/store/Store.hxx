// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * The key/value store interface used by the web cache.
 */

#pragma once

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <string_view>

class CacheStoreGetHandler {
public:
	/**
	 * The lookup has finished.
	 *
	 * @param value the value or std::nullopt if the key does not
	 * exist or has expired
	 */
	virtual void OnCacheStoreValue(std::optional<std::string> value) noexcept = 0;

	virtual void OnCacheStoreError(std::exception_ptr error) noexcept = 0;
};

class CacheStoreSetHandler {
public:
	virtual void OnCacheStoreDone() noexcept = 0;
	virtual void OnCacheStoreError(std::exception_ptr error) noexcept = 0;
};

/**
 * A key/value store with per-record expiry.  All operations are
 * asynchronous: the handler is never invoked from within the call.
 * Implementations must tolerate any number of concurrent operations.
 */
class CacheStore {
public:
	virtual ~CacheStore() noexcept = default;

	/**
	 * Look up a key.  The handler must remain valid until it has
	 * been invoked.
	 */
	virtual void Get(std::string_view key,
			 CacheStoreGetHandler &handler) noexcept = 0;

	/**
	 * Store a value.  An empty value deletes the key.
	 *
	 * @param ttl the time to live; zero means "no expiry" (see the
	 * implementation for its granularity)
	 * @param handler an optional handler which gets notified on
	 * completion; nullptr means "fire and forget"
	 */
	virtual void Set(std::string_view key, std::string_view value,
			 std::chrono::milliseconds ttl,
			 CacheStoreSetHandler *handler=nullptr) noexcept = 0;
};
