// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Store.hxx"

/**
 * The primitives of a remote key/value server client (memcached,
 * Redis, ...).  Results are reported to the #CacheStore handler
 * interfaces; a nullptr handler means nobody is interested in the
 * result.
 */
class KeyValueClient {
public:
	virtual ~KeyValueClient() noexcept = default;

	virtual void Get(std::string_view key,
			 CacheStoreGetHandler &handler) noexcept = 0;

	/**
	 * Store a value without expiry.
	 */
	virtual void Set(std::string_view key, std::string_view value,
			 CacheStoreSetHandler *handler) noexcept = 0;

	/**
	 * Store a value which expires after the given number of
	 * seconds.
	 */
	virtual void SetEx(std::string_view key, std::chrono::seconds ttl,
			   std::string_view value,
			   CacheStoreSetHandler *handler) noexcept = 0;

	/**
	 * Delete a key.  Deleting a key which does not exist is not
	 * an error.
	 */
	virtual void Del(std::string_view key,
			 CacheStoreSetHandler *handler) noexcept = 0;
};
