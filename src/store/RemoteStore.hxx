// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Store.hxx"

class KeyValueClient;

/**
 * Adapter which implements #CacheStore on top of a remote key/value
 * server client.
 *
 * Remote servers expire records with a resolution of whole seconds.
 * A TTL of at least one second is rounded down to seconds; a TTL
 * below one second (including zero) stores the record without expiry,
 * i.e. it stays until the server evicts it.  Sub-second cache rules
 * therefore behave differently than with #MemoryStore.
 */
class RemoteStore final : public CacheStore {
	KeyValueClient &client;

public:
	explicit RemoteStore(KeyValueClient &_client) noexcept
		:client(_client) {}

	/* virtual methods from class CacheStore */
	void Get(std::string_view key,
		 CacheStoreGetHandler &handler) noexcept override;
	void Set(std::string_view key, std::string_view value,
		 std::chrono::milliseconds ttl,
		 CacheStoreSetHandler *handler=nullptr) noexcept override;
};
