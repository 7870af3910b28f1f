// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "RemoteStore.hxx"
#include "KeyValueClient.hxx"

void
RemoteStore::Get(std::string_view key,
		 CacheStoreGetHandler &handler) noexcept
{
	client.Get(key, handler);
}

void
RemoteStore::Set(std::string_view key, std::string_view value,
		 std::chrono::milliseconds ttl,
		 CacheStoreSetHandler *handler) noexcept
{
	if (value.empty()) {
		client.Del(key, handler);
		return;
	}

	const auto seconds =
		std::chrono::duration_cast<std::chrono::seconds>(ttl);
	if (seconds.count() > 0)
		client.SetEx(key, seconds, value, handler);
	else
		client.Set(key, value, handler);
}
