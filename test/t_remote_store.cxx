// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "store/RemoteStore.hxx"
#include "store/KeyValueClient.hxx"
#include "RecordingStoreHandler.hxx"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using std::chrono_literals::operator""ms;
using std::chrono_literals::operator""s;

/**
 * A #KeyValueClient which records all calls in a human-readable
 * form.
 */
class RecordingClient final : public KeyValueClient {
public:
	std::vector<std::string> calls;

	CacheStoreGetHandler *get_handler = nullptr;
	CacheStoreSetHandler *set_handler = nullptr;

	/* virtual methods from class KeyValueClient */
	void Get(std::string_view key,
		 CacheStoreGetHandler &handler) noexcept override {
		calls.emplace_back("get " + std::string{key});
		get_handler = &handler;
	}

	void Set(std::string_view key, std::string_view value,
		 CacheStoreSetHandler *handler) noexcept override {
		calls.emplace_back("set " + std::string{key} + " " +
				   std::string{value});
		set_handler = handler;
	}

	void SetEx(std::string_view key, std::chrono::seconds ttl,
		   std::string_view value,
		   CacheStoreSetHandler *handler) noexcept override {
		calls.emplace_back("setex " + std::string{key} + " " +
				   std::to_string(ttl.count()) + " " +
				   std::string{value});
		set_handler = handler;
	}

	void Del(std::string_view key,
		 CacheStoreSetHandler *handler) noexcept override {
		calls.emplace_back("del " + std::string{key});
		set_handler = handler;
	}
};

TEST(RemoteStore, Get)
{
	RecordingClient client;
	RemoteStore store(client);

	RecordingGetHandler handler;
	store.Get("foo", handler);
	ASSERT_EQ(client.calls.size(), 1u);
	ASSERT_EQ(client.calls.front(), "get foo");

	/* the result is passed through unchanged */
	ASSERT_EQ(client.get_handler, &handler);
	client.get_handler->OnCacheStoreValue("bar");
	ASSERT_EQ(handler.value, "bar");
}

TEST(RemoteStore, SetWithExpiry)
{
	RecordingClient client;
	RemoteStore store(client);

	RecordingSetHandler handler;
	store.Set("foo", "bar", 3600000ms, &handler);
	store.Set("foo", "bar", 1000ms);
	store.Set("foo", "bar", 1999ms);

	const std::vector<std::string> expected{
		"setex foo 3600 bar",
		"setex foo 1 bar",
		"setex foo 1 bar",
	};
	ASSERT_EQ(client.calls, expected);
}

TEST(RemoteStore, SubSecond)
{
	RecordingClient client;
	RemoteStore store(client);

	/* below one second, the record is stored without expiry */
	store.Set("foo", "bar", 999ms);
	store.Set("foo", "bar", 100ms);
	store.Set("foo", "bar", 0ms);
	store.Set("foo", "bar", -1s);

	const std::vector<std::string> expected{
		"set foo bar",
		"set foo bar",
		"set foo bar",
		"set foo bar",
	};
	ASSERT_EQ(client.calls, expected);
}

TEST(RemoteStore, EmptyValueDeletes)
{
	RecordingClient client;
	RemoteStore store(client);

	RecordingSetHandler handler;
	store.Set("foo", {}, 60s, &handler);

	ASSERT_EQ(client.calls.size(), 1u);
	ASSERT_EQ(client.calls.front(), "del foo");
	ASSERT_EQ(client.set_handler, &handler);

	client.set_handler->OnCacheStoreDone();
	ASSERT_TRUE(handler.success);
}
