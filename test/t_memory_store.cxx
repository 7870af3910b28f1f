// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ManualClockStore.hxx"
#include "RecordingStoreHandler.hxx"
#include "FlushEventLoop.hxx"
#include "event/Loop.hxx"

#include <gtest/gtest.h>

using std::chrono_literals::operator""ms;
using std::string_view_literals::operator""sv;

static std::optional<std::string>
Get(EventLoop &event_loop, CacheStore &store, std::string_view key)
{
	RecordingGetHandler handler;
	store.Get(key, handler);
	EXPECT_FALSE(handler.IsDone());

	FlushPending(event_loop);
	EXPECT_EQ(handler.n_calls, 1u);
	EXPECT_EQ(handler.error, nullptr);
	return std::move(handler.value);
}

TEST(MemoryStore, Missing)
{
	EventLoop event_loop;
	ManualClockStore store(event_loop);

	ASSERT_EQ(Get(event_loop, store, "foo"), std::nullopt);
}

TEST(MemoryStore, SetGet)
{
	EventLoop event_loop;
	ManualClockStore store(event_loop);

	RecordingSetHandler set_handler;
	store.Set("foo", "bar", 1000ms, &set_handler);

	/* completions are never delivered synchronously */
	ASSERT_FALSE(set_handler.IsDone());

	FlushPending(event_loop);
	ASSERT_EQ(set_handler.n_calls, 1u);
	ASSERT_TRUE(set_handler.success);

	ASSERT_EQ(Get(event_loop, store, "foo"), "bar");
	ASSERT_EQ(store.GetSize(), 1u);
}

TEST(MemoryStore, Binary)
{
	EventLoop event_loop;
	ManualClockStore store(event_loop);

	const auto value = "\0\x01\xff\r\n"sv;
	store.Set("bin", value, {});
	ASSERT_EQ(Get(event_loop, store, "bin"), std::string{value});
}

TEST(MemoryStore, Overwrite)
{
	EventLoop event_loop;
	ManualClockStore store(event_loop);

	store.Set("foo", "a", {});
	store.Set("foo", "b", 100ms);
	ASSERT_EQ(Get(event_loop, store, "foo"), "b");

	/* the new TTL applies */
	store.Advance(100ms);
	ASSERT_EQ(Get(event_loop, store, "foo"), std::nullopt);
}

TEST(MemoryStore, EmptyValueDeletes)
{
	EventLoop event_loop;
	ManualClockStore store(event_loop);

	store.Set("foo", "bar", {});
	ASSERT_EQ(store.GetSize(), 1u);

	RecordingSetHandler set_handler;
	store.Set("foo", {}, 1000ms, &set_handler);
	ASSERT_EQ(store.GetSize(), 0u);

	FlushPending(event_loop);
	ASSERT_TRUE(set_handler.success);
	ASSERT_EQ(Get(event_loop, store, "foo"), std::nullopt);

	/* deleting a missing key is not an error */
	RecordingSetHandler set_handler2;
	store.Set("nothing", {}, {}, &set_handler2);
	FlushPending(event_loop);
	ASSERT_TRUE(set_handler2.success);
}

TEST(MemoryStore, Expiry)
{
	EventLoop event_loop;
	ManualClockStore store(event_loop);

	store.Set("foo", "bar", 100ms);

	store.Advance(99ms);
	ASSERT_EQ(Get(event_loop, store, "foo"), "bar");
	ASSERT_EQ(store.GetSize(), 1u);

	/* expired at exactly "created + ttl" */
	store.Advance(1ms);
	ASSERT_EQ(Get(event_loop, store, "foo"), std::nullopt);

	/* purged by the read */
	ASSERT_EQ(store.GetSize(), 0u);
}

TEST(MemoryStore, ExpiryIsLazy)
{
	EventLoop event_loop;
	ManualClockStore store(event_loop);

	store.Set("foo", "bar", 100ms);
	store.Set("other", "x", {});
	store.Advance(std::chrono::hours(1));

	/* nothing is purged until the record is read */
	ASSERT_EQ(store.GetSize(), 2u);
	ASSERT_EQ(Get(event_loop, store, "other"), "x");
	ASSERT_EQ(store.GetSize(), 2u);

	ASSERT_EQ(Get(event_loop, store, "foo"), std::nullopt);
	ASSERT_EQ(store.GetSize(), 1u);
}

TEST(MemoryStore, NoExpiry)
{
	EventLoop event_loop;
	ManualClockStore store(event_loop);

	store.Set("foo", "bar", {});
	store.Advance(std::chrono::hours(24 * 365));
	ASSERT_EQ(Get(event_loop, store, "foo"), "bar");

	/* negative TTL is treated like zero */
	store.Set("neg", "x", -5ms);
	store.Advance(std::chrono::hours(1));
	ASSERT_EQ(Get(event_loop, store, "neg"), "x");
}

TEST(MemoryStore, HugeTtl)
{
	EventLoop event_loop;
	ManualClockStore store(event_loop);

	/* more than the clock can represent in nanoseconds */
	store.Set("foo", "bar", 10000000000000ms);
	ASSERT_EQ(Get(event_loop, store, "foo"), "bar");

	store.Set("max", "x", std::chrono::milliseconds::max());
	store.Advance(std::chrono::hours(24 * 365));
	ASSERT_EQ(Get(event_loop, store, "max"), "x");
	ASSERT_EQ(Get(event_loop, store, "foo"), "bar");

	/* a large TTL which fits is still honored */
	store.Set("year", "y", std::chrono::hours(24 * 365));
	store.Advance(std::chrono::hours(24 * 365));
	ASSERT_EQ(Get(event_loop, store, "year"), std::nullopt);
}

TEST(MemoryStore, ConcurrentGets)
{
	EventLoop event_loop;
	ManualClockStore store(event_loop);

	store.Set("a", "1", {});
	store.Set("b", "2", {});

	RecordingGetHandler a, b, c;
	store.Get("a", a);
	store.Get("b", b);
	store.Get("c", c);

	FlushPending(event_loop);
	ASSERT_EQ(a.value, "1");
	ASSERT_EQ(b.value, "2");
	ASSERT_TRUE(c.IsDone());
	ASSERT_EQ(c.value, std::nullopt);
}

TEST(MemoryStore, SnapshotAtCall)
{
	EventLoop event_loop;
	ManualClockStore store(event_loop);

	store.Set("foo", "old", {});

	/* the value is looked up when Get() is called, not when the
	   handler is invoked */
	RecordingGetHandler handler;
	store.Get("foo", handler);
	store.Set("foo", "new", {});

	FlushPending(event_loop);
	ASSERT_EQ(handler.value, "old");
}

TEST(MemoryStore, DestroyWithPending)
{
	EventLoop event_loop;
	RecordingGetHandler handler;

	{
		ManualClockStore store(event_loop);
		store.Get("foo", handler);
	}

	/* the handler was not invoked, and nothing is left in the
	   loop */
	ASSERT_FALSE(event_loop.HasDeferred());
	FlushPending(event_loop);
	ASSERT_FALSE(handler.IsDone());
}
