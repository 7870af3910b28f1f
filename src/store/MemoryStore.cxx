// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "MemoryStore.hxx"
#include "Logger.hxx"

#include <stdlib.h>
#include <string.h>

class MemoryStore::GetCompletion final : public Completion {
	CacheStoreGetHandler &handler;
	std::optional<std::string> value;

public:
	GetCompletion(CacheStoreGetHandler &_handler,
		      std::optional<std::string> &&_value) noexcept
		:handler(_handler), value(std::move(_value)) {}

	void Invoke() noexcept override {
		handler.OnCacheStoreValue(std::move(value));
	}
};

class MemoryStore::SetCompletion final : public Completion {
	CacheStoreSetHandler &handler;

public:
	explicit SetCompletion(CacheStoreSetHandler &_handler) noexcept
		:handler(_handler) {}

	void Invoke() noexcept override {
		handler.OnCacheStoreDone();
	}
};

[[gnu::pure]]
static bool
IsTestEnvironment() noexcept
{
	const char *env = getenv("WEBCACHE_ENV");
	return env != nullptr && strcmp(env, "test") == 0;
}

MemoryStore::MemoryStore(EventLoop &event_loop) noexcept
	:defer_completions(event_loop, [this]{ OnDeferredCompletions(); })
{
	if (!IsTestEnvironment())
		LogConcat(1, "webcache",
			  "MUST not use MemoryStore in production env.");
}

MemoryStore::~MemoryStore() noexcept
{
	completions.clear_and_dispose([](Completion *c){ delete c; });
}

/**
 * The largest TTL which can be added to the given time point without
 * overflowing the clock.
 */
[[gnu::const]]
static std::chrono::milliseconds
MaxTtl(MemoryStore::Clock::time_point now) noexcept
{
	return std::chrono::duration_cast<std::chrono::milliseconds>(MemoryStore::Clock::time_point::max() - now);
}

inline std::optional<std::string>
MemoryStore::Lookup(std::string_view key) noexcept
{
	auto i = data.find(key);
	if (i == data.end())
		return std::nullopt;

	if (i->second.IsExpired(Now())) {
		data.erase(i);
		return std::nullopt;
	}

	return i->second.value;
}

void
MemoryStore::Get(std::string_view key,
		 CacheStoreGetHandler &handler) noexcept
{
	AddCompletion(*new GetCompletion(handler, Lookup(key)));
}

void
MemoryStore::Set(std::string_view key, std::string_view value,
		 std::chrono::milliseconds ttl,
		 CacheStoreSetHandler *handler) noexcept
{
	if (value.empty()) {
		auto i = data.find(key);
		if (i != data.end())
			data.erase(i);
	} else {
		const auto now = Now();

		if (ttl.count() < 0 || ttl >= MaxTtl(now))
			/* negative or beyond the range of the clock: never
			   expires */
			ttl = {};

		auto &record = data[std::string{key}];
		record.value.assign(value);
		record.ttl = ttl;
		record.expires = now + ttl;
	}

	if (handler != nullptr)
		AddCompletion(*new SetCompletion(*handler));
}

void
MemoryStore::AddCompletion(Completion &c) noexcept
{
	completions.push_back(c);
	defer_completions.Schedule();
}

void
MemoryStore::OnDeferredCompletions() noexcept
{
	/* the list may grow while we're invoking handlers; those new
	   completions are delivered in this run, too */
	while (!completions.empty())
		completions.pop_front_and_dispose([](Completion *c){
			c->Invoke();
			delete c;
		});
}
