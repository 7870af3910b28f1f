// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Store.hxx"
#include "event/DeferEvent.hxx"

#include <boost/intrusive/list.hpp>

#include <map>

class EventLoop;

/**
 * A #CacheStore implementation which keeps all records in a map in
 * the current process.  It is meant for tests and single-process
 * setups: there is no size limit and no eviction except for expiry,
 * which is checked lazily when a record is read.  Millisecond TTLs
 * are honored exactly.
 *
 * Unless the environment variable WEBCACHE_ENV is "test", the
 * constructor logs a warning.
 */
class MemoryStore : public CacheStore {
public:
	using Clock = std::chrono::steady_clock;

private:
	struct Record {
		std::string value;

		/**
		 * Only meaningful if ttl is positive.
		 */
		Clock::time_point expires;

		std::chrono::milliseconds ttl;

		[[gnu::pure]]
		bool IsExpired(Clock::time_point now) const noexcept {
			return ttl.count() > 0 && now >= expires;
		}
	};

	std::map<std::string, Record, std::less<>> data;

	/**
	 * A completion which waits to be delivered to its handler.
	 */
	class Completion
		: public boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::normal_link>> {
	public:
		virtual ~Completion() noexcept = default;
		virtual void Invoke() noexcept = 0;
	};

	class GetCompletion;
	class SetCompletion;

	boost::intrusive::list<Completion,
			       boost::intrusive::constant_time_size<false>> completions;

	DeferEvent defer_completions;

public:
	explicit MemoryStore(EventLoop &event_loop) noexcept;
	~MemoryStore() noexcept override;

	MemoryStore(const MemoryStore &) = delete;
	MemoryStore &operator=(const MemoryStore &) = delete;

	[[gnu::pure]]
	std::size_t GetSize() const noexcept {
		return data.size();
	}

	void Clear() noexcept {
		data.clear();
	}

	/* virtual methods from class CacheStore */
	void Get(std::string_view key,
		 CacheStoreGetHandler &handler) noexcept override;
	void Set(std::string_view key, std::string_view value,
		 std::chrono::milliseconds ttl,
		 CacheStoreSetHandler *handler=nullptr) noexcept override;

protected:
	/**
	 * Obtain the current time.  May be overridden by unit tests.
	 */
	virtual Clock::time_point Now() const noexcept {
		return Clock::now();
	}

private:
	std::optional<std::string> Lookup(std::string_view key) noexcept;

	void AddCompletion(Completion &c) noexcept;
	void OnDeferredCompletions() noexcept;
};
