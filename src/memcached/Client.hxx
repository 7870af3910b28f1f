// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * memcached client implementation.
 */

#pragma once

#include "Protocol.hxx"
#include "store/KeyValueClient.hxx"
#include "event/DeferEvent.hxx"

#include <boost/intrusive/list.hpp>

#include <exception>

#include <sys/socket.h>

struct bufferevent;
class EventLoop;

/**
 * A #KeyValueClient which talks to a memcached server using the
 * binary protocol.  Requests are pipelined on one connection;
 * responses are matched with requests in submission order.
 *
 * After a connection error, all pending and all future requests
 * fail with #MemcachedClientError.
 */
class MemcachedClient final : public KeyValueClient {
	struct Request final
		: boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::normal_link>> {
		const MemcachedOpcode opcode;

		uint32_t message_id = 0;

		/**
		 * Exactly one of these is set for a request whose
		 * result is of interest.
		 */
		CacheStoreGetHandler *const get_handler;
		CacheStoreSetHandler *const set_handler;

		/**
		 * Only used while the request is in the "failed" list.
		 */
		std::exception_ptr error;

		Request(MemcachedOpcode _opcode,
			CacheStoreGetHandler *_get_handler,
			CacheStoreSetHandler *_set_handler) noexcept
			:opcode(_opcode),
			 get_handler(_get_handler), set_handler(_set_handler) {}

		void InvokeError(std::exception_ptr ep) noexcept;
	};

	EventLoop &event_loop;

	struct bufferevent *bev;

	using RequestList =
		boost::intrusive::list<Request,
				       boost::intrusive::constant_time_size<false>>;

	/**
	 * Requests which were sent and are waiting for a response, in
	 * submission order.
	 */
	RequestList pending;

	/**
	 * Requests which have failed before they were sent; they are
	 * reported by #defer_failed.
	 */
	RequestList failed;

	DeferEvent defer_failed;

	/**
	 * The connection error.  If set, no new request will be sent.
	 */
	std::exception_ptr error;

	uint32_t next_message_id = 1;

public:
	/**
	 * Use an already connected socket.  The client takes ownership
	 * of the file descriptor.
	 *
	 * Throws MemcachedClientError on error.
	 */
	MemcachedClient(EventLoop &_event_loop, int fd);

	/**
	 * Connect to the given address.  Requests submitted before the
	 * connection is established are queued.
	 *
	 * Throws MemcachedClientError on error.
	 */
	MemcachedClient(EventLoop &_event_loop,
			const struct sockaddr *address, socklen_t address_length);

	/**
	 * Close the connection.  Handlers of pending requests are not
	 * invoked.
	 */
	~MemcachedClient() noexcept override;

	MemcachedClient(const MemcachedClient &) = delete;
	MemcachedClient &operator=(const MemcachedClient &) = delete;

	[[gnu::pure]]
	bool IsConnectionAlive() const noexcept {
		return !error;
	}

	/* virtual methods from class KeyValueClient */
	void Get(std::string_view key,
		 CacheStoreGetHandler &handler) noexcept override;
	void Set(std::string_view key, std::string_view value,
		 CacheStoreSetHandler *handler) noexcept override;
	void SetEx(std::string_view key, std::chrono::seconds ttl,
		   std::string_view value,
		   CacheStoreSetHandler *handler) noexcept override;
	void Del(std::string_view key,
		 CacheStoreSetHandler *handler) noexcept override;

private:
	void Setup();

	void Submit(Request &request, MemcachedOpcode opcode,
		    const void *extras, std::size_t extras_length,
		    std::string_view key, std::string_view value) noexcept;

	void Fail(Request &request, std::exception_ptr ep) noexcept;

	void OnDeferredFailed() noexcept;

	/**
	 * Fail all pending requests and refuse new ones.
	 */
	void Abort(std::exception_ptr ep) noexcept;

	/**
	 * Parse and dispatch all complete responses in the input
	 * buffer.
	 */
	void ConsumeInput() noexcept;

	/**
	 * Dispatch one response to the first pending request.
	 *
	 * Throws MemcachedClientError on protocol error.
	 */
	void HandleResponse(const MemcachedResponseHeader &header,
			    std::string_view extras,
			    std::string_view value);

	static void ReadCallback(struct bufferevent *bev, void *ctx) noexcept;
	static void EventCallback(struct bufferevent *bev, short events,
				  void *ctx) noexcept;
};
