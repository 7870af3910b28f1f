// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Client.hxx"
#include "Error.hxx"
#include "event/Loop.hxx"
#include "Logger.hxx"

#include <event2/buffer.h>
#include <event2/bufferevent.h>
#include <event2/util.h>
#include <event2/event.h>

#include <fmt/format.h>

#include <memory>

#include <arpa/inet.h>
#include <string.h>
#include <time.h>
#include <unistd.h>

/**
 * memcached interprets expiration values above this as an absolute
 * UNIX time stamp.
 */
static constexpr std::chrono::seconds MEMCACHED_RELATIVE_EXPIRATION_MAX{60 * 60 * 24 * 30};

static uint32_t
ToMemcachedExpiration(std::chrono::seconds ttl) noexcept
{
	if (ttl <= std::chrono::seconds::zero())
		return 0;

	if (ttl > MEMCACHED_RELATIVE_EXPIRATION_MAX)
		return uint32_t(time(nullptr) + ttl.count());

	return uint32_t(ttl.count());
}

void
MemcachedClient::Request::InvokeError(std::exception_ptr ep) noexcept
{
	if (get_handler != nullptr)
		get_handler->OnCacheStoreError(ep);
	else if (set_handler != nullptr)
		set_handler->OnCacheStoreError(ep);
}

MemcachedClient::MemcachedClient(EventLoop &_event_loop, int fd)
	:event_loop(_event_loop),
	 bev(bufferevent_socket_new(event_loop.Get(), fd,
				    BEV_OPT_CLOSE_ON_FREE)),
	 defer_failed(event_loop, [this]{ OnDeferredFailed(); })
{
	if (bev == nullptr) {
		close(fd);
		throw MemcachedClientError("bufferevent_socket_new() failed");
	}

	Setup();
}

MemcachedClient::MemcachedClient(EventLoop &_event_loop,
				 const struct sockaddr *address,
				 socklen_t address_length)
	:event_loop(_event_loop),
	 bev(bufferevent_socket_new(event_loop.Get(), -1,
				    BEV_OPT_CLOSE_ON_FREE)),
	 defer_failed(event_loop, [this]{ OnDeferredFailed(); })
{
	if (bev == nullptr)
		throw MemcachedClientError("bufferevent_socket_new() failed");

	if (bufferevent_socket_connect(bev, address, address_length) < 0) {
		bufferevent_free(bev);
		throw MemcachedClientError("Failed to connect to memcached");
	}

	Setup();
}

MemcachedClient::~MemcachedClient() noexcept
{
	defer_failed.Cancel();

	const auto dispose = [](Request *request){ delete request; };
	pending.clear_and_dispose(dispose);
	failed.clear_and_dispose(dispose);

	bufferevent_free(bev);
}

void
MemcachedClient::Setup()
{
	bufferevent_setcb(bev, ReadCallback, nullptr, EventCallback, this);

	if (bufferevent_enable(bev, EV_READ|EV_WRITE) < 0) {
		bufferevent_free(bev);
		throw MemcachedClientError("bufferevent_enable() failed");
	}
}

void
MemcachedClient::Get(std::string_view key,
		     CacheStoreGetHandler &handler) noexcept
{
	auto *request = new Request(MemcachedOpcode::GET, &handler, nullptr);
	Submit(*request, MemcachedOpcode::GET, nullptr, 0, key, {});
}

void
MemcachedClient::Set(std::string_view key, std::string_view value,
		     CacheStoreSetHandler *handler) noexcept
{
	SetEx(key, std::chrono::seconds::zero(), value, handler);
}

void
MemcachedClient::SetEx(std::string_view key, std::chrono::seconds ttl,
		       std::string_view value,
		       CacheStoreSetHandler *handler) noexcept
{
	const MemcachedSetExtras extras{
		0,
		htonl(ToMemcachedExpiration(ttl)),
	};

	auto *request = new Request(MemcachedOpcode::SET, nullptr, handler);
	Submit(*request, MemcachedOpcode::SET, &extras, sizeof(extras),
	       key, value);
}

void
MemcachedClient::Del(std::string_view key,
		     CacheStoreSetHandler *handler) noexcept
{
	auto *request = new Request(MemcachedOpcode::DELETE, nullptr, handler);
	Submit(*request, MemcachedOpcode::DELETE, nullptr, 0, key, {});
}

void
MemcachedClient::Submit(Request &request, MemcachedOpcode opcode,
			const void *extras, std::size_t extras_length,
			std::string_view key, std::string_view value) noexcept
{
	if (error) {
		Fail(request, error);
		return;
	}

	if (key.empty() || key.size() > MEMCACHED_KEY_MAX) {
		Fail(request, std::make_exception_ptr(MemcachedClientError(fmt::format("Invalid memcached key length {}",
											  key.size()))));
		return;
	}

	if (value.size() > MEMCACHED_VALUE_MAX) {
		Fail(request, std::make_exception_ptr(MemcachedClientError("Value too large for memcached")));
		return;
	}

	request.message_id = next_message_id++;

	MemcachedRequestHeader header{};
	header.magic = uint8_t(MemcachedMagic::REQUEST);
	header.opcode = uint8_t(opcode);
	header.key_length = htons(uint16_t(key.size()));
	header.extras_length = uint8_t(extras_length);
	header.body_length = htonl(uint32_t(extras_length + key.size() +
					    value.size()));
	/* the opaque field is echoed verbatim; no byte order
	   conversion needed */
	header.message_id = request.message_id;

	pending.push_back(request);

	struct evbuffer *output = bufferevent_get_output(bev);
	if (evbuffer_add(output, &header, sizeof(header)) < 0 ||
	    (extras_length > 0 &&
	     evbuffer_add(output, extras, extras_length) < 0) ||
	    evbuffer_add(output, key.data(), key.size()) < 0 ||
	    (!value.empty() &&
	     evbuffer_add(output, value.data(), value.size()) < 0))
		/* a partially queued request would corrupt the
		   stream */
		Abort(std::make_exception_ptr(MemcachedClientError("Failed to queue memcached request")));
}

void
MemcachedClient::Fail(Request &request, std::exception_ptr ep) noexcept
{
	request.error = std::move(ep);
	failed.push_back(request);
	defer_failed.Schedule();
}

void
MemcachedClient::OnDeferredFailed() noexcept
{
	while (!failed.empty()) {
		std::unique_ptr<Request> request(&failed.front());
		failed.pop_front();

		request->InvokeError(request->error);
	}
}

void
MemcachedClient::Abort(std::exception_ptr ep) noexcept
{
	if (!error) {
		LogConcat(2, "memcached", ep);
		error = ep;
		bufferevent_disable(bev, EV_READ|EV_WRITE);
	}

	while (!pending.empty()) {
		auto &request = pending.front();
		pending.pop_front();
		Fail(request, ep);
	}
}

void
MemcachedClient::HandleResponse(const MemcachedResponseHeader &header,
				std::string_view,
				std::string_view value)
{
	if (pending.empty())
		throw MemcachedClientError("Unexpected response from memcached");

	auto &front = pending.front();
	if (header.message_id != front.message_id)
		throw MemcachedClientError(fmt::format("memcached response id mismatch: expected {}, got {}",
						       front.message_id,
						       header.message_id));

	if (header.opcode != uint8_t(front.opcode))
		throw MemcachedClientError("memcached response opcode mismatch");

	pending.pop_front();
	const std::unique_ptr<Request> request(&front);

	const auto status = MemcachedStatus(ntohs(header.status));

	if (status == MemcachedStatus::NO_ERROR) {
		if (request->get_handler != nullptr)
			request->get_handler->OnCacheStoreValue(std::string{value});
		else if (request->set_handler != nullptr)
			request->set_handler->OnCacheStoreDone();
		return;
	}

	if (status == MemcachedStatus::KEY_NOT_FOUND) {
		if (request->get_handler != nullptr) {
			request->get_handler->OnCacheStoreValue(std::nullopt);
			return;
		}

		if (request->opcode == MemcachedOpcode::DELETE) {
			if (request->set_handler != nullptr)
				request->set_handler->OnCacheStoreDone();
			return;
		}
	}

	/* the body of an error response carries a human-readable
	   message */
	std::string msg = value.empty()
		? fmt::format("memcached error {}", unsigned(status))
		: fmt::format("memcached error {}: {}", unsigned(status), value);

	request->InvokeError(std::make_exception_ptr(MemcachedStatusError(status, msg)));
}

void
MemcachedClient::ConsumeInput() noexcept
{
	struct evbuffer *input = bufferevent_get_input(bev);

	while (!error) {
		const std::size_t available = evbuffer_get_length(input);
		if (available < sizeof(MemcachedResponseHeader))
			break;

		MemcachedResponseHeader header;
		evbuffer_copyout(input, &header, sizeof(header));

		if (header.magic != uint8_t(MemcachedMagic::RESPONSE)) {
			Abort(std::make_exception_ptr(MemcachedClientError("Wrong magic in memcached response")));
			return;
		}

		const std::size_t body_length = ntohl(header.body_length);
		const std::size_t key_length = ntohs(header.key_length);
		if (header.extras_length + key_length > body_length ||
		    body_length > MEMCACHED_VALUE_MAX + 1024) {
			Abort(std::make_exception_ptr(MemcachedClientError("Malformed memcached response")));
			return;
		}

		if (available < sizeof(header) + body_length)
			/* wait for more data */
			break;

		evbuffer_drain(input, sizeof(header));

		std::string body(body_length, '\0');
		evbuffer_remove(input, body.data(), body_length);

		const std::string_view b(body);

		try {
			HandleResponse(header,
				       b.substr(0, header.extras_length),
				       b.substr(header.extras_length + key_length));
		} catch (...) {
			Abort(std::current_exception());
			return;
		}
	}
}

void
MemcachedClient::ReadCallback(struct bufferevent *, void *ctx) noexcept
{
	auto &client = *(MemcachedClient *)ctx;
	client.ConsumeInput();
}

void
MemcachedClient::EventCallback(struct bufferevent *, short events,
			       void *ctx) noexcept
{
	auto &client = *(MemcachedClient *)ctx;

	if (events & BEV_EVENT_EOF) {
		client.Abort(std::make_exception_ptr(MemcachedClientError("memcached server closed the connection")));
	} else if (events & BEV_EVENT_ERROR) {
		const int e = EVUTIL_SOCKET_ERROR();
		client.Abort(std::make_exception_ptr(MemcachedClientError(fmt::format("memcached connection error: {}",
										      strerror(e)))));
	}
}
