// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "DeferEvent.hxx"

#include <boost/intrusive/list.hpp>

struct event_base;

/**
 * Wrapper for a struct event_base.  In addition to the libevent
 * events, it manages a list of #DeferEvent instances which are
 * invoked before the loop waits for I/O.
 */
class EventLoop {
	struct event_base *const event_base;

	boost::intrusive::list<DeferEvent,
			       boost::intrusive::member_hook<DeferEvent,
							     DeferEvent::SiblingsHook,
							     &DeferEvent::siblings>,
			       boost::intrusive::constant_time_size<false>> defer;

	bool quit = false;

public:
	/**
	 * Throws std::runtime_error if libevent fails to allocate the
	 * event_base.
	 */
	EventLoop();
	~EventLoop() noexcept;

	EventLoop(const EventLoop &other) = delete;
	EventLoop &operator=(const EventLoop &other) = delete;

	struct event_base *Get() noexcept {
		return event_base;
	}

	/**
	 * Run the loop until Break() is called or until there are no
	 * more registered events.
	 */
	void Dispatch() noexcept;

	/**
	 * Run all pending deferred calls and all I/O events which are
	 * ready right now, without blocking.
	 */
	bool LoopNonBlock() noexcept;

	/**
	 * Like LoopNonBlock(), but wait for at least one event.
	 */
	bool LoopOnce() noexcept;

	void Break() noexcept;

	[[gnu::pure]]
	bool HasDeferred() const noexcept {
		return !defer.empty();
	}

	void Defer(DeferEvent &e) noexcept;
	void CancelDefer(DeferEvent &e) noexcept;

private:
	bool Loop(int flags) noexcept;

	bool RunDeferred() noexcept;
};
