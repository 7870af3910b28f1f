// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <boost/intrusive/list_hook.hpp>

#include <functional>

class EventLoop;

/**
 * Defer execution until the next event loop iteration.  Use this to
 * move calls out of the current stack frame, to avoid surprising side
 * effects for callers up in the call chain.
 */
class DeferEvent final {
	friend class EventLoop;

	using SiblingsHook = boost::intrusive::list_member_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>>;
	SiblingsHook siblings;

	EventLoop &loop;

	using Callback = std::function<void()>;
	const Callback callback;

public:
	DeferEvent(EventLoop &_loop, Callback _callback) noexcept
		:loop(_loop), callback(std::move(_callback)) {}

	DeferEvent(const DeferEvent &) = delete;
	DeferEvent &operator=(const DeferEvent &) = delete;

	EventLoop &GetEventLoop() const noexcept {
		return loop;
	}

	bool IsPending() const noexcept {
		return siblings.is_linked();
	}

	void Schedule() noexcept;
	void Cancel() noexcept;

private:
	void OnDeferred() noexcept {
		callback();
	}
};
