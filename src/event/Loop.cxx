// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Loop.hxx"

#include <event2/event.h>

#include <stdexcept>

#include <assert.h>

static struct event_base *
CreateEventBase()
{
	struct event_base *base = event_base_new();
	if (base == nullptr)
		throw std::runtime_error("event_base_new() failed");
	return base;
}

EventLoop::EventLoop()
	:event_base(CreateEventBase()) {}

EventLoop::~EventLoop() noexcept
{
	assert(defer.empty());

	event_base_free(event_base);
}

void
EventLoop::Dispatch() noexcept
{
	quit = false;

	RunDeferred();
	while (!quit && Loop(EVLOOP_ONCE))
		RunDeferred();
}

bool
EventLoop::LoopNonBlock() noexcept
{
	quit = false;
	return RunDeferred() && Loop(EVLOOP_NONBLOCK) && RunDeferred();
}

bool
EventLoop::LoopOnce() noexcept
{
	quit = false;
	return RunDeferred() && Loop(EVLOOP_ONCE) && RunDeferred();
}

void
EventLoop::Break() noexcept
{
	quit = true;
	event_base_loopbreak(event_base);
}

bool
EventLoop::Loop(int flags) noexcept
{
	return event_base_loop(event_base, flags) == 0;
}

void
EventLoop::Defer(DeferEvent &e) noexcept
{
	defer.push_back(e);
}

void
EventLoop::CancelDefer(DeferEvent &e) noexcept
{
	defer.erase(defer.iterator_to(e));
}

bool
EventLoop::RunDeferred() noexcept
{
	while (!defer.empty() && !quit)
		defer.pop_front_and_dispose([](DeferEvent *e){
			e->OnDeferred();
		});

	return true;
}
