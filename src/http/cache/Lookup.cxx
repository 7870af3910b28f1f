// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Lookup.hxx"
#include "Key.hxx"

#include <assert.h>

void
CacheLookup::Start(CacheStore &store, const CacheKey &key) noexcept
{
	assert(pending == 0);
	assert(!done);

	pending = 2;
	store.Get(key.body, body);
	store.Get(key.content_type, content_type);
}

void
CacheLookup::OnResult(std::exception_ptr error) noexcept
{
	assert(pending > 0);
	--pending;

	/* the handler call must be the last thing in each branch,
	   because it may destroy this object */

	if (done) {
		if (pending == 0)
			handler.OnCacheLookupIdle();
		return;
	}

	if (error) {
		done = true;
		handler.OnCacheLookupError(std::move(error));
		return;
	}

	if (pending == 0) {
		done = true;
		handler.OnCacheLookupDone(std::move(body.value),
					  std::move(content_type.value));
	}
}
