// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "store/Store.hxx"

struct CacheKey;

class CacheLookupHandler {
public:
	/**
	 * Both values have arrived.
	 */
	virtual void OnCacheLookupDone(std::optional<std::string> body,
				       std::optional<std::string> content_type) noexcept = 0;

	/**
	 * One of the two reads has failed.  This is invoked at most
	 * once; the other result is discarded.  The #CacheLookup may
	 * still be pending (see OnCacheLookupIdle()).
	 */
	virtual void OnCacheLookupError(std::exception_ptr error) noexcept = 0;

	/**
	 * The last outstanding read has finished after
	 * OnCacheLookupError() had already been invoked.  After this
	 * call, the #CacheLookup may be destroyed.
	 */
	virtual void OnCacheLookupIdle() noexcept = 0;
};

/**
 * Reads the body and the content type of a cache entry concurrently
 * and joins the two results: the handler is invoked after both have
 * arrived (in any order), or as soon as the first error arrives.
 *
 * The object must not be destroyed while IsPending() is true,
 * because the store still holds references to it.
 */
class CacheLookup {
	class Slot final : public CacheStoreGetHandler {
		CacheLookup &parent;

	public:
		std::optional<std::string> value;

		explicit Slot(CacheLookup &_parent) noexcept
			:parent(_parent) {}

		/* virtual methods from class CacheStoreGetHandler */
		void OnCacheStoreValue(std::optional<std::string> _value) noexcept override {
			value = std::move(_value);
			parent.OnResult(nullptr);
		}

		void OnCacheStoreError(std::exception_ptr error) noexcept override {
			parent.OnResult(std::move(error));
		}
	};

	CacheLookupHandler &handler;

	Slot body{*this}, content_type{*this};

	/**
	 * The number of store callbacks which have not yet arrived.
	 */
	unsigned pending = 0;

	/**
	 * Has the handler been invoked already?
	 */
	bool done = false;

public:
	explicit CacheLookup(CacheLookupHandler &_handler) noexcept
		:handler(_handler) {}

	CacheLookup(const CacheLookup &) = delete;
	CacheLookup &operator=(const CacheLookup &) = delete;

	bool IsPending() const noexcept {
		return pending > 0;
	}

	/**
	 * Submit both reads.  May only be called once.
	 */
	void Start(CacheStore &store, const CacheKey &key) noexcept;

private:
	void OnResult(std::exception_ptr error) noexcept;
};
