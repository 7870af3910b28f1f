// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Protocol.hxx"

#include <stdexcept>
#include <string>

class MemcachedClientError : public std::runtime_error {
public:
	explicit MemcachedClientError(const char *_msg)
		:std::runtime_error(_msg) {}

	explicit MemcachedClientError(const std::string &_msg)
		:std::runtime_error(_msg) {}
};

/**
 * The server has responded with an error status.
 */
class MemcachedStatusError : public MemcachedClientError {
	MemcachedStatus status;

public:
	MemcachedStatusError(MemcachedStatus _status, const std::string &_msg)
		:MemcachedClientError(_msg), status(_status) {}

	MemcachedStatus GetStatus() const noexcept {
		return status;
	}
};
