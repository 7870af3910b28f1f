// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Status.hxx"
#include "ChunkEncoding.hxx"

#include <string_view>

/**
 * The outgoing side of an HTTP response.  Status and headers may be
 * modified until the first Write() call; the body is sent as a
 * sequence of Write() calls, terminated by End().
 *
 * The object must remain valid until End() has been called.
 */
class HttpResponseSink {
public:
	virtual ~HttpResponseSink() noexcept = default;

	virtual void SetStatus(HttpStatus status) noexcept = 0;

	[[gnu::pure]]
	virtual HttpStatus GetStatus() const noexcept = 0;

	virtual void SetHeader(std::string_view name, std::string_view value) = 0;

	/**
	 * @return the header value or nullptr if it was not set
	 */
	[[gnu::pure]]
	virtual const char *GetHeader(std::string_view name) const noexcept = 0;

	virtual void Write(std::string_view chunk,
			   ChunkEncoding encoding=ChunkEncoding::BINARY) noexcept = 0;

	/**
	 * Finish the response.  Calling End() more than once is
	 * allowed; subsequent calls are ignored.
	 */
	virtual void End() noexcept = 0;

	/**
	 * Write a last chunk (if not empty) and finish the response.
	 */
	void Send(std::string_view chunk,
		  ChunkEncoding encoding=ChunkEncoding::BINARY) noexcept {
		if (!chunk.empty())
			Write(chunk, encoding);
		End();
	}
};
