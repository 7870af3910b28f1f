// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "http/ResponseSink.hxx"

#include <optional>
#include <string>
#include <vector>

/**
 * What a #CaptureSink has seen of a response.
 */
struct CapturedResponse {
	HttpStatus status;

	std::optional<std::string> content_type;
	std::optional<std::string> cache_control;

	/**
	 * The complete body as sent to the client.
	 */
	std::string body;
};

class CaptureSinkHandler {
public:
	/**
	 * The response has been finished and passed on to the real
	 * sink.  The #CaptureSink may be destroyed by this method.
	 */
	virtual void OnCaptureSinkEnd(CapturedResponse &&response) noexcept = 0;
};

/**
 * A #HttpResponseSink decorator which forwards everything to another
 * sink and keeps a copy of the body.  Text chunks are decoded before
 * they are stored, so the copy contains exactly the bytes the client
 * receives.
 */
class CaptureSink final : public HttpResponseSink {
	HttpResponseSink &next;
	CaptureSinkHandler &handler;

	std::vector<std::string> chunks;

	/**
	 * The total size of all #chunks.
	 */
	std::size_t size = 0;

	bool ended = false;

public:
	CaptureSink(HttpResponseSink &_next,
		    CaptureSinkHandler &_handler) noexcept
		:next(_next), handler(_handler) {}

	CaptureSink(const CaptureSink &) = delete;
	CaptureSink &operator=(const CaptureSink &) = delete;

	std::size_t GetCapturedSize() const noexcept {
		return size;
	}

	bool IsEnded() const noexcept {
		return ended;
	}

	/* virtual methods from class HttpResponseSink */
	void SetStatus(HttpStatus status) noexcept override {
		next.SetStatus(status);
	}

	HttpStatus GetStatus() const noexcept override {
		return next.GetStatus();
	}

	void SetHeader(std::string_view name, std::string_view value) override {
		next.SetHeader(name, value);
	}

	const char *GetHeader(std::string_view name) const noexcept override {
		return next.GetHeader(name);
	}

	void Write(std::string_view chunk,
		   ChunkEncoding encoding=ChunkEncoding::BINARY) noexcept override;
	void End() noexcept override;

private:
	std::string ConcatChunks() const noexcept;
};
