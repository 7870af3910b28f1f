// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

struct HttpRequest;
class HttpResponseSink;

/**
 * A stage in the request processing pipeline.  Implementations
 * generate the response, possibly asynchronously, and must eventually
 * call HttpResponseSink::End().  The request and the response sink
 * remain valid until then.
 */
class HttpRequestHandler {
public:
	virtual void HandleHttpRequest(HttpRequest &request,
				       HttpResponseSink &response) noexcept = 0;
};
