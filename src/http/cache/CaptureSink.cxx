// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CaptureSink.hxx"
#include "http/CommonHeaders.hxx"

static std::optional<std::string>
OptionalString(const char *s) noexcept
{
	if (s == nullptr)
		return std::nullopt;

	return std::string{s};
}

void
CaptureSink::Write(std::string_view chunk, ChunkEncoding encoding) noexcept
{
	if (ended)
		return;

	next.Write(chunk, encoding);

	if (chunk.empty())
		return;

	if (IsBinary(encoding))
		chunks.emplace_back(chunk);
	else
		chunks.emplace_back(DecodeChunk(chunk, encoding));

	size += chunks.back().size();
}

std::string
CaptureSink::ConcatChunks() const noexcept
{
	if (chunks.size() == 1)
		return chunks.front();

	std::string result;
	result.reserve(size);
	for (const auto &i : chunks)
		result.append(i);
	return result;
}

void
CaptureSink::End() noexcept
{
	if (ended)
		return;

	ended = true;

	/* copy everything we need before ending the real response,
	   because "next" may be gone after that */
	CapturedResponse response{
		.status = next.GetStatus(),
		.content_type = OptionalString(next.GetHeader(content_type_header)),
		.cache_control = OptionalString(next.GetHeader(cache_control_header)),
		.body = ConcatChunks(),
	};

	chunks.clear();
	chunks.shrink_to_fit();

	next.End();

	handler.OnCaptureSinkEnd(std::move(response));
}
