// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

/**
 * Describes how the bytes of a response body chunk passed to
 * HttpResponseSink::Write() are to be interpreted.
 */
enum class ChunkEncoding : uint_least8_t {
	/**
	 * Raw bytes, written as-is.
	 */
	BINARY,

	/**
	 * UTF-8 text; its bytes are written as-is.
	 */
	UTF8,

	/**
	 * 7 bit ASCII text; the high bit of each byte is cleared.
	 */
	ASCII,

	/**
	 * UTF-8 text which is converted to ISO-8859-1, one byte per
	 * code point (code points above 0xff are truncated).
	 */
	LATIN1,

	/**
	 * Pairs of hexadecimal digits; decoding stops at the first
	 * pair which is not valid.
	 */
	HEX,
};

[[gnu::const]]
inline bool
IsBinary(ChunkEncoding encoding) noexcept
{
	return encoding == ChunkEncoding::BINARY;
}

/**
 * Convert a chunk to the bytes which will be sent to the client.
 */
std::string
DecodeChunk(std::string_view chunk, ChunkEncoding encoding);
