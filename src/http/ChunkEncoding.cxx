// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ChunkEncoding.hxx"

static constexpr int
ParseHexDigit(char ch) noexcept
{
	if (ch >= '0' && ch <= '9')
		return ch - '0';
	else if (ch >= 'a' && ch <= 'f')
		return ch - 'a' + 0xa;
	else if (ch >= 'A' && ch <= 'F')
		return ch - 'A' + 0xa;
	else
		return -1;
}

static std::string
DecodeHex(std::string_view src)
{
	std::string dest;
	dest.reserve(src.size() / 2);

	for (std::size_t i = 0; i + 1 < src.size(); i += 2) {
		const int hi = ParseHexDigit(src[i]);
		const int lo = ParseHexDigit(src[i + 1]);
		if (hi < 0 || lo < 0)
			break;

		dest.push_back(char((hi << 4) | lo));
	}

	return dest;
}

static std::string
DecodeAscii(std::string_view src)
{
	std::string dest;
	dest.reserve(src.size());
	for (char ch : src)
		dest.push_back(char(ch & 0x7f));
	return dest;
}

/**
 * Decode one UTF-8 sequence starting at src[i] and advance i.
 * Malformed sequences yield the byte value itself.
 */
static char32_t
NextCodePoint(std::string_view src, std::size_t &i) noexcept
{
	const unsigned char lead = src[i++];
	unsigned n;
	char32_t cp;

	if (lead < 0x80)
		return lead;
	else if ((lead & 0xe0) == 0xc0) {
		n = 1;
		cp = lead & 0x1f;
	} else if ((lead & 0xf0) == 0xe0) {
		n = 2;
		cp = lead & 0x0f;
	} else if ((lead & 0xf8) == 0xf0) {
		n = 3;
		cp = lead & 0x07;
	} else
		return lead;

	if (i + n > src.size())
		return lead;

	for (unsigned j = 0; j < n; ++j) {
		const unsigned char ch = src[i + j];
		if ((ch & 0xc0) != 0x80)
			return lead;

		cp = (cp << 6) | (ch & 0x3f);
	}

	i += n;
	return cp;
}

static std::string
DecodeLatin1(std::string_view src)
{
	std::string dest;
	dest.reserve(src.size());

	for (std::size_t i = 0; i < src.size();)
		dest.push_back(char(NextCodePoint(src, i) & 0xff));

	return dest;
}

std::string
DecodeChunk(std::string_view chunk, ChunkEncoding encoding)
{
	switch (encoding) {
	case ChunkEncoding::BINARY:
	case ChunkEncoding::UTF8:
		break;

	case ChunkEncoding::ASCII:
		return DecodeAscii(chunk);

	case ChunkEncoding::LATIN1:
		return DecodeLatin1(chunk);

	case ChunkEncoding::HEX:
		return DecodeHex(chunk);
	}

	return std::string{chunk};
}
