// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * memcached (binary) protocol specific declarations.
 */

#pragma once

#include <cstddef>
#include <cstdint>

enum class MemcachedMagic : uint8_t {
	REQUEST = 0x80,
	RESPONSE = 0x81,
};

enum class MemcachedOpcode : uint8_t {
	GET = 0x00,
	SET = 0x01,
	ADD = 0x02,
	REPLACE = 0x03,
	DELETE = 0x04,
	INCREMENT = 0x05,
	DECREMENT = 0x06,
	QUIT = 0x07,
	FLUSH = 0x08,
	NOOP = 0x0a,
	APPEND = 0x0e,
	PREPEND = 0x0f,
	STAT = 0x10,
};

enum class MemcachedStatus : uint16_t {
	NO_ERROR = 0x0000,
	KEY_NOT_FOUND = 0x0001,
	KEY_EXISTS = 0x0002,
	VALUE_TOO_LARGE = 0x0003,
	INVALID_ARGUMENTS = 0x0004,
	ITEM_NOT_STORED = 0x0005,
	UNKNOWN_COMMAND = 0x0081,
	OUT_OF_MEMORY = 0x0082,
};

/* all multi-byte integers are big-endian */

struct MemcachedRequestHeader {
	uint8_t magic;
	uint8_t opcode;
	uint16_t key_length;
	uint8_t extras_length;
	uint8_t data_type;
	uint16_t reserved;
	uint32_t body_length;
	uint32_t message_id;
	uint8_t cas[8];
};

struct MemcachedResponseHeader {
	uint8_t magic;
	uint8_t opcode;
	uint16_t key_length;
	uint8_t extras_length;
	uint8_t data_type;
	uint16_t status;
	uint32_t body_length;
	uint32_t message_id;
	uint8_t cas[8];
};

struct MemcachedSetExtras {
	uint32_t flags;
	uint32_t expiration;
};

static_assert(sizeof(MemcachedRequestHeader) == 24);
static_assert(sizeof(MemcachedResponseHeader) == 24);
static_assert(sizeof(MemcachedSetExtras) == 8);

static constexpr std::size_t MEMCACHED_KEY_MAX = 250;
static constexpr std::size_t MEMCACHED_VALUE_MAX = 0x10000000;
