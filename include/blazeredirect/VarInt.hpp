#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

// TDF variable length integers. The first byte holds the low 6 bits
// (0x80 continue, 0x40 sign), each following byte 7 more (0x80 continue),
// least significant group first.

#include <cstdint>
#include <cstdlib>
#include <vector>

namespace com { namespace blazeredirect { namespace tdf {

class VarInt {
public:
	static const size_t MAX_VARINT_SIZE = 1 + ((64 - 6) + 6) / 7; // 10

	static const uint8_t CONTINUE_FLAG = 0x80;
	static const uint8_t SIGN_FLAG     = 0x40;

	static size_t encode(uint64_t val, void *dst);
	static void   append(uint64_t val, std::vector<uint8_t> &dst);

	// answer bytes consumed, or 0 if the encoding runs past limit.
	static size_t parse(const uint8_t *src, const uint8_t *limit, uint64_t *val);
};

} } } // namespace com::blazeredirect::tdf
