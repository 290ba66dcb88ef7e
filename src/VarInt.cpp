// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cstring>

#include "../include/blazeredirect/VarInt.hpp"

namespace com { namespace blazeredirect { namespace tdf {

size_t VarInt::encode(uint64_t val, void *dst)
{
	uint8_t buf[MAX_VARINT_SIZE];
	size_t rv = 0;

	if(val < SIGN_FLAG)
		buf[rv++] = (uint8_t)val;
	else
	{
		buf[rv++] = (uint8_t)(val & 0x3f) | CONTINUE_FLAG;
		val >>= 6;
		while(val >= CONTINUE_FLAG)
		{
			buf[rv++] = (uint8_t)(val & 0x7f) | CONTINUE_FLAG;
			val >>= 7;
		}
		buf[rv++] = (uint8_t)val;
	}

	if(dst)
		memmove(dst, buf, rv);

	return rv;
}

void VarInt::append(uint64_t val, std::vector<uint8_t> &dst)
{
	uint8_t buf[MAX_VARINT_SIZE];
	size_t rv = encode(val, buf);
	dst.insert(dst.end(), buf, buf + rv);
}

size_t VarInt::parse(const uint8_t *src, const uint8_t *limit, uint64_t *val)
{
	const uint8_t *cursor = src;

	if(cursor >= limit)
		return 0;

	uint8_t each = *cursor++;
	uint64_t value = each & 0x3f;
	unsigned shift = 6;

	while(each & CONTINUE_FLAG)
	{
		if(cursor >= limit)
			return 0;

		each = *cursor++;
		if(shift < 64) // anything past 64 bits is consumed and dropped
			value |= uint64_t(each & 0x7f) << shift;
		shift += 7;
	}

	if(val)
		*val = value;

	return cursor - src;
}

} } } // namespace com::blazeredirect::tdf
