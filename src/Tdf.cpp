// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cstring>

#include "../include/blazeredirect/Tdf.hpp"

namespace com { namespace blazeredirect { namespace tdf {

const char *typeName(int type_)
{
	switch(type_)
	{
	case TDF_VARINT: return "VarInt";
	case TDF_STRING: return "String";
	case TDF_BLOB: return "Blob";
	case TDF_GROUP: return "Group";
	case TDF_LIST: return "List";
	case TDF_MAP: return "Map";
	case TDF_UNION: return "Union";
	case TDF_VARINT_LIST: return "VarIntList";
	case TDF_PAIR: return "Pair";
	case TDF_TRIPLE: return "Triple";
	case TDF_FLOAT: return "Float";
	default: return "unknown";
	}
}

// --- Tag

// each character keeps its 0x40 bit, its 0x10 bit and its low nibble.
// 0x20 is implied by the absence of 0x40 (digits).

static uint8_t _packChar(uint8_t ch)
{
	return ((ch & 0x40) >> 1) | (ch & 0x10) | (ch & 0x0f);
}

static char _unpackChar(uint8_t bits)
{
	uint8_t ch = ((bits & 0x20) << 1) | (bits & 0x10) | (bits & 0x0f);
	if(not (ch & 0x40))
		ch |= 0x20;
	return (char)ch;
}

void Tag::encode(const char *name, uint8_t *dst)
{
	size_t len = strlen(name);
	if(len > MAX_LENGTH)
		len = MAX_LENGTH;

	uint32_t packed = 0;
	for(size_t x = 0; x < MAX_LENGTH; x++)
		packed = (packed << 6) | (x < len ? _packChar(name[x]) : 0);

	dst[0] = (packed >> 16) & 0xff;
	dst[1] = (packed >>  8) & 0xff;
	dst[2] = (packed      ) & 0xff;
}

std::string Tag::decode(const uint8_t *src)
{
	uint32_t packed = (uint32_t(src[0]) << 16) | (uint32_t(src[1]) << 8) | src[2];
	std::string rv;

	for(int shift = 18; shift >= 0; shift -= 6)
	{
		uint8_t bits = (packed >> shift) & 0x3f;
		if(0 == bits)
			break; // padding
		rv.push_back(_unpackChar(bits));
	}

	return rv;
}

bool Tag::isValid(const char *name)
{
	size_t len = strlen(name);
	if((0 == len) or (len > MAX_LENGTH))
		return false;

	for(size_t x = 0; x < len; x++)
	{
		char ch = name[x];
		if(not (((ch >= 'A') and (ch <= 'Z')) or ((ch >= '0') and (ch <= '9')) or ('_' == ch)))
			return false;
	}

	return true;
}

// --- DecodeError

DecodeError::DecodeError(Code code_, const std::string &tag_, int expected_, int actual_) :
	code(code_),
	tag(tag_),
	expected(expected_),
	actual(actual_)
{}

const char *DecodeError::codeName(Code code)
{
	switch(code)
	{
	case NONE: return "none";
	case UNEXPECTED_EOF: return "unexpected end of input";
	case MISSING_TAG: return "missing tag";
	case INVALID_TYPE: return "invalid type";
	case NESTING_TOO_DEEP: return "nesting too deep";
	}

	return "unknown";
}

std::string DecodeError::toString() const
{
	std::string rv = codeName(code);

	if(not tag.empty())
		rv.append(" ").append(tag);
	if(expected >= 0)
		rv.append(" expected ").append(typeName(expected));
	if(actual >= 0)
		rv.append(" got ").append(typeName(actual));

	return rv;
}

} } } // namespace com::blazeredirect::tdf
