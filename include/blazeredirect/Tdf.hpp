#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

// Tag/Data/Format: each field is a 3-byte packed tag, a type byte, and
// a value. Groups are closed by a 0x00 byte; unions are a discriminant
// byte followed by one field tagged VALU (or nothing if unset).

#include <cstdint>
#include <string>
#include <vector>

namespace com { namespace blazeredirect {

using Bytes = std::vector<uint8_t>;

namespace tdf {

enum TdfType {
	TDF_VARINT      = 0x00,
	TDF_STRING      = 0x01,
	TDF_BLOB        = 0x02,
	TDF_GROUP       = 0x03,
	TDF_LIST        = 0x04,
	TDF_MAP         = 0x05,
	TDF_UNION       = 0x06,
	TDF_VARINT_LIST = 0x07,
	TDF_PAIR        = 0x08,
	TDF_TRIPLE      = 0x09,
	TDF_FLOAT       = 0x0a
};

const uint8_t  TDF_GROUP_END        = 0x00;
const uint8_t  TDF_GROUP_PREFIX     = 0x02; // optional, ahead of a group's first field
const uint8_t  TDF_UNION_UNSET      = 0x7f;
const char     TDF_UNION_VALUE_TAG[] = "VALU";
const size_t   TDF_HEADER_SIZE      = 4; // tag[3] type[1]

const char *typeName(int type_); // "unknown" for values outside TdfType

class Tag {
public:
	static const size_t ENCODED_SIZE = 3;
	static const size_t MAX_LENGTH = 4;

	// characters past MAX_LENGTH are not encoded, see isValid().
	static void encode(const char *name, uint8_t *dst);
	static std::string decode(const uint8_t *src);

	// answer true if name is 1 to MAX_LENGTH characters of A-Z, 0-9 or '_'.
	static bool isValid(const char *name);
};

class DecodeError {
public:
	enum Code {
		NONE = 0,
		UNEXPECTED_EOF,
		MISSING_TAG,
		INVALID_TYPE,
		NESTING_TOO_DEEP
	};

	DecodeError() = default;
	DecodeError(Code code, const std::string &tag = std::string(), int expected = -1, int actual = -1);

	Code        code { NONE };
	std::string tag;
	int         expected { -1 }; // TdfType, or -1 if not applicable
	int         actual { -1 };

	bool isError() const { return NONE != code; }
	std::string toString() const;

	static const char *codeName(Code code);
};

} } } // namespace com::blazeredirect::tdf
