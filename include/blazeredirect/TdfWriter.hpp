#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "Tdf.hpp"

namespace com { namespace blazeredirect { namespace tdf {

class TdfWriter {
public:
	TdfWriter() = default;

	const Bytes& bytes() const { return m_buffer; }
	Bytes        take();
	void         clear();

	// field header: packed tag followed by the type byte
	void tag(const char *name, TdfType type_);

	void tagVarInt(const char *name, uint64_t value);
	void tagBool(const char *name, bool value);
	void tagU8(const char *name, uint8_t value);
	void tagU16(const char *name, uint16_t value);
	void tagU32(const char *name, uint32_t value);
	void tagU64(const char *name, uint64_t value);
	void tagString(const char *name, const std::string &value);
	void tagBlob(const char *name, const uint8_t *value, size_t len);
	void tagBlob(const char *name, const Bytes &value);
	void tagPair(const char *name, uint64_t a, uint64_t b);
	void tagTriple(const char *name, uint64_t a, uint64_t b, uint64_t c);
	void tagVarIntList(const char *name, const std::vector<uint64_t> &values);

	// a group's fields follow tagGroupStart() and are closed by tagGroupEnd().
	void tagGroupStart(const char *name);
	void tagGroupEnd();

	// a set union is followed by exactly one field tagged TDF_UNION_VALUE_TAG.
	void tagUnionStart(const char *name, uint8_t discriminant);
	void tagUnionUnset(const char *name);

	void writeByte(uint8_t value);
	void writeBool(bool value);
	void writeVarInt(uint64_t value);
	void writeString(const std::string &value); // length includes the terminating NUL
	void writeBlob(const uint8_t *value, size_t len);

protected:
	Bytes m_buffer;
};

} } } // namespace com::blazeredirect::tdf
