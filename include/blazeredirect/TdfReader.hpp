#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "Tdf.hpp"

namespace com { namespace blazeredirect { namespace tdf {

// Reads fields from a borrowed byte range. Operations answer false on
// failure and record why; see getError().
class TdfReader {
public:
	static const size_t MAX_DEPTH = 32;

	TdfReader(const uint8_t *src, const uint8_t *limit);
	TdfReader(const Bytes &src);

	const uint8_t *getCursor() const { return m_cursor; }
	void           setCursor(const uint8_t *cursor);
	size_t         remaining() const { return m_limit - m_cursor; }
	bool           atEnd() const { return m_cursor >= m_limit; }
	bool           atGroupEnd() const; // next byte is TDF_GROUP_END

	const DecodeError& getError() const { return m_error; }
	void               clearError();
	bool               fail(const DecodeError &error); // record error and answer false

	// raw values, no field header
	bool readByte(uint8_t *dst);
	bool readBool(bool *dst);
	bool readVarInt(uint64_t *dst);
	bool readU8(uint8_t *dst);   // varints are narrowed by truncation
	bool readU16(uint16_t *dst);
	bool readU32(uint32_t *dst);
	bool readString(std::string *dst);
	bool readBlob(Bytes *dst);
	bool readHeader(std::string *outName, uint8_t *outType);
	bool readGroupEnd(); // consume the one terminator byte of a group

	// scan forward to the field named name, skipping the others. the
	// cursor is left on the field's value.
	bool findTag(const char *name, TdfType type_);

	// as findTag, but a missing field answers true with *present false and
	// the cursor and error left as they were.
	bool tryFindTag(const char *name, TdfType type_, bool *present);

	bool tagVarInt(const char *name, uint64_t *dst);
	bool tagBool(const char *name, bool *dst);
	bool tagU8(const char *name, uint8_t *dst);
	bool tagU16(const char *name, uint16_t *dst);
	bool tagU32(const char *name, uint32_t *dst);
	bool tagString(const char *name, std::string *dst);
	bool tagBlob(const char *name, Bytes *dst);
	bool tagGroup(const char *name); // also consumes a TDF_GROUP_PREFIX

	bool tryTagVarInt(const char *name, uint64_t *dst, bool *present);
	bool tryTagString(const char *name, std::string *dst, bool *present);

	// read the union named name. if set, the VALU field header is consumed
	// (its type must be valueType) and the cursor is left on its payload,
	// past any TDF_GROUP_PREFIX.
	bool tagUnion(const char *name, TdfType valueType, uint8_t *outDiscriminant, bool *outIsSet);

	bool skipValue(uint8_t type_);
	bool skipGroup();

protected:
	bool skipValue(uint8_t type_, size_t depth);
	bool skipGroup(size_t depth);
	bool skipBytes(size_t len);
	void skipGroupPrefix();
	bool eof();

	const uint8_t *m_start;
	const uint8_t *m_cursor;
	const uint8_t *m_limit;
	DecodeError    m_error;
};

} } } // namespace com::blazeredirect::tdf
