// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "../include/blazeredirect/TdfReader.hpp"
#include "../include/blazeredirect/VarInt.hpp"

namespace com { namespace blazeredirect { namespace tdf {

TdfReader::TdfReader(const uint8_t *src, const uint8_t *limit) :
	m_start(src),
	m_cursor(src),
	m_limit(limit < src ? src : limit)
{}

TdfReader::TdfReader(const Bytes &src) :
	TdfReader(src.data(), src.data() + src.size())
{}

void TdfReader::setCursor(const uint8_t *cursor)
{
	if((cursor >= m_start) and (cursor <= m_limit))
		m_cursor = cursor;
}

bool TdfReader::atGroupEnd() const
{
	return (not atEnd()) and (TDF_GROUP_END == *m_cursor);
}

void TdfReader::clearError()
{
	m_error = DecodeError();
}

bool TdfReader::fail(const DecodeError &error)
{
	m_error = error;
	return false;
}

bool TdfReader::eof()
{
	return fail(DecodeError(DecodeError::UNEXPECTED_EOF));
}

bool TdfReader::skipBytes(size_t len)
{
	if(remaining() < len)
		return eof();
	m_cursor += len;
	return true;
}

// --- raw values

bool TdfReader::readByte(uint8_t *dst)
{
	if(atEnd())
		return eof();
	*dst = *m_cursor++;
	return true;
}

bool TdfReader::readBool(bool *dst)
{
	uint64_t value;
	if(not readVarInt(&value))
		return false;
	*dst = (0 != value);
	return true;
}

bool TdfReader::readVarInt(uint64_t *dst)
{
	size_t rv = VarInt::parse(m_cursor, m_limit, dst);
	if(0 == rv)
		return eof();
	m_cursor += rv;
	return true;
}

bool TdfReader::readU8(uint8_t *dst)
{
	uint64_t value;
	if(not readVarInt(&value))
		return false;
	*dst = (uint8_t)value;
	return true;
}

bool TdfReader::readU16(uint16_t *dst)
{
	uint64_t value;
	if(not readVarInt(&value))
		return false;
	*dst = (uint16_t)value;
	return true;
}

bool TdfReader::readU32(uint32_t *dst)
{
	uint64_t value;
	if(not readVarInt(&value))
		return false;
	*dst = (uint32_t)value;
	return true;
}

bool TdfReader::readString(std::string *dst)
{
	uint64_t len;
	if(not readVarInt(&len))
		return false;
	if(remaining() < len)
		return eof();

	size_t textLen = len;
	if(textLen and (0 == m_cursor[textLen - 1]))
		textLen--;

	dst->assign((const char *)m_cursor, textLen);
	m_cursor += len;
	return true;
}

bool TdfReader::readBlob(Bytes *dst)
{
	uint64_t len;
	if(not readVarInt(&len))
		return false;
	if(remaining() < len)
		return eof();

	dst->assign(m_cursor, m_cursor + len);
	m_cursor += len;
	return true;
}

bool TdfReader::readHeader(std::string *outName, uint8_t *outType)
{
	if(remaining() < TDF_HEADER_SIZE)
		return eof();

	*outName = Tag::decode(m_cursor);
	*outType = m_cursor[Tag::ENCODED_SIZE];
	m_cursor += TDF_HEADER_SIZE;
	return true;
}

void TdfReader::skipGroupPrefix()
{
	if((not atEnd()) and (TDF_GROUP_PREFIX == *m_cursor))
		m_cursor++;
}

bool TdfReader::readGroupEnd()
{
	uint8_t terminator;
	return readByte(&terminator);
}

// --- tagged fields

bool TdfReader::findTag(const char *name, TdfType type_)
{
	std::string wanted(name);

	for(;;)
	{
		// the end of the input or of the enclosing group means the field isn't here
		if((remaining() < TDF_HEADER_SIZE) or atGroupEnd())
			return fail(DecodeError(DecodeError::MISSING_TAG, wanted, type_));

		std::string each;
		uint8_t eachType;
		if(not readHeader(&each, &eachType))
			return false;

		if(each != wanted)
		{
			if(not skipValue(eachType))
				return false;
			continue;
		}

		if(eachType != type_)
			return fail(DecodeError(DecodeError::INVALID_TYPE, wanted, type_, eachType));

		return true;
	}
}

bool TdfReader::tryFindTag(const char *name, TdfType type_, bool *present)
{
	const uint8_t *start = m_cursor;
	DecodeError saved = m_error;

	*present = findTag(name, type_);
	if(*present)
		return true;

	if(DecodeError::MISSING_TAG != m_error.code)
		return false;

	m_cursor = start;
	m_error = saved;
	return true;
}

bool TdfReader::tagVarInt(const char *name, uint64_t *dst)
{
	return findTag(name, TDF_VARINT) and readVarInt(dst);
}

bool TdfReader::tagBool(const char *name, bool *dst)
{
	return findTag(name, TDF_VARINT) and readBool(dst);
}

bool TdfReader::tagU8(const char *name, uint8_t *dst)
{
	return findTag(name, TDF_VARINT) and readU8(dst);
}

bool TdfReader::tagU16(const char *name, uint16_t *dst)
{
	return findTag(name, TDF_VARINT) and readU16(dst);
}

bool TdfReader::tagU32(const char *name, uint32_t *dst)
{
	return findTag(name, TDF_VARINT) and readU32(dst);
}

bool TdfReader::tagString(const char *name, std::string *dst)
{
	return findTag(name, TDF_STRING) and readString(dst);
}

bool TdfReader::tagBlob(const char *name, Bytes *dst)
{
	return findTag(name, TDF_BLOB) and readBlob(dst);
}

bool TdfReader::tagGroup(const char *name)
{
	if(not findTag(name, TDF_GROUP))
		return false;
	skipGroupPrefix();
	return true;
}

bool TdfReader::tryTagVarInt(const char *name, uint64_t *dst, bool *present)
{
	if(not tryFindTag(name, TDF_VARINT, present))
		return false;
	return (not *present) or readVarInt(dst);
}

bool TdfReader::tryTagString(const char *name, std::string *dst, bool *present)
{
	if(not tryFindTag(name, TDF_STRING, present))
		return false;
	return (not *present) or readString(dst);
}

bool TdfReader::tagUnion(const char *name, TdfType valueType, uint8_t *outDiscriminant, bool *outIsSet)
{
	if(not (findTag(name, TDF_UNION) and readByte(outDiscriminant)))
		return false;

	*outIsSet = (TDF_UNION_UNSET != *outDiscriminant);
	if(not *outIsSet)
		return true;

	std::string valueName;
	uint8_t valueTypeRead;
	if(not readHeader(&valueName, &valueTypeRead))
		return false;
	if(valueTypeRead != valueType)
		return fail(DecodeError(DecodeError::INVALID_TYPE, valueName, valueType, valueTypeRead));

	if(TDF_GROUP == valueType)
		skipGroupPrefix();
	return true;
}

// --- skipping

bool TdfReader::skipValue(uint8_t type_)
{
	return skipValue(type_, 0);
}

bool TdfReader::skipGroup()
{
	return skipGroup(0);
}

bool TdfReader::skipValue(uint8_t type_, size_t depth)
{
	if(depth > MAX_DEPTH)
		return fail(DecodeError(DecodeError::NESTING_TOO_DEEP));

	uint64_t len;
	uint64_t count;

	switch(type_)
	{
	case TDF_VARINT:
		return readVarInt(&len);

	case TDF_STRING:
	case TDF_BLOB:
		return readVarInt(&len) and skipBytes(len);

	case TDF_GROUP:
		return skipGroup(depth + 1);

	case TDF_LIST:
		{
			uint8_t valueType;
			if(not (readByte(&valueType) and readVarInt(&count)))
				return false;
			for(uint64_t x = 0; x < count; x++)
				if(not skipValue(valueType, depth + 1))
					return false;
			return true;
		}

	case TDF_MAP:
		{
			uint8_t keyType, valueType;
			if(not (readByte(&keyType) and readByte(&valueType) and readVarInt(&count)))
				return false;
			for(uint64_t x = 0; x < count; x++)
				if(not (skipValue(keyType, depth + 1) and skipValue(valueType, depth + 1)))
					return false;
			return true;
		}

	case TDF_UNION:
		{
			uint8_t discriminant;
			if(not readByte(&discriminant))
				return false;
			if(TDF_UNION_UNSET == discriminant)
				return true;

			std::string valueName;
			uint8_t valueType;
			return readHeader(&valueName, &valueType) and skipValue(valueType, depth + 1);
		}

	case TDF_VARINT_LIST:
		if(not readVarInt(&count))
			return false;
		for(uint64_t x = 0; x < count; x++)
			if(not readVarInt(&len))
				return false;
		return true;

	case TDF_PAIR:
		return readVarInt(&len) and readVarInt(&len);

	case TDF_TRIPLE:
		return readVarInt(&len) and readVarInt(&len) and readVarInt(&len);

	case TDF_FLOAT:
		return skipBytes(4);

	default:
		return fail(DecodeError(DecodeError::INVALID_TYPE, std::string(), -1, type_));
	}
}

bool TdfReader::skipGroup(size_t depth)
{
	if(depth > MAX_DEPTH)
		return fail(DecodeError(DecodeError::NESTING_TOO_DEEP));

	skipGroupPrefix();

	for(;;)
	{
		if(atEnd())
			return eof();
		if(atGroupEnd())
			return readGroupEnd();

		std::string name;
		uint8_t type_;
		if(not (readHeader(&name, &type_) and skipValue(type_, depth)))
			return false;
	}
}

} } } // namespace com::blazeredirect::tdf
