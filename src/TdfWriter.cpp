// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "../include/blazeredirect/TdfWriter.hpp"
#include "../include/blazeredirect/VarInt.hpp"

namespace com { namespace blazeredirect { namespace tdf {

Bytes TdfWriter::take()
{
	Bytes rv;
	rv.swap(m_buffer);
	return rv;
}

void TdfWriter::clear()
{
	m_buffer.clear();
}

void TdfWriter::tag(const char *name, TdfType type_)
{
	uint8_t packed[Tag::ENCODED_SIZE] = { 0 };
	Tag::encode(name, packed);
	m_buffer.insert(m_buffer.end(), packed, packed + sizeof(packed));
	m_buffer.push_back((uint8_t)type_);
}

void TdfWriter::tagVarInt(const char *name, uint64_t value)
{
	tag(name, TDF_VARINT);
	writeVarInt(value);
}

void TdfWriter::tagBool(const char *name, bool value)
{
	tag(name, TDF_VARINT);
	writeBool(value);
}

void TdfWriter::tagU8(const char *name, uint8_t value) { tagVarInt(name, value); }
void TdfWriter::tagU16(const char *name, uint16_t value) { tagVarInt(name, value); }
void TdfWriter::tagU32(const char *name, uint32_t value) { tagVarInt(name, value); }
void TdfWriter::tagU64(const char *name, uint64_t value) { tagVarInt(name, value); }

void TdfWriter::tagString(const char *name, const std::string &value)
{
	tag(name, TDF_STRING);
	writeString(value);
}

void TdfWriter::tagBlob(const char *name, const uint8_t *value, size_t len)
{
	tag(name, TDF_BLOB);
	writeBlob(value, len);
}

void TdfWriter::tagBlob(const char *name, const Bytes &value)
{
	tagBlob(name, value.data(), value.size());
}

void TdfWriter::tagPair(const char *name, uint64_t a, uint64_t b)
{
	tag(name, TDF_PAIR);
	writeVarInt(a);
	writeVarInt(b);
}

void TdfWriter::tagTriple(const char *name, uint64_t a, uint64_t b, uint64_t c)
{
	tag(name, TDF_TRIPLE);
	writeVarInt(a);
	writeVarInt(b);
	writeVarInt(c);
}

void TdfWriter::tagVarIntList(const char *name, const std::vector<uint64_t> &values)
{
	tag(name, TDF_VARINT_LIST);
	writeVarInt(values.size());
	for(auto it = values.begin(); it != values.end(); it++)
		writeVarInt(*it);
}

void TdfWriter::tagGroupStart(const char *name)
{
	tag(name, TDF_GROUP);
}

void TdfWriter::tagGroupEnd()
{
	writeByte(TDF_GROUP_END);
}

void TdfWriter::tagUnionStart(const char *name, uint8_t discriminant)
{
	tag(name, TDF_UNION);
	writeByte(discriminant);
}

void TdfWriter::tagUnionUnset(const char *name)
{
	tagUnionStart(name, TDF_UNION_UNSET);
}

void TdfWriter::writeByte(uint8_t value)
{
	m_buffer.push_back(value);
}

void TdfWriter::writeBool(bool value)
{
	writeVarInt(value ? 1 : 0);
}

void TdfWriter::writeVarInt(uint64_t value)
{
	VarInt::append(value, m_buffer);
}

void TdfWriter::writeString(const std::string &value)
{
	writeVarInt(value.size() + 1);
	m_buffer.insert(m_buffer.end(), value.begin(), value.end());
	m_buffer.push_back(0);
}

void TdfWriter::writeBlob(const uint8_t *value, size_t len)
{
	writeVarInt(len);
	if(len)
		m_buffer.insert(m_buffer.end(), value, value + len);
}

} } } // namespace com::blazeredirect::tdf
