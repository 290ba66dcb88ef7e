// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cstdio>
#include <cstring>

#include "../include/blazeredirect/TdfPrinter.hpp"
#include "../include/blazeredirect/Hex.hpp"

static void _indent(std::string &dst, size_t indent, size_t depth)
{
	dst.push_back('\n');
	dst.append(depth * indent, ' ');
}

static void _quoted(std::string &dst, const std::string &s)
{
	dst.push_back('"');

	for(auto it = s.begin(); it != s.end(); it++)
	{
		uint8_t each = *it;

		if(('\\' == each) or ('"' == each))
		{
			dst.push_back('\\');
			dst.push_back(each);
		}
		else if('\n' == each)
			dst.append("\\n");
		else if('\r' == each)
			dst.append("\\r");
		else if('\t' == each)
			dst.append("\\t");
		else if((each < 0x20) or (0x7f == each))
		{
			char buf[8];
			snprintf(buf, sizeof(buf), "\\x%02x", each);
			dst.append(buf);
		}
		else
			dst.push_back(each);
	}

	dst.push_back('"');
}

static void _decimal(std::string &dst, uint64_t value)
{
	char buf[24];
	snprintf(buf, sizeof(buf), "%llu", (unsigned long long)value);
	dst.append(buf);
}

namespace com { namespace blazeredirect { namespace tdf {

std::string TdfPrinter::repr(const uint8_t *src, const uint8_t *limit, size_t indent)
{
	std::string rv;
	TdfReader reader(src, limit);

	if(not reprFields(reader, rv, 0, indent, false))
		rv.append("\n!! ").append(reader.getError().toString());

	return rv;
}

std::string TdfPrinter::repr(const Bytes &src, size_t indent)
{
	return repr(src.data(), src.data() + src.size(), indent);
}

bool TdfPrinter::reprFields(TdfReader &reader, std::string &dst, size_t depth, size_t indent, bool inGroup)
{
	if(depth > TdfReader::MAX_DEPTH)
		return reader.fail(DecodeError(DecodeError::NESTING_TOO_DEEP));

	bool first = true;

	for(;;)
	{
		if(inGroup and reader.atGroupEnd())
			return reader.readGroupEnd();
		if(reader.atEnd())
			return inGroup ? reader.fail(DecodeError(DecodeError::UNEXPECTED_EOF)) : true;

		std::string name;
		uint8_t type_;
		if(not reader.readHeader(&name, &type_))
			return false;

		if(inGroup or not first)
			_indent(dst, indent, depth);
		first = false;

		dst.append(name).append(": ");
		if(not reprValue(reader, type_, dst, depth, indent))
			return false;
	}
}

bool TdfPrinter::reprValue(TdfReader &reader, uint8_t type_, std::string &dst, size_t depth, size_t indent)
{
	if(depth > TdfReader::MAX_DEPTH)
		return reader.fail(DecodeError(DecodeError::NESTING_TOO_DEEP));

	uint64_t a, b, c;
	uint64_t count;

	switch(type_)
	{
	case TDF_VARINT:
		if(not reader.readVarInt(&a))
			return false;
		_decimal(dst, a);
		return true;

	case TDF_STRING:
		{
			std::string s;
			if(not reader.readString(&s))
				return false;
			_quoted(dst, s);
			return true;
		}

	case TDF_BLOB:
		{
			Bytes blob;
			if(not reader.readBlob(&blob))
				return false;
			dst.append("<").append(Hex::encode(blob)).append(">");
			return true;
		}

	case TDF_GROUP:
		{
			const uint8_t *cursor = reader.getCursor();
			if((reader.remaining() > 0) and (TDF_GROUP_PREFIX == *cursor))
				reader.setCursor(cursor + 1);

			dst.append("{");
			if(not reprFields(reader, dst, depth + 1, indent, true))
				return false;
			_indent(dst, indent, depth);
			dst.append("}");
			return true;
		}

	case TDF_LIST:
		{
			uint8_t valueType;
			if(not (reader.readByte(&valueType) and reader.readVarInt(&count)))
				return false;

			dst.append(typeName(valueType)).append("[");
			for(uint64_t x = 0; x < count; x++)
			{
				_indent(dst, indent, depth + 1);
				if(not reprValue(reader, valueType, dst, depth + 1, indent))
					return false;
			}
			if(count)
				_indent(dst, indent, depth);
			dst.append("]");
			return true;
		}

	case TDF_MAP:
		{
			uint8_t keyType, valueType;
			if(not (reader.readByte(&keyType) and reader.readByte(&valueType) and reader.readVarInt(&count)))
				return false;

			dst.append("Map<").append(typeName(keyType)).append(", ").append(typeName(valueType)).append(">{");
			for(uint64_t x = 0; x < count; x++)
			{
				_indent(dst, indent, depth + 1);
				if(not reprValue(reader, keyType, dst, depth + 1, indent))
					return false;
				dst.append(" => ");
				if(not reprValue(reader, valueType, dst, depth + 1, indent))
					return false;
			}
			if(count)
				_indent(dst, indent, depth);
			dst.append("}");
			return true;
		}

	case TDF_UNION:
		{
			uint8_t discriminant;
			if(not reader.readByte(&discriminant))
				return false;
			if(TDF_UNION_UNSET == discriminant)
			{
				dst.append("Union(unset)");
				return true;
			}

			std::string valueName;
			uint8_t valueType;
			if(not reader.readHeader(&valueName, &valueType))
				return false;

			dst.append("Union(");
			_decimal(dst, discriminant);
			dst.append(") ").append(valueName).append(": ");
			return reprValue(reader, valueType, dst, depth + 1, indent);
		}

	case TDF_VARINT_LIST:
		if(not reader.readVarInt(&count))
			return false;
		dst.append("[");
		for(uint64_t x = 0; x < count; x++)
		{
			if(not reader.readVarInt(&a))
				return false;
			if(x)
				dst.append(", ");
			_decimal(dst, a);
		}
		dst.append("]");
		return true;

	case TDF_PAIR:
		if(not (reader.readVarInt(&a) and reader.readVarInt(&b)))
			return false;
		dst.append("(");
		_decimal(dst, a);
		dst.append(", ");
		_decimal(dst, b);
		dst.append(")");
		return true;

	case TDF_TRIPLE:
		if(not (reader.readVarInt(&a) and reader.readVarInt(&b) and reader.readVarInt(&c)))
			return false;
		dst.append("(");
		_decimal(dst, a);
		dst.append(", ");
		_decimal(dst, b);
		dst.append(", ");
		_decimal(dst, c);
		dst.append(")");
		return true;

	case TDF_FLOAT:
		{
			uint8_t raw[4];
			for(size_t x = 0; x < sizeof(raw); x++)
				if(not reader.readByte(raw + x))
					return false;

			uint32_t bits = (uint32_t(raw[0]) << 24) | (uint32_t(raw[1]) << 16) | (uint32_t(raw[2]) << 8) | raw[3];
			float value;
			memcpy(&value, &bits, sizeof(value));

			char buf[32];
			snprintf(buf, sizeof(buf), "%g", (double)value);
			dst.append(buf);
			return true;
		}

	default:
		return reader.fail(DecodeError(DecodeError::INVALID_TYPE, std::string(), -1, type_));
	}
}

} } } // namespace com::blazeredirect::tdf
