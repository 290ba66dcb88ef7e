// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cctype>
#include <cstdio>

#include "../include/blazeredirect/Hex.hpp"

namespace com { namespace blazeredirect {

static const char _digits[] = "0123456789abcdef";

static int _digitValue(char d)
{
	if((d >= '0') and (d <= '9'))
		return d - '0';
	if((d >= 'a') and (d <= 'f'))
		return d - 'a' + 10;
	if((d >= 'A') and (d <= 'F'))
		return d - 'A' + 10;
	return -1;
}

std::string Hex::encode(const uint8_t *bytes, size_t len)
{
	std::string rv;
	rv.reserve(len * 2);

	for(size_t x = 0; x < len; x++)
	{
		rv.push_back(_digits[bytes[x] >> 4]);
		rv.push_back(_digits[bytes[x] & 0x0f]);
	}

	return rv;
}

std::string Hex::encode(const std::vector<uint8_t> &bytes)
{
	return encode(bytes.data(), bytes.size());
}

bool Hex::decode(const char *hex, std::vector<uint8_t> &dst)
{
	std::vector<uint8_t> tmp;
	const char *cursor = hex;

	while(*cursor)
	{
		if(isspace((unsigned char)*cursor))
		{
			cursor++;
			continue;
		}

		int hi = _digitValue(cursor[0]);
		int lo = hi < 0 ? -1 : _digitValue(cursor[1]);
		if(lo < 0)
			return false;

		tmp.push_back((uint8_t)((hi << 4) | lo));
		cursor += 2;
	}

	dst.insert(dst.end(), tmp.begin(), tmp.end());
	return true;
}

void Hex::print(const char *msg, const std::vector<uint8_t> &bytes)
{
	size_t len = bytes.size();

	printf("%s (%lu)\n", msg, (unsigned long)len);
	for(size_t offset = 0; offset < len; offset += 16)
	{
		char printable[17] = { 0 };

		printf("%08lx  ", (unsigned long)offset);
		for(size_t y = 0; y < 16; y++)
		{
			if(offset + y < len)
			{
				uint8_t b = bytes[offset + y];
				printf("%02x ", b);
				printable[y] = isprint(b) ? (char)b : '.';
			}
			else
				printf("   ");
		}
		printf(" |%s|\n", printable);
	}
	printf("%08lx\n", (unsigned long)len);
}

} } // namespace com::blazeredirect
