#include <cassert>
#include <cstdio>
#include <cstring>

#include "blazeredirect/VarInt.hpp"
#include "blazeredirect/Hex.hpp"

using namespace com::blazeredirect;
using namespace com::blazeredirect::tdf;

static void _testEncode(uint64_t value, const uint8_t *expected, size_t expectedLen)
{
	uint8_t buf[VarInt::MAX_VARINT_SIZE];
	size_t len = VarInt::encode(value, buf);

	printf("%20llu : %s\n", (unsigned long long)value, Hex::encode(buf, len).c_str());
	assert(len == expectedLen);
	assert(0 == memcmp(buf, expected, len));

	uint64_t parsed = 1;
	assert(len == VarInt::parse(buf, buf + len, &parsed));
	assert(parsed == value);

	// every strict prefix is incomplete
	for(size_t x = 0; x < len; x++)
		assert(0 == VarInt::parse(buf, buf + x, &parsed));
}

int main(int argc, char *argv[])
{
	{ uint8_t e[] = { 0x00 }; _testEncode(0, e, sizeof(e)); }
	{ uint8_t e[] = { 0x3f }; _testEncode(63, e, sizeof(e)); }
	{ uint8_t e[] = { 0x80, 0x01 }; _testEncode(64, e, sizeof(e)); }
	{ uint8_t e[] = { 0x90, 0x01 }; _testEncode(80, e, sizeof(e)); }
	{ uint8_t e[] = { 0x8f, 0x92, 0x05 }; _testEncode(42127, e, sizeof(e)); }
	{ uint8_t e[] = { 0x85, 0x80, 0x80, 0xa0, 0x01 }; _testEncode(0x0a000005, e, sizeof(e)); }
	{ uint8_t e[] = { 0x9a, 0xb9, 0xf2, 0xd6, 0x0c }; _testEncode(0x656e4e5a, e, sizeof(e)); }
	{ uint8_t e[] = { 0x80, 0x80, 0x80, 0x80, 0x20 }; _testEncode(UINT64_C(0x100000000), e, sizeof(e)); }
	{ uint8_t e[] = { 0xbf, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x03 }; _testEncode(UINT64_MAX, e, sizeof(e)); }

	// the sign bit isn't part of an unsigned value
	uint8_t signedOne[] = { 0x41 };
	uint64_t value = 0;
	assert(1 == VarInt::parse(signedOne, signedOne + sizeof(signedOne), &value));
	assert(1 == value);

	// trailing bytes are left alone
	uint8_t two[] = { 0x80, 0x01, 0x05 };
	assert(2 == VarInt::parse(two, two + sizeof(two), &value));
	assert(64 == value);

	assert(0 == VarInt::parse(two, two, &value));

	// groups past 64 bits are consumed and dropped
	uint8_t overlong[] = { 0x81, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x7f };
	assert(sizeof(overlong) == VarInt::parse(overlong, overlong + sizeof(overlong), &value));
	assert(1 == value);

	std::vector<uint8_t> appended;
	VarInt::append(63, appended);
	VarInt::append(64, appended);
	assert(3 == appended.size());
	assert(0x3f == appended[0]);
	assert(0x80 == appended[1]);
	assert(0x01 == appended[2]);

	assert(1 == VarInt::encode(5, nullptr));

	printf("ok\n");

	return 0;
}
