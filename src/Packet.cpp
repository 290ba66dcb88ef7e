// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "../include/blazeredirect/Packet.hpp"

namespace com { namespace blazeredirect {

static void _append16(Bytes &dst, uint16_t value)
{
	dst.push_back((value >> 8) & 0xff);
	dst.push_back((value     ) & 0xff);
}

static uint16_t _read16(const uint8_t *src)
{
	return (uint16_t(src[0]) << 8) | src[1];
}

Bytes Packet::encode(const PacketHeader &header, const uint8_t *payload, size_t len)
{
	Bytes rv;
	bool extended = len > 0xffff;

	_append16(rv, len & 0xffff);
	_append16(rv, header.component);
	_append16(rv, header.command);
	_append16(rv, header.error);
	rv.push_back(header.type_);
	rv.push_back(extended ? PACKET_FLAG_EXTENDED_LENGTH : 0);
	_append16(rv, header.id);
	if(extended)
		_append16(rv, (len >> 16) & 0xffff);

	if(len)
		rv.insert(rv.end(), payload, payload + len);

	return rv;
}

Bytes Packet::encode(const PacketHeader &header, const Bytes &payload)
{
	return encode(header, payload.data(), payload.size());
}

size_t Packet::parseHeader(const uint8_t *src, const uint8_t *limit, PacketHeader *outHeader)
{
	if((limit < src) or (size_t(limit - src) < HEADER_SIZE))
		return 0;

	PacketHeader header;
	header.length = _read16(src);
	header.component = _read16(src + 2);
	header.command = _read16(src + 4);
	header.error = _read16(src + 6);
	header.type_ = src[8];
	uint8_t flags = src[9];
	header.id = _read16(src + 10);

	size_t rv = HEADER_SIZE;
	if(flags & PACKET_FLAG_EXTENDED_LENGTH)
	{
		if(size_t(limit - src) < EXTENDED_HEADER_SIZE)
			return 0;
		header.length |= uint32_t(_read16(src + HEADER_SIZE)) << 16;
		rv = EXTENDED_HEADER_SIZE;
	}

	if(outHeader)
		*outHeader = header;

	return rv;
}

size_t Packet::parse(const uint8_t *src, const uint8_t *limit, PacketHeader *outHeader, const uint8_t **outPayload)
{
	PacketHeader header;
	size_t headerLen = parseHeader(src, limit, &header);
	if(0 == headerLen)
		return 0;

	if(size_t(limit - src) - headerLen < header.length)
		return 0;

	if(outHeader)
		*outHeader = header;
	if(outPayload)
		*outPayload = src + headerLen;

	return headerLen + header.length;
}

} } // namespace com::blazeredirect
