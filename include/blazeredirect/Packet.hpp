#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cstddef>
#include <cstdint>
#include <vector>

namespace com { namespace blazeredirect {

using Bytes = std::vector<uint8_t>;

enum PacketType {
	PACKET_REQUEST  = 0x00,
	PACKET_RESPONSE = 0x10,
	PACKET_NOTIFY   = 0x20,
	PACKET_ERROR    = 0x30
};

const uint8_t PACKET_FLAG_EXTENDED_LENGTH = 0x10;

struct PacketHeader {
	uint32_t length { 0 }; // of the payload; filled in by Packet::encode
	uint16_t component { 0 };
	uint16_t command { 0 };
	uint16_t error { 0 };
	uint8_t  type_ { PACKET_REQUEST };
	uint16_t id { 0 };
};

class Packet {
public:
	static const size_t HEADER_SIZE = 12;
	static const size_t EXTENDED_HEADER_SIZE = HEADER_SIZE + 2;

	// <length:16> <component:16> <command:16> <error:16> <type:8> <flags:8> <id:16> [<length-high:16>]
	static Bytes encode(const PacketHeader &header, const uint8_t *payload, size_t len);
	static Bytes encode(const PacketHeader &header, const Bytes &payload);

	// answer bytes consumed by the header, or 0 if incomplete.
	static size_t parseHeader(const uint8_t *src, const uint8_t *limit, PacketHeader *outHeader);

	// answer bytes consumed by the whole packet, or 0 if incomplete. the
	// payload points into src.
	static size_t parse(const uint8_t *src, const uint8_t *limit, PacketHeader *outHeader, const uint8_t **outPayload);
};

} } // namespace com::blazeredirect
