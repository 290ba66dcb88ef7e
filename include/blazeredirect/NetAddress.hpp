#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <string>

#include "TdfReader.hpp"
#include "TdfWriter.hpp"

namespace com { namespace blazeredirect { namespace redirector {

// An IPv4 address as Blaze carries it: the four octets read as one
// big-endian 32-bit integer, written as a TDF varint.
class NetAddress {
public:
	static const tdf::TdfType TDF_TYPE = tdf::TDF_VARINT;
	static const size_t ADDRESS_LENGTH = 4;

	// 255.255.255.255
	static const size_t MAX_PRESENTATION_LENGTH = 16; // including terminator

	NetAddress(); // 127.0.0.1
	NetAddress(const NetAddress &other) = default;
	explicit NetAddress(uint32_t value);
	NetAddress(uint8_t a, uint8_t b, uint8_t c, uint8_t d);

	uint32_t getValue() const;
	void     setValue(uint32_t value);

	const uint8_t *getOctetsPtr() const { return m_octets; }
	void           setOctets(const uint8_t *src); // ADDRESS_LENGTH bytes

	void        toPresentation(char *dst) const; // dst at least MAX_PRESENTATION_LENGTH bytes
	std::string toPresentation() const;

	// strict dotted quad only ("10.0.0.5"); no ports, no shorthand forms.
	bool setFromPresentation(const char *src);
	static bool parse(const std::string &src, NetAddress *dst);

	void encode(tdf::TdfWriter &writer) const;
	bool decode(tdf::TdfReader &reader);

	NetAddress& operator= (const NetAddress &rhs) = default;
	bool operator== (const NetAddress &rhs) const;
	bool operator!= (const NetAddress &rhs) const;
	bool operator< (const NetAddress &rhs) const;

protected:
	uint8_t m_octets[ADDRESS_LENGTH];
};

} } } // namespace com::blazeredirect::redirector
