// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "../include/blazeredirect/NetAddress.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <cstdio>
#include <cstring>

namespace com { namespace blazeredirect { namespace redirector {

NetAddress::NetAddress()
{
	setValue(INADDR_LOOPBACK);
}

NetAddress::NetAddress(uint32_t value)
{
	setValue(value);
}

NetAddress::NetAddress(uint8_t a, uint8_t b, uint8_t c, uint8_t d)
{
	m_octets[0] = a;
	m_octets[1] = b;
	m_octets[2] = c;
	m_octets[3] = d;
}

uint32_t NetAddress::getValue() const
{
	return (uint32_t(m_octets[0]) << 24)
	     | (uint32_t(m_octets[1]) << 16)
	     | (uint32_t(m_octets[2]) <<  8)
	     | (uint32_t(m_octets[3])      );
}

void NetAddress::setValue(uint32_t value)
{
	m_octets[0] = (value >> 24) & 0xff;
	m_octets[1] = (value >> 16) & 0xff;
	m_octets[2] = (value >>  8) & 0xff;
	m_octets[3] = (value      ) & 0xff;
}

void NetAddress::setOctets(const uint8_t *src)
{
	memmove(m_octets, src, sizeof(m_octets));
}

void NetAddress::toPresentation(char *dst) const
{
	*dst = 0; // just in case

	if(not inet_ntop(AF_INET, m_octets, dst, MAX_PRESENTATION_LENGTH))
		snprintf(dst, MAX_PRESENTATION_LENGTH, "%u.%u.%u.%u", m_octets[0], m_octets[1], m_octets[2], m_octets[3]);
}

std::string NetAddress::toPresentation() const
{
	char presentation[MAX_PRESENTATION_LENGTH] = { 0 };
	toPresentation(presentation);
	return std::string(presentation);
}

bool NetAddress::setFromPresentation(const char *src)
{
	uint8_t ipaddr[ADDRESS_LENGTH];

	// inet_pton(AF_INET) takes only a.b.c.d decimal, no leading zeros
	if(inet_pton(AF_INET, src, ipaddr) < 1)
		return false;

	setOctets(ipaddr);
	return true;
}

bool NetAddress::parse(const std::string &src, NetAddress *dst)
{
	if(src.find('\0') != std::string::npos)
		return false;
	return dst->setFromPresentation(src.c_str());
}

void NetAddress::encode(tdf::TdfWriter &writer) const
{
	writer.writeVarInt(getValue());
}

bool NetAddress::decode(tdf::TdfReader &reader)
{
	uint32_t value;
	if(not reader.readU32(&value))
		return false;
	setValue(value);
	return true;
}

bool NetAddress::operator== (const NetAddress &rhs) const
{
	return 0 == memcmp(m_octets, rhs.m_octets, sizeof(m_octets));
}

bool NetAddress::operator!= (const NetAddress &rhs) const
{
	return not (*this == rhs);
}

bool NetAddress::operator< (const NetAddress &rhs) const
{
	return getValue() < rhs.getValue();
}

} } } // namespace com::blazeredirect::redirector
