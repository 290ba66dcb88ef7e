// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "../include/blazeredirect/Redirector.hpp"

namespace com { namespace blazeredirect { namespace redirector {

using namespace com::blazeredirect::tdf;

// --- NetworkAddressType

NetworkAddressType::NetworkAddressType(Kind kind, uint8_t unknownValue) :
	m_kind(kind),
	m_unknownValue(unknownValue)
{}

NetworkAddressType NetworkAddressType::fromValue(uint8_t value)
{
	switch(value)
	{
	case SERVER: return NetworkAddressType(SERVER);
	case CLIENT: return NetworkAddressType(CLIENT);
	case PAIR: return NetworkAddressType(PAIR);
	case IP_ADDRESS: return NetworkAddressType(IP_ADDRESS);
	case HOSTNAME_ADDRESS: return NetworkAddressType(HOSTNAME_ADDRESS);
	default: return NetworkAddressType(UNKNOWN, value);
	}
}

uint8_t NetworkAddressType::value() const
{
	return UNKNOWN == m_kind ? m_unknownValue : uint8_t(m_kind);
}

const char *NetworkAddressType::name() const
{
	switch(m_kind)
	{
	case SERVER: return "Server";
	case CLIENT: return "Client";
	case PAIR: return "Pair";
	case IP_ADDRESS: return "IpAddress";
	case HOSTNAME_ADDRESS: return "HostnameAddress";
	default: return "Unknown";
	}
}

bool NetworkAddressType::operator== (const NetworkAddressType &rhs) const
{
	return (m_kind == rhs.m_kind) and (value() == rhs.value());
}

bool NetworkAddressType::operator!= (const NetworkAddressType &rhs) const
{
	return not (*this == rhs);
}

// --- InstanceHost

InstanceHost::InstanceHost() : m_kind(KIND_ADDRESS)
{}

InstanceHost::InstanceHost(const std::string &value) : m_kind(KIND_ADDRESS)
{
	if(not NetAddress::parse(value, &m_address))
	{
		m_kind = KIND_HOST;
		m_host = value;
	}
}

InstanceHost::InstanceHost(const NetAddress &address) : m_kind(KIND_ADDRESS), m_address(address)
{}

InstanceHost InstanceHost::hostName(const std::string &host)
{
	InstanceHost rv;
	rv.m_kind = KIND_HOST;
	rv.m_host = host;
	return rv;
}

std::string InstanceHost::toString() const
{
	return isHost() ? m_host : m_address.toPresentation();
}

void InstanceHost::encode(TdfWriter &writer) const
{
	if(isHost())
		writer.tagString("HOST", m_host);
	else
	{
		writer.tag("IP", NetAddress::TDF_TYPE);
		m_address.encode(writer);
	}
}

bool InstanceHost::decode(TdfReader &reader)
{
	std::string host;
	bool hasHost = false;
	if(not reader.tryTagString("HOST", &host, &hasHost))
		return false;

	if(hasHost)
	{
		*this = hostName(host);
		return true;
	}

	NetAddress address;
	if(not (reader.findTag("IP", NetAddress::TDF_TYPE) and address.decode(reader)))
		return false;

	*this = InstanceHost(address);
	return true;
}

bool InstanceHost::operator== (const InstanceHost &rhs) const
{
	if(m_kind != rhs.m_kind)
		return false;
	return isHost() ? (m_host == rhs.m_host) : (m_address == rhs.m_address);
}

bool InstanceHost::operator!= (const InstanceHost &rhs) const
{
	return not (*this == rhs);
}

// --- InstanceNet

InstanceNet::InstanceNet(const InstanceHost &host_, Port port_) : host(host_), port(port_)
{}

InstanceNet::InstanceNet(const std::string &host_, Port port_) : host(host_), port(port_)
{}

void InstanceNet::encode(TdfWriter &writer) const
{
	host.encode(writer);
	writer.tagU16("PORT", port);
	writer.tagGroupEnd();
}

bool InstanceNet::decode(TdfReader &reader)
{
	InstanceHost decodedHost;
	uint16_t decodedPort;

	// the terminator comes after PORT and must always be consumed, or the
	// rest of the enclosing stream is read out of step.
	if(not (decodedHost.decode(reader) and reader.tagU16("PORT", &decodedPort) and reader.readGroupEnd()))
		return false;

	host = decodedHost;
	port = decodedPort;
	return true;
}

bool InstanceNet::operator== (const InstanceNet &rhs) const
{
	return (host == rhs.host) and (port == rhs.port);
}

bool InstanceNet::operator!= (const InstanceNet &rhs) const
{
	return not (*this == rhs);
}

// --- InstanceDetails

InstanceDetails::InstanceDetails(const InstanceNet &net_, bool secure_) : net(net_), secure(secure_)
{}

void InstanceDetails::encode(TdfWriter &writer) const
{
	writer.tagUnionStart("ADDR", NetworkAddressType(NetworkAddressType::SERVER).value());
	writer.tag(TDF_UNION_VALUE_TAG, InstanceNet::TDF_TYPE);
	net.encode(writer);

	writer.tagBool("SECU", secure);
	writer.tagBool("XDNS", false);
}

Bytes InstanceDetails::encode() const
{
	TdfWriter writer;
	encode(writer);
	return writer.take();
}

bool InstanceDetails::decode(TdfReader &reader)
{
	uint8_t discriminant;
	bool isSet;
	if(not reader.tagUnion("ADDR", InstanceNet::TDF_TYPE, &discriminant, &isSet))
		return false;
	if(not isSet)
		return reader.fail(DecodeError(DecodeError::MISSING_TAG, "ADDR", TDF_UNION));

	InstanceNet decodedNet;
	bool decodedSecure;
	if(not (decodedNet.decode(reader) and reader.tagBool("SECU", &decodedSecure)))
		return false;

	net = decodedNet;
	secure = decodedSecure;
	return true;
}

bool InstanceDetails::operator== (const InstanceDetails &rhs) const
{
	return (net == rhs.net) and (secure == rhs.secure);
}

bool InstanceDetails::operator!= (const InstanceDetails &rhs) const
{
	return not (*this == rhs);
}

// --- InstanceRequest

const char * const InstanceRequest::BLAZE_SDK_VERSION = "3.15.6.0";
const char * const InstanceRequest::BUILD_TIME = "Dec 21 2012 12:47:10";
const char * const InstanceRequest::CLIENT_NAME = "MassEffect3-pc";
const uint8_t      InstanceRequest::CLIENT_TYPE;
const char * const InstanceRequest::CLIENT_SKU = "134845";
const char * const InstanceRequest::CLIENT_VERSION = "05427.124";
const char * const InstanceRequest::DIRTYSOCK_VERSION = "8.14.7.1";
const char * const InstanceRequest::ENVIRONMENT = "prod";
const uint32_t     InstanceRequest::LOCALE;
const char * const InstanceRequest::PRODUCT_NAME = "masseffect-3-pc";
const char * const InstanceRequest::PLATFORM = "Windows";
const char * const InstanceRequest::CONNECTION_PROFILE = "standardSecure_v3";

void InstanceRequest::encode(TdfWriter &writer)
{
	writer.tagString("BSDK", BLAZE_SDK_VERSION);
	writer.tagString("BTIM", BUILD_TIME);
	writer.tagString("CLNT", CLIENT_NAME);
	writer.tagU8("CLTP", CLIENT_TYPE);
	writer.tagString("CSKU", CLIENT_SKU);
	writer.tagString("CVER", CLIENT_VERSION);
	writer.tagString("DSDK", DIRTYSOCK_VERSION);
	writer.tagString("ENV", ENVIRONMENT);
	writer.tagUnionUnset("FPID");
	writer.tagU32("LOC", LOCALE);
	writer.tagString("NAME", PRODUCT_NAME);
	writer.tagString("PLAT", PLATFORM);
	writer.tagString("PROF", CONNECTION_PROFILE);
}

Bytes InstanceRequest::encode()
{
	TdfWriter writer;
	encode(writer);
	return writer.take();
}

// --- GetServerInstance

Bytes GetServerInstance::request(uint16_t id)
{
	PacketHeader header;
	header.component = REDIRECTOR_COMPONENT;
	header.command = CMD_GET_SERVER_INSTANCE;
	header.type_ = PACKET_REQUEST;
	header.id = id;

	return Packet::encode(header, InstanceRequest::encode());
}

Bytes GetServerInstance::response(uint16_t id, const InstanceDetails &details)
{
	PacketHeader header;
	header.component = REDIRECTOR_COMPONENT;
	header.command = CMD_GET_SERVER_INSTANCE;
	header.type_ = PACKET_RESPONSE;
	header.id = id;

	return Packet::encode(header, details.encode());
}

bool GetServerInstance::parseResponse(const uint8_t *payload, const uint8_t *limit, InstanceDetails *outDetails, DecodeError *outError)
{
	TdfReader reader(payload, limit);
	bool rv = outDetails->decode(reader);

	if(outError)
		*outError = reader.getError();

	return rv;
}

} } } // namespace com::blazeredirect::redirector
