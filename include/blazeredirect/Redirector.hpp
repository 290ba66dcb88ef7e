#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

// Redirector GetServerInstance payloads: where a client should connect next.

#include "NetAddress.hpp"
#include "Packet.hpp"

namespace com { namespace blazeredirect { namespace redirector {

using Port = uint16_t;

enum {
	REDIRECTOR_COMPONENT    = 0x0005,
	CMD_GET_SERVER_INSTANCE = 0x0001
};

// union discriminant for the shape of an address. bytes this code doesn't
// know are kept as UNKNOWN and written back unchanged.
class NetworkAddressType {
public:
	enum Kind {
		SERVER           = 0x00,
		CLIENT           = 0x01,
		PAIR             = 0x02,
		IP_ADDRESS       = 0x03,
		HOSTNAME_ADDRESS = 0x04,
		UNKNOWN
	};

	NetworkAddressType(Kind kind = SERVER, uint8_t unknownValue = 0);

	static NetworkAddressType fromValue(uint8_t value);

	uint8_t     value() const;
	Kind        getKind() const { return m_kind; }
	bool        isKnown() const { return UNKNOWN != m_kind; }
	const char *name() const;

	bool operator== (const NetworkAddressType &rhs) const;
	bool operator!= (const NetworkAddressType &rhs) const;

protected:
	Kind    m_kind;
	uint8_t m_unknownValue;
};

// either a host name or an IPv4 address, never both. which one is
// decided once, when the host is built.
class InstanceHost {
public:
	enum Kind {
		KIND_HOST,
		KIND_ADDRESS
	};

	InstanceHost(); // 127.0.0.1

	// text that parses as a dotted quad is always an address, even if it
	// was configured as a host name.
	explicit InstanceHost(const std::string &value);
	explicit InstanceHost(const NetAddress &address);

	static InstanceHost hostName(const std::string &host); // no dotted quad check

	Kind              getKind() const { return m_kind; }
	bool              isHost() const { return KIND_HOST == m_kind; }
	bool              isAddress() const { return KIND_ADDRESS == m_kind; }
	const std::string& getHost() const { return m_host; } // empty unless isHost()
	const NetAddress& getAddress() const { return m_address; }

	std::string toString() const; // host name, or dotted quad

	// HOST (String) or IP (VarInt), exactly one of them.
	void encode(tdf::TdfWriter &writer) const;
	bool decode(tdf::TdfReader &reader);

	bool operator== (const InstanceHost &rhs) const;
	bool operator!= (const InstanceHost &rhs) const;

protected:
	Kind        m_kind;
	std::string m_host;
	NetAddress  m_address;
};

// host and port, carried as a group.
class InstanceNet {
public:
	static const tdf::TdfType TDF_TYPE = tdf::TDF_GROUP;

	InstanceNet() = default;
	InstanceNet(const InstanceHost &host, Port port);
	InstanceNet(const std::string &host, Port port);

	InstanceHost host;
	Port         port { 0 };

	// host fields, PORT, then the group terminator.
	void encode(tdf::TdfWriter &writer) const;
	bool decode(tdf::TdfReader &reader);

	bool operator== (const InstanceNet &rhs) const;
	bool operator!= (const InstanceNet &rhs) const;
};

// the GetServerInstance response payload.
class InstanceDetails {
public:
	InstanceDetails() = default;
	InstanceDetails(const InstanceNet &net, bool secure);

	InstanceNet net;
	bool        secure { false }; // the instance requires SSLv3

	// ADDR is a union with discriminant SERVER holding the InstanceNet as
	// VALU, then SECU and XDNS. XDNS is always written false and never read.
	void encode(tdf::TdfWriter &writer) const;
	Bytes encode() const;

	// fails with MISSING_TAG ADDR (Union) if the address union is unset.
	// *this is only changed on success.
	bool decode(tdf::TdfReader &reader);

	bool operator== (const InstanceDetails &rhs) const;
	bool operator!= (const InstanceDetails &rhs) const;
};

// the GetServerInstance request payload: a fixed description of one
// client build, as that client sends it.
class InstanceRequest {
public:
	static const char * const BLAZE_SDK_VERSION;
	static const char * const BUILD_TIME;
	static const char * const CLIENT_NAME;
	static const uint8_t      CLIENT_TYPE = 0;
	static const char * const CLIENT_SKU;
	static const char * const CLIENT_VERSION;
	static const char * const DIRTYSOCK_VERSION;
	static const char * const ENVIRONMENT;
	static const uint32_t     LOCALE = 0x656e4e5a; // "enNZ"
	static const char * const PRODUCT_NAME;
	static const char * const PLATFORM;
	static const char * const CONNECTION_PROFILE;

	// BSDK BTIM CLNT CLTP CSKU CVER DSDK ENV FPID(unset) LOC NAME PLAT PROF
	static void encode(tdf::TdfWriter &writer);
	static Bytes encode();
};

class GetServerInstance {
public:
	static Bytes request(uint16_t id); // whole packet, InstanceRequest payload
	static Bytes response(uint16_t id, const InstanceDetails &details); // whole packet

	// decode a response payload. *outDetails is only changed on success;
	// *outError (if not null) says why not otherwise.
	static bool parseResponse(const uint8_t *payload, const uint8_t *limit, InstanceDetails *outDetails, tdf::DecodeError *outError);
};

} } } // namespace com::blazeredirect::redirector
