#include <cassert>
#include <cstdio>
#include <cstring>

#include "blazeredirect/Hex.hpp"
#include "blazeredirect/Redirector.hpp"
#include "blazeredirect/TdfPrinter.hpp"

using namespace com::blazeredirect;
using namespace com::blazeredirect::redirector;
using namespace com::blazeredirect::tdf;

namespace {

// ADDR Union(0) VALU Group { IP 10.0.0.5, PORT 42127 } SECU 1 XDNS 0
const uint8_t scenario1[] = {
	0x86, 0x49, 0x32, TDF_UNION, 0x00,
	0xda, 0x1b, 0x35, TDF_GROUP,
	0xa7, 0x00, 0x00, TDF_VARINT, 0x85, 0x80, 0x80, 0xa0, 0x01,
	0xc2, 0xfc, 0xb4, TDF_VARINT, 0x8f, 0x92, 0x05,
	TDF_GROUP_END,
	0xce, 0x58, 0xf5, TDF_VARINT, 0x01,
	0xe2, 0x4b, 0xb3, TDF_VARINT, 0x00
};

void _testAddressTypes()
{
	const NetworkAddressType::Kind kinds[] = {
		NetworkAddressType::SERVER, NetworkAddressType::CLIENT, NetworkAddressType::PAIR,
		NetworkAddressType::IP_ADDRESS, NetworkAddressType::HOSTNAME_ADDRESS };
	const char *names[] = { "Server", "Client", "Pair", "IpAddress", "HostnameAddress" };

	for(unsigned x = 0; x < 5; x++)
	{
		NetworkAddressType t(kinds[x]);
		assert(x == t.value());
		assert(t.isKnown());
		assert(0 == strcmp(names[x], t.name()));
		assert(NetworkAddressType::fromValue(x) == t);
	}

	for(unsigned x = 0; x < 256; x++)
	{
		NetworkAddressType t = NetworkAddressType::fromValue(x);
		assert(x == t.value());
		assert(t.isKnown() == (x < 5));
	}

	NetworkAddressType unknown = NetworkAddressType::fromValue(0x7f);
	assert(NetworkAddressType::UNKNOWN == unknown.getKind());
	assert(0x7f == unknown.value());
	assert(0 == strcmp("Unknown", unknown.name()));
	assert(unknown != NetworkAddressType::fromValue(0x7e));
	assert(unknown == NetworkAddressType(NetworkAddressType::UNKNOWN, 0x7f));

	assert(0 == NetworkAddressType().value());
}

void _testHost()
{
	const char *addresses[] = { "10.0.0.5", "0.0.0.0", "255.255.255.255", "192.168.100.1" };
	for(size_t x = 0; x < sizeof(addresses) / sizeof(addresses[0]); x++)
	{
		InstanceHost host((std::string(addresses[x])));
		printf("host %s -> %s\n", addresses[x], host.isAddress() ? "address" : "host");
		assert(host.isAddress());
		assert(addresses[x] == host.toString());
		assert(host.getHost().empty());
	}

	const char *names[] = { "relay.example.net", "localhost", "10.0.0", "10.0.0.5.6", "010.0.0.5", "10.0.0.5:80", "", "::1" };
	for(size_t x = 0; x < sizeof(names) / sizeof(names[0]); x++)
	{
		InstanceHost host((std::string(names[x])));
		printf("host \"%s\" -> %s\n", names[x], host.isAddress() ? "address" : "host");
		assert(host.isHost());
		assert(names[x] == host.toString());
		assert(names[x] == host.getHost());
	}

	// decided once: a name that looks like an address is an address
	InstanceHost looksLikeAddress(std::string("10.1.2.3"));
	assert(InstanceHost(NetAddress(10, 1, 2, 3)) == looksLikeAddress);
	assert(InstanceHost::hostName("10.1.2.3") != looksLikeAddress);
	assert(InstanceHost::hostName("10.1.2.3").isHost());

	assert(InstanceHost().isAddress());
	assert("127.0.0.1" == InstanceHost().toString());

	TdfWriter writer;
	InstanceHost(std::string("ab")).encode(writer);
	{
		uint8_t expected[] = { 0xa2, 0xfc, 0xf4, TDF_STRING, 0x03, 'a', 'b', 0x00 };
		assert(writer.bytes().size() == sizeof(expected));
		assert(0 == memcmp(writer.bytes().data(), expected, sizeof(expected)));
	}

	writer.clear();
	InstanceHost(NetAddress(10, 0, 0, 5)).encode(writer);
	{
		uint8_t expected[] = { 0xa7, 0x00, 0x00, TDF_VARINT, 0x85, 0x80, 0x80, 0xa0, 0x01 };
		assert(writer.bytes().size() == sizeof(expected));
		assert(0 == memcmp(writer.bytes().data(), expected, sizeof(expected)));
	}

	// HOST decides, wherever it is and whatever else is there
	writer.clear();
	writer.tag("IP", NetAddress::TDF_TYPE);
	NetAddress(1, 2, 3, 4).encode(writer);
	writer.tagString("HOST", "named");
	{
		TdfReader reader(writer.bytes());
		InstanceHost host;
		assert(host.decode(reader));
		assert(host.isHost());
		assert("named" == host.getHost());
	}

	// neither is MISSING_TAG IP
	writer.clear();
	writer.tagU16("PORT", 1);
	{
		TdfReader reader(writer.bytes());
		InstanceHost host;
		assert(not host.decode(reader));
		assert(DecodeError::MISSING_TAG == reader.getError().code);
		assert("IP" == reader.getError().tag);
		assert(host.isAddress());
		assert("127.0.0.1" == host.toString());
	}
}

void _testNet()
{
	InstanceNet byAddress("10.0.0.5", 42127);
	InstanceNet byName("relay.example.net", 80);
	InstanceNet zeroPort(InstanceHost::hostName("h"), 0);
	InstanceNet maxPort("1.1.1.1", 65535);

	const InstanceNet *nets[] = { &byAddress, &byName, &zeroPort, &maxPort };
	for(size_t x = 0; x < 4; x++)
	{
		TdfWriter writer;
		nets[x]->encode(writer);
		assert(TDF_GROUP_END == writer.bytes().back());

		TdfReader reader(writer.bytes());
		InstanceNet decoded;
		assert(decoded.decode(reader));
		assert(*nets[x] == decoded);
		assert(decoded.host.getKind() == nets[x]->host.getKind());
		assert(reader.atEnd()); // terminator consumed
	}

	// the terminator is read after PORT, so whatever follows the group is in step
	TdfWriter writer;
	byName.encode(writer);
	writer.tagU8("NEXT", 7);
	{
		TdfReader reader(writer.bytes());
		InstanceNet decoded;
		uint8_t next = 0;
		assert(decoded.decode(reader));
		assert(reader.tagU8("NEXT", &next));
		assert(7 == next);
	}

	// no terminator
	writer.clear();
	byAddress.host.encode(writer);
	writer.tagU16("PORT", 1);
	{
		TdfReader reader(writer.bytes());
		InstanceNet decoded(byName);
		assert(not decoded.decode(reader));
		assert(DecodeError::UNEXPECTED_EOF == reader.getError().code);
		assert(byName == decoded);
	}

	assert(byAddress != byName);
	assert(InstanceNet("10.0.0.5", 1) != InstanceNet("10.0.0.5", 2));
}

void _testDetails()
{
	InstanceDetails details(InstanceNet("10.0.0.5", 42127), true);
	Bytes encoded = details.encode();
	Hex::print("10.0.0.5:42127 secure", encoded);
	printf("%s\n", TdfPrinter::repr(encoded).c_str());
	assert(encoded.size() == sizeof(scenario1));
	assert(0 == memcmp(encoded.data(), scenario1, sizeof(scenario1)));

	{
		TdfReader reader(encoded);
		InstanceDetails decoded;
		assert(decoded.decode(reader));
		assert(decoded.net.host.isAddress());
		assert(NetAddress(10, 0, 0, 5) == decoded.net.host.getAddress());
		assert(42127 == decoded.net.port);
		assert(decoded.secure);
		assert(details == decoded);

		// XDNS is written but not read back
		assert(5 == reader.remaining());
		bool xdns = true;
		assert(reader.tagBool("XDNS", &xdns));
		assert(not xdns);
	}

	{
		InstanceDetails plain(InstanceNet("relay.example.net", 80), false);
		Bytes bytes = plain.encode();
		TdfReader reader(bytes);
		InstanceDetails decoded(InstanceNet("9.9.9.9", 9), true);
		assert(decoded.decode(reader));
		assert(decoded.net.host.isHost());
		assert("relay.example.net" == decoded.net.host.getHost());
		assert(80 == decoded.net.port);
		assert(not decoded.secure);
	}

	{
		// a peer's XDNS value makes no difference
		Bytes flipped(scenario1, scenario1 + sizeof(scenario1));
		flipped.back() = 0x01;
		InstanceDetails a, b;
		assert(GetServerInstance::parseResponse(scenario1, scenario1 + sizeof(scenario1), &a, nullptr));
		assert(GetServerInstance::parseResponse(flipped.data(), flipped.data() + flipped.size(), &b, nullptr));
		assert(a == b);

		// and neither does its absence
		DecodeError error;
		assert(GetServerInstance::parseResponse(scenario1, scenario1 + sizeof(scenario1) - 5, &b, &error));
		assert(not error.isError());
		assert(a == b);
	}

	{
		// an unset ADDR is the one payload-level error
		TdfWriter writer;
		writer.tagUnionUnset("ADDR");
		writer.tagBool("SECU", true);
		writer.tagBool("XDNS", false);

		InstanceDetails unchanged(InstanceNet("relay.example.net", 80), false);
		InstanceDetails decoded(unchanged);
		DecodeError error;
		assert(not GetServerInstance::parseResponse(writer.bytes().data(), writer.bytes().data() + writer.bytes().size(), &decoded, &error));
		printf("unset ADDR: %s\n", error.toString().c_str());
		assert(DecodeError::MISSING_TAG == error.code);
		assert("ADDR" == error.tag);
		assert(TDF_UNION == error.expected);
		assert(unchanged == decoded);
	}

	{
		// no ADDR at all
		TdfWriter writer;
		writer.tagBool("SECU", true);
		TdfReader reader(writer.bytes());
		InstanceDetails decoded;
		assert(not decoded.decode(reader));
		assert(DecodeError::MISSING_TAG == reader.getError().code);
		assert("ADDR" == reader.getError().tag);
	}

	{
		// no SECU
		Bytes bytes(scenario1, scenario1 + 26);
		TdfReader reader(bytes);
		InstanceDetails decoded;
		assert(not decoded.decode(reader));
		assert(DecodeError::MISSING_TAG == reader.getError().code);
		assert("SECU" == reader.getError().tag);
	}

	{
		// ADDR set with another discriminant still carries an InstanceNet
		Bytes bytes(scenario1, scenario1 + sizeof(scenario1));
		bytes[4] = NetworkAddressType(NetworkAddressType::HOSTNAME_ADDRESS).value();
		TdfReader reader(bytes);
		InstanceDetails decoded;
		assert(decoded.decode(reader));
		assert(details == decoded);
	}

	{
		// VALU must be a group
		Bytes bytes(scenario1, scenario1 + sizeof(scenario1));
		bytes[8] = TDF_STRING;
		TdfReader reader(bytes);
		InstanceDetails decoded;
		assert(not decoded.decode(reader));
		assert(DecodeError::INVALID_TYPE == reader.getError().code);
		assert("VALU" == reader.getError().tag);
	}
}

void _testRequest()
{
	Bytes bytes = InstanceRequest::encode();
	Hex::print("InstanceRequest", bytes);
	printf("%s\n", TdfPrinter::repr(bytes).c_str());

	TdfReader reader(bytes);
	std::string s;
	uint8_t u8 = 0xff;
	uint32_t u32 = 0;
	uint8_t discriminant = 0;
	bool isSet = true;

	assert(reader.tagString("BSDK", &s) and (s == "3.15.6.0"));
	assert(reader.tagString("BTIM", &s) and (s == "Dec 21 2012 12:47:10"));
	assert(reader.tagString("CLNT", &s) and (s == "MassEffect3-pc"));
	assert(reader.tagU8("CLTP", &u8) and (0 == u8));
	assert(reader.tagString("CSKU", &s) and (s == "134845"));
	assert(reader.tagString("CVER", &s) and (s == "05427.124"));
	assert(reader.tagString("DSDK", &s) and (s == "8.14.7.1"));
	assert(reader.tagString("ENV", &s) and (s == "prod"));
	assert(reader.tagUnion("FPID", TDF_GROUP, &discriminant, &isSet));
	assert(not isSet);
	assert(TDF_UNION_UNSET == discriminant);
	assert(reader.tagU32("LOC", &u32) and (0x656e4e5a == u32));
	assert(reader.tagString("NAME", &s) and (s == "masseffect-3-pc"));
	assert(reader.tagString("PLAT", &s) and (s == "Windows"));
	assert(reader.tagString("PROF", &s) and (s == "standardSecure_v3"));
	assert(reader.atEnd());

	// same bytes every time
	TdfWriter writer;
	InstanceRequest::encode(writer);
	assert(writer.bytes() == bytes);
}

void _testPackets()
{
	Bytes request = GetServerInstance::request(3);
	PacketHeader header;
	const uint8_t *payload = nullptr;
	assert(request.size() == Packet::parse(request.data(), request.data() + request.size(), &header, &payload));
	assert(REDIRECTOR_COMPONENT == header.component);
	assert(CMD_GET_SERVER_INSTANCE == header.command);
	assert(PACKET_REQUEST == header.type_);
	assert(3 == header.id);
	assert(Bytes(payload, payload + header.length) == InstanceRequest::encode());

	InstanceDetails details(InstanceNet("relay.example.net", 80), false);
	Bytes response = GetServerInstance::response(3, details);
	Hex::print("response", response);
	assert(response.size() == Packet::parse(response.data(), response.data() + response.size(), &header, &payload));
	assert(PACKET_RESPONSE == header.type_);
	assert(0 == header.error);

	InstanceDetails decoded;
	DecodeError error;
	assert(GetServerInstance::parseResponse(payload, payload + header.length, &decoded, &error));
	assert(details == decoded);
}

}

int main(int argc, char *argv[])
{
	_testAddressTypes();
	_testHost();
	_testNet();
	_testDetails();
	_testRequest();
	_testPackets();

	printf("ok\n");

	return 0;
}
