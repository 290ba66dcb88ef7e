#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cstdint>
#include <string>
#include <vector>

namespace com { namespace blazeredirect {

class Hex {
public:
	static std::string encode(const uint8_t *bytes, size_t len);
	static std::string encode(const std::vector<uint8_t> &bytes);

	// whitespace may separate byte pairs. dst is unchanged on failure.
	static bool decode(const char *hex, std::vector<uint8_t> &dst);

	// 16 bytes per line with offsets and printable characters, to stdout.
	static void print(const char *msg, const std::vector<uint8_t> &bytes);
};

} } // namespace com::blazeredirect
