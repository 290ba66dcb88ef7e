#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "TdfReader.hpp"

namespace com { namespace blazeredirect { namespace tdf {

// Human readable rendering of a tag-value stream, one "TAG: value" per
// line. Input that doesn't parse renders up to the failure, followed by a
// line naming the DecodeError.
class TdfPrinter {
public:
	static std::string repr(const uint8_t *src, const uint8_t *limit, size_t indent = 4);
	static std::string repr(const Bytes &src, size_t indent = 4);

	// answer false (with what was rendered so far in dst) if reader fails.
	static bool reprFields(TdfReader &reader, std::string &dst, size_t depth, size_t indent, bool inGroup);
	static bool reprValue(TdfReader &reader, uint8_t type_, std::string &dst, size_t depth, size_t indent);
};

} } } // namespace com::blazeredirect::tdf
