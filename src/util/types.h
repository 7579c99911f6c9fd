#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace hotbft
{
typedef std::vector<unsigned char> Blob;

typedef uint32_t uint32;
typedef int32_t int32;
typedef uint64_t uint64;

typedef std::array<unsigned char, 32> uint256;
typedef uint256 Hash;

// validators are named, not keyed: signatures are opaque tokens
typedef std::string NodeID;
typedef std::string BlockID;
typedef uint32 ViewNumber;

// case insensitive comparison, used for log levels and config enums
bool iequals(std::string const& a, std::string const& b);

// joins ids as "[A, B, C]" for log lines
std::string idsToStr(std::vector<NodeID> const& ids);
}
