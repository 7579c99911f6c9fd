// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/types.h"

#include <cctype>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace hotbft
{

bool
iequals(std::string const& a, std::string const& b)
{
    size_t sz = a.size();
    if (b.size() != sz)
        return false;
    for (size_t i = 0; i < sz; ++i)
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    return true;
}

std::string
idsToStr(std::vector<NodeID> const& ids)
{
    return fmt::format(FMT_STRING("[{}]"), fmt::join(ids, ", "));
}
}
