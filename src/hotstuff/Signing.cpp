// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "hotstuff/Signing.h"
#include "crypto/Hex.h"
#include "crypto/SHA.h"
#include <fmt/format.h>

namespace hotbft
{

std::string
sign(NodeID const& signer, std::string const& proposalIdentity)
{
    SHA256 hasher;
    hasher.add(signer);
    hasher.add("|");
    hasher.add(proposalIdentity);
    auto digest = hasher.finish();
    return fmt::format(FMT_STRING("SIG({}:{})"), signer, hexAbbrev(digest));
}

NodeID
makeValidatorID(size_t index)
{
    if (index < 26)
    {
        return NodeID(1, static_cast<char>('A' + index));
    }
    return fmt::format(FMT_STRING("Node{}"), index);
}

std::vector<NodeID>
makeValidatorIDs(size_t count)
{
    std::vector<NodeID> res;
    res.reserve(count);
    for (size_t i = 0; i < count; i++)
    {
        res.emplace_back(makeValidatorID(i));
    }
    return res;
}
}
