// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "hotstuff/EquivocationEvidence.h"
#include <fmt/format.h>
#include <json/json.h>
#include <stdexcept>
#include <tuple>

namespace hotbft
{

EquivocationEvidence::EquivocationEvidence(NodeID const& accused,
                                           std::string const& proposalA,
                                           std::string const& proposalB)
    : mAccused(accused)
{
    if (proposalA == proposalB)
    {
        throw std::invalid_argument(
            "equivocation needs two distinct proposals");
    }
    if (proposalA < proposalB)
    {
        mFirst = proposalA;
        mSecond = proposalB;
    }
    else
    {
        mFirst = proposalB;
        mSecond = proposalA;
    }
}

std::string
EquivocationEvidence::toString() const
{
    return fmt::format(FMT_STRING("{} signed conflicting proposals: {} vs {}"),
                       mAccused, mFirst, mSecond);
}

Json::Value
EquivocationEvidence::toJson() const
{
    Json::Value ret;
    ret["accused"] = mAccused;
    ret["conflict"].append(mFirst);
    ret["conflict"].append(mSecond);
    return ret;
}

bool
operator==(EquivocationEvidence const& l, EquivocationEvidence const& r)
{
    return l.getAccused() == r.getAccused() && l.getFirst() == r.getFirst() &&
           l.getSecond() == r.getSecond();
}

bool
operator!=(EquivocationEvidence const& l, EquivocationEvidence const& r)
{
    return !(l == r);
}

bool
operator<(EquivocationEvidence const& l, EquivocationEvidence const& r)
{
    return std::tie(l.getAccused(), l.getFirst(), l.getSecond()) <
           std::tie(r.getAccused(), r.getFirst(), r.getSecond());
}
}

namespace std
{
size_t
hash<hotbft::EquivocationEvidence>::operator()(
    hotbft::EquivocationEvidence const& e) const noexcept
{
    std::hash<std::string> h;
    size_t res = h(e.getAccused());
    // boost::hash_combine mixing
    res ^= h(e.getFirst()) + 0x9e3779b9 + (res << 6) + (res >> 2);
    res ^= h(e.getSecond()) + 0x9e3779b9 + (res << 6) + (res >> 2);
    return res;
}
}
