// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "hotstuff/QuorumCertificate.h"
#include <json/json.h>

namespace hotbft
{

QuorumCertificate::QuorumCertificate(Proposal const& proposal,
                                     std::vector<NodeID> const& voters)
    : mProposal(proposal), mVoters(voters)
{
}

Json::Value
QuorumCertificate::toJson() const
{
    Json::Value ret;
    ret["proposal"] = mProposal.toJson();
    auto& voters = ret["voters"];
    voters = Json::arrayValue;
    for (auto const& v : mVoters)
    {
        voters.append(v);
    }
    return ret;
}

bool
operator==(QuorumCertificate const& l, QuorumCertificate const& r)
{
    return l.mProposal == r.mProposal && l.mVoters == r.mVoters;
}

bool
operator!=(QuorumCertificate const& l, QuorumCertificate const& r)
{
    return !(l == r);
}
}
