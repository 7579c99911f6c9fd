// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "hotstuff/Vote.h"
#include "hotstuff/Signing.h"
#include <json/json.h>

namespace hotbft
{

Vote::Vote(NodeID const& voter, Proposal const& proposal,
           std::string const& signature)
    : mVoter(voter), mProposal(proposal), mSignature(signature)
{
}

Vote
Vote::castBy(NodeID const& voter, Proposal const& proposal)
{
    return Vote(voter, proposal, sign(voter, proposal.getIdentity()));
}

Json::Value
Vote::toJson() const
{
    Json::Value ret;
    ret["voter"] = mVoter;
    ret["proposal"] = mProposal.getIdentity();
    ret["signature"] = mSignature;
    return ret;
}
}
