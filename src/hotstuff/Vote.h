#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "hotstuff/Proposal.h"
#include <json/forwards.h>
#include <string>

namespace hotbft
{

// `mVoter` endorses `mProposal` in the proposal's view.
struct Vote
{
    NodeID mVoter;
    Proposal mProposal;
    std::string mSignature;

    Vote(NodeID const& voter, Proposal const& proposal,
         std::string const& signature);

    // builds the vote `voter` casts for `proposal`, signature included
    static Vote castBy(NodeID const& voter, Proposal const& proposal);

    Json::Value toJson() const;
};
}
