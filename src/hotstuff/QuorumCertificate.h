#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "hotstuff/Proposal.h"
#include <json/forwards.h>
#include <memory>
#include <vector>

namespace hotbft
{

// A proposal together with the (ascending) voter set that certifies it.
struct QuorumCertificate
{
    Proposal mProposal;
    std::vector<NodeID> mVoters;

    QuorumCertificate(Proposal const& proposal,
                      std::vector<NodeID> const& voters);

    Json::Value toJson() const;
};

typedef std::shared_ptr<QuorumCertificate const> QuorumCertificatePtr;

bool operator==(QuorumCertificate const& l, QuorumCertificate const& r);
bool operator!=(QuorumCertificate const& l, QuorumCertificate const& r);
}
