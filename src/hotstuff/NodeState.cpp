// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "hotstuff/NodeState.h"
#include "util/Logging.h"
#include <algorithm>
#include <json/json.h>
#include <stdexcept>

namespace hotbft
{

NodeState::NodeState(NodeID const& nodeID) : mNodeID(nodeID)
{
    if (mNodeID.empty())
    {
        throw std::invalid_argument("node id must not be empty");
    }
    CLOG_DEBUG(Node, "NodeState::NodeState@{}", mNodeID);
}

NodeState::VoteStatus
NodeState::recordVote(Vote const& vote)
{
    auto pid = vote.mProposal.getIdentity();
    auto& votes = mReceivedVotes[pid];

    auto it = std::find_if(votes.begin(), votes.end(), [&](Vote const& v) {
        return v.mVoter == vote.mVoter;
    });
    if (it != votes.end())
    {
        CLOG_DEBUG(Node, "{}: ignoring duplicate vote by {} for {}", mNodeID,
                   vote.mVoter, pid);
        // the same identity may come from another proposer; its slot still
        // has to see the endorsement
        checkForEquivocation(vote);
        return VOTE_DUPLICATE;
    }

    votes.emplace_back(vote);
    CLOG_TRACE(Node, "{}: recorded vote by {} for {} ({} votes)", mNodeID,
               vote.mVoter, pid, votes.size());

    checkForEquivocation(vote);
    return VOTE_RECORDED;
}

void
NodeState::checkForEquivocation(Vote const& vote)
{
    auto const& p = vote.mProposal;
    auto pid = p.getIdentity();
    auto& endorsed =
        mEndorsements[VoteSlot(vote.mVoter, p.getView(), p.getProposer())];

    // within one (voter, view, proposer) slot, a different identity can
    // only mean a different block
    for (auto const& other : endorsed)
    {
        if (other == pid)
        {
            continue;
        }
        auto res = mEvidence.emplace(vote.mVoter, other, pid);
        if (res.second)
        {
            CLOG_WARNING(Node, "{}: {}", mNodeID, res.first->toString());
        }
    }
    endorsed.insert(pid);
}

QuorumCertificatePtr
NodeState::tryFormQC(Proposal const& proposal, uint32 quorum)
{
    if (quorum == 0)
    {
        throw std::invalid_argument("quorum threshold must be positive");
    }

    auto pid = proposal.getIdentity();
    auto it = mReceivedVotes.find(pid);
    if (it == mReceivedVotes.end() || it->second.size() < quorum)
    {
        CLOG_TRACE(Node, "{}: no quorum for {} ({}/{})", mNodeID, pid,
                   it == mReceivedVotes.end() ? 0 : it->second.size(), quorum);
        return nullptr;
    }

    std::vector<NodeID> voters;
    voters.reserve(it->second.size());
    for (auto const& v : it->second)
    {
        voters.emplace_back(v.mVoter);
    }
    std::sort(voters.begin(), voters.end());
    voters.resize(quorum);

    auto qc = std::make_shared<QuorumCertificate const>(proposal, voters);

    // highest QC only moves to strictly higher views
    if (!mHighestQC || mHighestQC->mProposal.getView() < proposal.getView())
    {
        mHighestQC = qc;
    }

    CLOG_DEBUG(Node, "{}: formed QC for {} with {}", mNodeID, pid,
               idsToStr(voters));
    return qc;
}

bool
NodeState::applyQCCommit(QuorumCertificate const& qc)
{
    auto const& block = qc.mProposal.getBlockID();
    if (isCommitted(block))
    {
        CLOG_DEBUG(Node, "{}: {} already committed", mNodeID, block);
        return false;
    }
    mCommitted.emplace_back(block);
    CLOG_DEBUG(Node, "{}: committed {} (height {})", mNodeID, block,
               mCommitted.size());
    return true;
}

std::vector<Vote> const&
NodeState::getVotes(std::string const& proposalIdentity) const
{
    static std::vector<Vote> const noVotes;
    auto it = mReceivedVotes.find(proposalIdentity);
    if (it == mReceivedVotes.end())
    {
        return noVotes;
    }
    return it->second;
}

size_t
NodeState::getProposalCount() const
{
    return mReceivedVotes.size();
}

bool
NodeState::isCommitted(BlockID const& block) const
{
    return std::find(mCommitted.begin(), mCommitted.end(), block) !=
           mCommitted.end();
}

Json::Value
NodeState::getJsonInfo() const
{
    Json::Value ret;
    ret["node"] = mNodeID;

    auto& votes = ret["votes"];
    votes = Json::objectValue;
    for (auto const& kv : mReceivedVotes)
    {
        auto& entry = votes[kv.first];
        entry = Json::arrayValue;
        for (auto const& v : kv.second)
        {
            entry.append(v.toJson());
        }
    }

    auto& evidence = ret["evidence"];
    evidence = Json::arrayValue;
    for (auto const& e : mEvidence)
    {
        evidence.append(e.toJson());
    }

    auto& committed = ret["committed"];
    committed = Json::arrayValue;
    for (auto const& b : mCommitted)
    {
        committed.append(b);
    }

    if (mHighestQC)
    {
        ret["highest_qc"] = mHighestQC->toJson();
    }
    return ret;
}
}
