#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "hotstuff/EquivocationEvidence.h"
#include "hotstuff/QuorumCertificate.h"
#include "hotstuff/Vote.h"
#include <json/forwards.h>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace hotbft
{

/**
 * Protocol state held by one validator: the votes it has observed, the
 * equivocation evidence it derived from them, the quorum certificates it
 * formed and the blocks it committed.
 *
 * Votes are filed by proposal identity. A second index, keyed by
 * (voter, view, proposer), lets an incoming vote be checked for conflicts
 * without scanning every other proposal.
 *
 * Not thread safe: a node is owned by a single driver, which delivers votes
 * one at a time.
 */
class NodeState
{
  public:
    enum VoteStatus
    {
        VOTE_RECORDED, // first vote of this voter for this proposal
        VOTE_DUPLICATE // voter already counted for this proposal, not
                       // counted again toward quorum
    };

    explicit NodeState(NodeID const& nodeID);
    NodeState(NodeState const&) = delete;
    NodeState& operator=(NodeState const&) = delete;

    NodeID const&
    getNodeID() const
    {
        return mNodeID;
    }

    // files the vote under its proposal identity and derives evidence
    // against any other proposal the same voter endorsed for the same
    // proposer in the same view
    VoteStatus recordVote(Vote const& vote);

    // returns a QC over the `quorum` lowest voter IDs once at least `quorum`
    // distinct voters endorsed `proposal`, nullptr otherwise
    QuorumCertificatePtr tryFormQC(Proposal const& proposal, uint32 quorum);

    // appends the QC's block to the commit log; returns false if the block
    // was already committed
    bool applyQCCommit(QuorumCertificate const& qc);

    // ** status methods

    // votes received for the proposal identity, in arrival order
    std::vector<Vote> const&
    getVotes(std::string const& proposalIdentity) const;

    size_t getProposalCount() const;

    std::set<EquivocationEvidence> const&
    getEvidence() const
    {
        return mEvidence;
    }

    std::vector<BlockID> const&
    getCommitted() const
    {
        return mCommitted;
    }

    QuorumCertificatePtr
    getHighestQC() const
    {
        return mHighestQC;
    }

    bool isCommitted(BlockID const& block) const;

    Json::Value getJsonInfo() const;

  private:
    // (voter, view, proposer)
    typedef std::tuple<NodeID, ViewNumber, NodeID> VoteSlot;

    NodeID const mNodeID;

    std::map<std::string, std::vector<Vote>> mReceivedVotes;
    std::map<VoteSlot, std::set<std::string>> mEndorsements;
    std::set<EquivocationEvidence> mEvidence;
    std::vector<BlockID> mCommitted;
    QuorumCertificatePtr mHighestQC;

    void checkForEquivocation(Vote const& vote);
};
}
