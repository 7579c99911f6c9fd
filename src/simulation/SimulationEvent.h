#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "hotstuff/EquivocationEvidence.h"
#include "hotstuff/Proposal.h"
#include <json/forwards.h>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hotbft
{

// Phases of a run, in the only order they may be entered.
enum class RoundPhase
{
    IDLE,
    PROPOSAL,
    VOTING,
    QC_FORMATION,
    EVIDENCE_REPORT,
    VIEW_CHANGE,
    SAFE_ROUND,
    COMMIT,
    COMPLETE
};

char const* phaseName(RoundPhase phase);

/**
 * One entry of the structured run log. Which payload fields are set
 * depends on the kind; presentation renders them with toString or toJson.
 */
struct SimulationEvent
{
    enum Kind
    {
        LEADER_ANNOUNCED,    // mNode leads mView
        PROPOSAL_DISPATCHED, // mProposal sent to mNodes
        VOTE_CAST,           // mNode voted for mProposal with mSignature
        QC_OUTCOME,          // mQuorumReached, mNodes = QC voters
        SAFETY_WARNING,      // QC formed where none should
        EVIDENCE_REPORT,     // mEvidence aggregated over all nodes
        VIEW_CHANGE,         // mView entered, mNode new leader
        COMMIT_APPLIED,      // mNodes committed mProposal's block
        COMMIT_SNAPSHOT,     // mCommitLogs
        NOT_IMPLEMENTED,     // attack type without a round script
        ROUND_FAILED,        // mMessage holds the captured error
        RUN_COMPLETE
    };

    Kind mKind;
    RoundPhase mPhase;
    ViewNumber mView;

    NodeID mNode;
    std::optional<Proposal> mProposal;
    std::vector<NodeID> mNodes;
    std::string mSignature;
    bool mQuorumReached{false};
    size_t mCount{0};
    std::vector<EquivocationEvidence> mEvidence;
    std::map<NodeID, std::vector<BlockID>> mCommitLogs;
    std::string mMessage;

    SimulationEvent(Kind kind, RoundPhase phase, ViewNumber view);

    static char const* kindName(Kind kind);

    // true for kinds presentation should highlight
    bool isWarning() const;

    std::string toString() const;
    Json::Value toJson() const;
};
}
