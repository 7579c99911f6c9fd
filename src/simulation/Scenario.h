#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "hotstuff/Proposal.h"
#include "simulation/SimulationParameters.h"
#include <memory>
#include <string>
#include <vector>

namespace hotbft
{

// one proposal and the validators the leader shows it to
struct ProposalDispatch
{
    Proposal mProposal;
    std::vector<NodeID> mRecipients;
};

/**
 * Declarative description of one round: who leads, what is proposed and to
 * whom. Every recipient casts one vote per proposal it is shown, so a
 * validator listed in two dispatches of the same round equivocates.
 */
struct RoundSpec
{
    enum Kind
    {
        ATTACK_ROUND, // expected to end without a QC
        SAFE_ROUND    // expected to form a QC and commit
    };

    Kind mKind;
    ViewNumber mView;
    NodeID mLeader;
    std::vector<ProposalDispatch> mDispatches;
};

/**
 * A run script: an optional attack round followed by a safe round, with
 * strictly increasing views.
 */
class Scenario
{
    std::string mName;
    std::vector<RoundSpec> mRounds;

  public:
    static BlockID const GENESIS;

    // throws std::invalid_argument if the rounds are out of order
    Scenario(std::string const& name, std::vector<RoundSpec> const& rounds);

    std::string const&
    getName() const
    {
        return mName;
    }

    std::vector<RoundSpec> const&
    getRounds() const
    {
        return mRounds;
    }

    // faulty leader proposes X and Y to the two halves of the validator set
    // in view 1, then the next validator in order proposes Z to everyone in
    // view 2
    static Scenario equivocation(SimulationParameters const& params);

    // nullptr for attack types that have no round script
    static std::unique_ptr<Scenario>
    forAttack(SimulationParameters const& params);

    // validator following `leader` in `ids`, wrapping around
    static NodeID nextLeader(std::vector<NodeID> const& ids,
                             NodeID const& leader);
};
}
