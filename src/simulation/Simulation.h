#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "hotstuff/NodeState.h"
#include "simulation/Scenario.h"
#include "simulation/SimulationEvent.h"
#include "simulation/SimulationParameters.h"
#include <json/forwards.h>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hotbft
{

// Users of Simulation implement this to receive each event as soon as it
// is emitted (rendering, pacing). Events are also kept in the RunResult.
class SimulationObserver
{
  public:
    virtual ~SimulationObserver()
    {
    }

    virtual void eventEmitted(SimulationEvent const& event) = 0;
};

struct RunResult
{
    enum Status
    {
        COMPLETED,       // every round ran; see events for the outcome
        NOT_IMPLEMENTED, // attack type has no round script
        FAILED           // a round raised; see the ROUND_FAILED event
    };

    Status mStatus{COMPLETED};
    std::vector<SimulationEvent> mEvents;

    // one QC per proposal identity, as formed by the first node to get one
    std::vector<QuorumCertificatePtr> mFormedQCs;
    std::vector<EquivocationEvidence> mEvidence;
    std::map<NodeID, std::vector<BlockID>> mCommitLogs;

    // a QC formed in an attack round
    bool mUnexpectedQC{false};
    // QCs formed for two conflicting proposals of the same view
    bool mSafetyViolated{false};

    static char const* statusName(Status status);

    Json::Value toJson() const;
};

/**
 * Drives every validator's NodeState through a scenario. All delivery is
 * sequential: each vote reaches every node before the next vote is cast.
 */
class Simulation
{
  public:
    using pointer = std::shared_ptr<Simulation>;

    // throws std::invalid_argument if the parameters are not sane
    explicit Simulation(SimulationParameters const& params,
                        SimulationObserver* observer = nullptr);

    // resets all nodes and runs the script for the configured attack type
    RunResult run();

    // resets all nodes and runs `scenario`
    RunResult run(Scenario const& scenario);

    SimulationParameters const&
    getParameters() const
    {
        return mParams;
    }

    std::vector<NodeID> const&
    getNodeIDs() const
    {
        return mNodeIDs;
    }

    std::optional<NodeID> const&
    getFaultyLeader() const
    {
        return mParams.mFaultyLeader;
    }

    // throws std::out_of_range for unknown ids
    NodeState& getNode(NodeID const& id);
    NodeState const& getNode(NodeID const& id) const;

    RoundPhase
    getPhase() const
    {
        return mPhase;
    }

    Json::Value getJsonInfo() const;

  private:
    SimulationParameters const mParams;
    SimulationObserver* mObserver;
    std::vector<NodeID> const mNodeIDs;
    std::map<NodeID, std::unique_ptr<NodeState>> mNodes;

    RoundPhase mPhase{RoundPhase::IDLE};
    ViewNumber mView{0};
    RunResult mResult;

    void reset();
    void advanceTo(RoundPhase phase);
    void emit(SimulationEvent const& event);
    // appends ROUND_FAILED and marks the result FAILED; never throws on
    // behalf of the observer
    void recordFailure(std::string const& message);
    SimulationEvent makeEvent(SimulationEvent::Kind kind) const;

    // simulates gossip: the vote reaches every node
    void deliver(Vote const& vote);

    void dispatchProposals(RoundSpec const& round);
    void castVotes(RoundSpec const& round);
    void runAttackRound(RoundSpec const& round);
    void runViewChange(RoundSpec const& next);
    void runSafeRound(RoundSpec const& round);
    void reportCommits();

    // every node attempts a QC for each proposal of the round; returns the
    // identities that reached quorum somewhere
    std::vector<std::string> formQCs(RoundSpec const& round, bool commit);
};
}
