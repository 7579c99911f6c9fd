// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "simulation/Simulation.h"
#include "test/Catch2.h"
#include "test/test.h"
#include <json/json.h>
#include <stdexcept>

using namespace hotbft;

namespace
{
std::vector<SimulationEvent>
eventsOfKind(RunResult const& result, SimulationEvent::Kind kind)
{
    std::vector<SimulationEvent> res;
    for (auto const& e : result.mEvents)
    {
        if (e.mKind == kind)
        {
            res.emplace_back(e);
        }
    }
    return res;
}

class RecordingObserver : public SimulationObserver
{
  public:
    std::vector<SimulationEvent::Kind> mKinds;

    void
    eventEmitted(SimulationEvent const& event) override
    {
        mKinds.emplace_back(event.mKind);
    }
};

class ThrowingObserver : public SimulationObserver
{
    SimulationEvent::Kind const mFailOn;
    bool const mFailAlways;

  public:
    explicit ThrowingObserver(
        SimulationEvent::Kind failOn = SimulationEvent::VOTE_CAST,
        bool failAlways = false)
        : mFailOn(failOn), mFailAlways(failAlways)
    {
    }

    void
    eventEmitted(SimulationEvent const& event) override
    {
        if (mFailAlways || event.mKind == mFailOn)
        {
            throw std::runtime_error("renderer went away");
        }
    }
};
}

TEST_CASE("equivocation attack end to end", "[simulation]")
{
    Simulation sim(getTestParameters(7, 2));
    auto result = sim.run();

    REQUIRE(result.mStatus == RunResult::COMPLETED);
    REQUIRE(!result.mUnexpectedQC);
    REQUIRE(!result.mSafetyViolated);
    REQUIRE(result.mEvidence.empty());
    REQUIRE(sim.getPhase() == RoundPhase::COMPLETE);

    SECTION("the leader splits the validators")
    {
        auto dispatched =
            eventsOfKind(result, SimulationEvent::PROPOSAL_DISPATCHED);
        REQUIRE(dispatched.size() == 3);
        REQUIRE(dispatched[0].mProposal->getIdentity() == "X@v1");
        REQUIRE(dispatched[0].mNodes ==
                std::vector<NodeID>{"A", "B", "C"});
        REQUIRE(dispatched[1].mProposal->getIdentity() == "Y@v1");
        REQUIRE(dispatched[1].mNodes ==
                std::vector<NodeID>{"D", "E", "F", "G"});
        REQUIRE(dispatched[0].mNode == "A");
    }

    SECTION("no QC forms in view 1")
    {
        auto outcomes = eventsOfKind(result, SimulationEvent::QC_OUTCOME);
        REQUIRE(outcomes.size() == 3);
        REQUIRE(!outcomes[0].mQuorumReached);
        REQUIRE(outcomes[0].mCount == 3);
        REQUIRE(!outcomes[1].mQuorumReached);
        REQUIRE(outcomes[1].mCount == 4);
        REQUIRE(eventsOfKind(result, SimulationEvent::SAFETY_WARNING).empty());
    }

    SECTION("view changes to the next validator")
    {
        auto vc = eventsOfKind(result, SimulationEvent::VIEW_CHANGE);
        REQUIRE(vc.size() == 1);
        REQUIRE(vc[0].mView == 2);
        REQUIRE(vc[0].mNode == "B");
    }

    SECTION("every node commits Z exactly once")
    {
        REQUIRE(result.mFormedQCs.size() == 1);
        auto const& qc = *result.mFormedQCs.front();
        REQUIRE(qc.mProposal.getIdentity() == "Z@v2");
        REQUIRE(qc.mVoters ==
                std::vector<NodeID>{"A", "B", "C", "D", "E"});

        REQUIRE(result.mCommitLogs.size() == 7);
        for (auto const& id : sim.getNodeIDs())
        {
            REQUIRE(result.mCommitLogs.at(id) == std::vector<BlockID>{"Z"});
            REQUIRE(sim.getNode(id).getCommitted() ==
                    std::vector<BlockID>{"Z"});
        }

        auto applied = eventsOfKind(result, SimulationEvent::COMMIT_APPLIED);
        REQUIRE(applied.size() == 1);
        REQUIRE(applied[0].mNodes.size() == 7);
    }

    SECTION("event log shape")
    {
        REQUIRE(result.mEvents.size() == 26);
        REQUIRE(result.mEvents.front().mKind ==
                SimulationEvent::LEADER_ANNOUNCED);
        REQUIRE(result.mEvents.back().mKind == SimulationEvent::RUN_COMPLETE);
        REQUIRE(eventsOfKind(result, SimulationEvent::VOTE_CAST).size() == 14);

        auto report = eventsOfKind(result, SimulationEvent::EVIDENCE_REPORT);
        REQUIRE(report.size() == 1);
        REQUIRE(report[0].mEvidence.empty());
        REQUIRE(report[0].toString() == "No equivocation evidence found.");
    }

    SECTION("phases never go backwards")
    {
        auto last = RoundPhase::IDLE;
        for (auto const& e : result.mEvents)
        {
            REQUIRE(e.mPhase >= last);
            last = e.mPhase;
        }
        REQUIRE(last == RoundPhase::COMPLETE);
    }
}

TEST_CASE("double voters produce evidence", "[simulation]")
{
    // N=10, f=3, Q=7: X goes to A..E, Y to F..J
    auto params = getTestParameters(10, 3);
    params.mDoubleVoters = {"G", "B"};
    Simulation sim(params);
    auto result = sim.run();

    REQUIRE(result.mStatus == RunResult::COMPLETED);

    // X reaches A..E and G, Y reaches F..J and B: six votes each
    REQUIRE(!result.mUnexpectedQC);
    REQUIRE(result.mEvidence.size() == 2);
    REQUIRE(result.mEvidence[0] ==
            EquivocationEvidence("B", "X@v1", "Y@v1"));
    REQUIRE(result.mEvidence[1] ==
            EquivocationEvidence("G", "Y@v1", "X@v1"));

    // every node saw both votes
    for (auto const& id : sim.getNodeIDs())
    {
        REQUIRE(sim.getNode(id).getEvidence().size() == 2);
    }

    auto report = eventsOfKind(result, SimulationEvent::EVIDENCE_REPORT);
    REQUIRE(report.size() == 1);
    REQUIRE(report[0].isWarning());
    REQUIRE(report[0].mEvidence == result.mEvidence);

    // evidence does not stop the safe round
    REQUIRE(result.mCommitLogs.at("J") == std::vector<BlockID>{"Z"});
}

TEST_CASE("weak quorum is reported as a safety violation", "[simulation]")
{
    SECTION("f=0 lets both halves certify")
    {
        auto params = getTestParameters(4, 0);
        REQUIRE(params.getQuorum() == 1);
        Simulation sim(params);
        auto result = sim.run();

        REQUIRE(result.mStatus == RunResult::COMPLETED);
        REQUIRE(result.mUnexpectedQC);
        REQUIRE(result.mSafetyViolated);
        auto warnings = eventsOfKind(result, SimulationEvent::SAFETY_WARNING);
        REQUIRE(warnings.size() == 1);
        REQUIRE(warnings[0].isWarning());
        REQUIRE(warnings[0].mMessage.find("X@v1 and Y@v1") !=
                std::string::npos);

        // attack certificates are never committed
        for (auto const& id : sim.getNodeIDs())
        {
            REQUIRE(result.mCommitLogs.at(id) == std::vector<BlockID>{"Z"});
        }
        REQUIRE(result.mFormedQCs.size() == 3);
    }

    SECTION("quorum override lets one side certify")
    {
        auto params = getTestParameters(7, 2);
        params.mQuorumOverride = 4;
        Simulation sim(params);
        auto result = sim.run();

        REQUIRE(result.mUnexpectedQC);
        REQUIRE(!result.mSafetyViolated);
        auto warnings = eventsOfKind(result, SimulationEvent::SAFETY_WARNING);
        REQUIRE(warnings.size() == 1);
        REQUIRE(warnings[0].mMessage.find("Y@v1") != std::string::npos);
    }
}

TEST_CASE("unimplemented attacks", "[simulation]")
{
    for (auto attack : {AttackType::WITHHOLD_QC, AttackType::DROP_MESSAGES})
    {
        auto params = getTestParameters(7, 2);
        params.mAttack = attack;
        Simulation sim(params);
        auto result = sim.run();

        REQUIRE(result.mStatus == RunResult::NOT_IMPLEMENTED);
        REQUIRE(result.mEvents.size() == 1);
        REQUIRE(result.mEvents[0].mKind == SimulationEvent::NOT_IMPLEMENTED);
        REQUIRE(result.mEvidence.empty());
        REQUIRE(result.mCommitLogs.empty());
        REQUIRE(result.mFormedQCs.empty());
        for (auto const& id : sim.getNodeIDs())
        {
            REQUIRE(sim.getNode(id).getCommitted().empty());
        }
    }
}

TEST_CASE("invalid parameters are rejected before a run", "[simulation]")
{
    SimulationParameters params;

    SECTION("too few validators")
    {
        params.mValidatorCount = 3;
        params.mFaults = 0;
    }
    SECTION("too many validators")
    {
        params.mValidatorCount = 14;
    }
    SECTION("fault bound too high")
    {
        params.mFaults = 3;
    }
    SECTION("quorum larger than the set")
    {
        params.mQuorumOverride = 8;
    }
    SECTION("zero quorum")
    {
        params.mQuorumOverride = 0;
    }
    SECTION("unknown faulty leader")
    {
        params.mFaultyLeader = NodeID("Q");
    }
    SECTION("unknown double voter")
    {
        params.mDoubleVoters = {"A", "Node40"};
    }
    REQUIRE_THROWS_AS(Simulation(params), std::invalid_argument);
}

TEST_CASE("simulation without a faulty leader", "[simulation]")
{
    auto params = getTestParameters();
    params.mFaultyLeader = std::nullopt;
    Simulation sim(params);
    REQUIRE(!sim.getFaultyLeader());

    auto result = sim.run();
    auto leaders = eventsOfKind(result, SimulationEvent::LEADER_ANNOUNCED);
    REQUIRE(leaders.size() == 1);
    REQUIRE(leaders[0].mNode == "A");
    REQUIRE(eventsOfKind(result, SimulationEvent::VIEW_CHANGE)[0].mNode ==
            "B");
    REQUIRE(result.mCommitLogs.at("G") == std::vector<BlockID>{"Z"});
}

TEST_CASE("last validator hands the safe round to the first",
          "[simulation]")
{
    auto params = getTestParameters(7, 2);
    params.mFaultyLeader = NodeID("G");
    Simulation sim(params);
    auto result = sim.run();
    auto vc = eventsOfKind(result, SimulationEvent::VIEW_CHANGE);
    REQUIRE(vc.size() == 1);
    REQUIRE(vc[0].mNode == "A");
}

TEST_CASE("runs are repeatable", "[simulation]")
{
    auto params = getTestParameters(7, 2);
    params.mDoubleVoters = {"C"};
    Simulation sim(params);
    auto first = sim.run().toJson();
    auto second = sim.run().toJson();
    REQUIRE(first == second);

    Simulation other(params);
    REQUIRE(other.run().toJson() == first);
}

TEST_CASE("observer sees every event in order", "[simulation]")
{
    RecordingObserver observer;
    Simulation sim(getTestParameters(), &observer);
    auto result = sim.run();

    REQUIRE(observer.mKinds.size() == result.mEvents.size());
    for (size_t i = 0; i < observer.mKinds.size(); i++)
    {
        REQUIRE(observer.mKinds[i] == result.mEvents[i].mKind);
    }
}

TEST_CASE("failures inside a round are captured", "[simulation]")
{
    SECTION("observer throws")
    {
        ThrowingObserver observer;
        Simulation sim(getTestParameters(), &observer);
        auto result = sim.run();

        REQUIRE(result.mStatus == RunResult::FAILED);
        REQUIRE(result.mEvents.back().mKind == SimulationEvent::ROUND_FAILED);
        REQUIRE(result.mEvents.back().mMessage.find("renderer went away") !=
                std::string::npos);
        REQUIRE(result.mCommitLogs.empty());
    }

    SECTION("observer throws on run completion")
    {
        ThrowingObserver observer(SimulationEvent::RUN_COMPLETE);
        Simulation sim(getTestParameters(), &observer);
        RunResult result;
        REQUIRE_NOTHROW(result = sim.run());

        REQUIRE(result.mStatus == RunResult::FAILED);
        REQUIRE(result.mEvents.back().mKind == SimulationEvent::ROUND_FAILED);
        REQUIRE(result.mEvents.back().mMessage.find("renderer went away") !=
                std::string::npos);
        // commits happened before the report failed
        REQUIRE(result.mCommitLogs.size() == 7);
    }

    SECTION("observer throws on every event")
    {
        ThrowingObserver observer(SimulationEvent::RUN_COMPLETE, true);
        Simulation sim(getTestParameters(), &observer);
        RunResult result;
        REQUIRE_NOTHROW(result = sim.run());

        REQUIRE(result.mStatus == RunResult::FAILED);
        REQUIRE(result.mEvents.size() == 2);
        REQUIRE(result.mEvents.front().mKind ==
                SimulationEvent::LEADER_ANNOUNCED);
        REQUIRE(result.mEvents.back().mKind == SimulationEvent::ROUND_FAILED);
    }

    SECTION("observer throws while reporting an unimplemented attack")
    {
        auto params = getTestParameters();
        params.mAttack = AttackType::WITHHOLD_QC;
        ThrowingObserver observer(SimulationEvent::NOT_IMPLEMENTED, true);
        Simulation sim(params, &observer);
        RunResult result;
        REQUIRE_NOTHROW(result = sim.run());

        REQUIRE(result.mStatus == RunResult::FAILED);
        REQUIRE(eventsOfKind(result, SimulationEvent::NOT_IMPLEMENTED).size() ==
                1);
        REQUIRE(result.mEvents.back().mKind == SimulationEvent::ROUND_FAILED);
    }

    SECTION("scenario names an unknown recipient")
    {
        Simulation sim(getTestParameters());
        Proposal z("Z", Scenario::GENESIS, 1, "A");
        Scenario bad("bad", {{RoundSpec::SAFE_ROUND, 1, "A", {{z, {"A", "Q"}}}}});
        auto result = sim.run(bad);

        REQUIRE(result.mStatus == RunResult::FAILED);
        auto failed = eventsOfKind(result, SimulationEvent::ROUND_FAILED);
        REQUIRE(failed.size() == 1);
        REQUIRE(failed[0].isWarning());
        REQUIRE(eventsOfKind(result, SimulationEvent::RUN_COMPLETE).empty());
    }
}

TEST_CASE("custom scenario with only a safe round", "[simulation]")
{
    Simulation sim(getTestParameters());
    Proposal z("Z", Scenario::GENESIS, 1, "C");
    Scenario safeOnly("safe", {{RoundSpec::SAFE_ROUND,
                                1,
                                "C",
                                {{z, sim.getNodeIDs()}}}});
    auto result = sim.run(safeOnly);

    REQUIRE(result.mStatus == RunResult::COMPLETED);
    REQUIRE(eventsOfKind(result, SimulationEvent::VIEW_CHANGE).empty());
    REQUIRE(eventsOfKind(result, SimulationEvent::EVIDENCE_REPORT).empty());
    REQUIRE(result.mEvents.front().mPhase == RoundPhase::SAFE_ROUND);
    REQUIRE(result.mCommitLogs.at("A") == std::vector<BlockID>{"Z"});
}

TEST_CASE("simulation json export", "[simulation]")
{
    auto params = getTestParameters();
    params.mDoubleVoters = {"D"};
    Simulation sim(params);
    auto result = sim.run();

    auto json = result.toJson();
    REQUIRE(json["status"].asString() == "COMPLETED");
    REQUIRE(json["events"].size() == result.mEvents.size());
    REQUIRE(json["events"][0]["kind"].asString() == "LEADER_ANNOUNCED");
    REQUIRE(json["evidence"].size() == 1);
    REQUIRE(json["evidence"][0]["accused"].asString() == "D");
    REQUIRE(json["qcs"].size() == 1);
    REQUIRE(json["commits"]["A"][0].asString() == "Z");
    REQUIRE(!json["safety_violated"].asBool());

    auto info = sim.getJsonInfo();
    REQUIRE(info["quorum"].asUInt() == 5);
    REQUIRE(info["faulty_leader"].asString() == "A");
    REQUIRE(info["phase"].asString() == "COMPLETE");
    REQUIRE(info["nodes"].size() == 7);
    REQUIRE(info["nodes"][3]["evidence"].size() == 1);

    REQUIRE_THROWS_AS(sim.getNode("Q"), std::out_of_range);
}
