// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "simulation/Simulation.h"
#include "util/GlobalChecks.h"
#include "util/Logging.h"
#include <algorithm>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <json/json.h>
#include <stdexcept>
#include <unordered_set>

namespace hotbft
{

namespace
{
SimulationParameters const&
validated(SimulationParameters const& params)
{
    params.validate();
    return params;
}
}

char const*
RunResult::statusName(Status status)
{
    switch (status)
    {
    case COMPLETED:
        return "COMPLETED";
    case NOT_IMPLEMENTED:
        return "NOT_IMPLEMENTED";
    case FAILED:
        return "FAILED";
    }
    return "UNKNOWN";
}

Json::Value
RunResult::toJson() const
{
    Json::Value ret;
    ret["status"] = statusName(mStatus);
    ret["unexpected_qc"] = mUnexpectedQC;
    ret["safety_violated"] = mSafetyViolated;

    auto& events = ret["events"];
    events = Json::arrayValue;
    for (auto const& e : mEvents)
    {
        events.append(e.toJson());
    }

    auto& qcs = ret["qcs"];
    qcs = Json::arrayValue;
    for (auto const& qc : mFormedQCs)
    {
        qcs.append(qc->toJson());
    }

    auto& evidence = ret["evidence"];
    evidence = Json::arrayValue;
    for (auto const& e : mEvidence)
    {
        evidence.append(e.toJson());
    }

    auto& commits = ret["commits"];
    commits = Json::objectValue;
    for (auto const& kv : mCommitLogs)
    {
        auto& entry = commits[kv.first];
        entry = Json::arrayValue;
        for (auto const& b : kv.second)
        {
            entry.append(b);
        }
    }
    return ret;
}

Simulation::Simulation(SimulationParameters const& params,
                       SimulationObserver* observer)
    : mParams(validated(params))
    , mObserver(observer)
    , mNodeIDs(mParams.getValidatorIDs())
{
    reset();
}

NodeState&
Simulation::getNode(NodeID const& id)
{
    auto it = mNodes.find(id);
    if (it == mNodes.end())
    {
        throw std::out_of_range(
            fmt::format(FMT_STRING("unknown validator '{}'"), id));
    }
    return *it->second;
}

NodeState const&
Simulation::getNode(NodeID const& id) const
{
    auto it = mNodes.find(id);
    if (it == mNodes.end())
    {
        throw std::out_of_range(
            fmt::format(FMT_STRING("unknown validator '{}'"), id));
    }
    return *it->second;
}

void
Simulation::reset()
{
    mNodes.clear();
    for (auto const& id : mNodeIDs)
    {
        mNodes.emplace(id, std::make_unique<NodeState>(id));
    }
    mPhase = RoundPhase::IDLE;
    mView = 0;
    mResult = RunResult{};
}

void
Simulation::advanceTo(RoundPhase phase)
{
    if (phase <= mPhase)
    {
        throw std::logic_error(
            fmt::format(FMT_STRING("cannot move from phase {} back to {}"),
                        phaseName(mPhase), phaseName(phase)));
    }
    CLOG_DEBUG(Simulation, "phase {} -> {}", phaseName(mPhase),
               phaseName(phase));
    mPhase = phase;
}

SimulationEvent
Simulation::makeEvent(SimulationEvent::Kind kind) const
{
    return SimulationEvent(kind, mPhase, mView);
}

void
Simulation::emit(SimulationEvent const& event)
{
    mResult.mEvents.emplace_back(event);
    if (mObserver)
    {
        mObserver->eventEmitted(mResult.mEvents.back());
    }
}

void
Simulation::recordFailure(std::string const& message)
{
    auto ev = makeEvent(SimulationEvent::ROUND_FAILED);
    ev.mMessage = message;
    mResult.mEvents.emplace_back(ev);
    mResult.mStatus = RunResult::FAILED;
    if (mObserver)
    {
        // the failure is already in the result; a second observer failure
        // is only logged
        try
        {
            mObserver->eventEmitted(mResult.mEvents.back());
        }
        catch (std::exception const& e)
        {
            CLOG_ERROR(Simulation, "Observer failed on {}: {}",
                       SimulationEvent::kindName(SimulationEvent::ROUND_FAILED),
                       e.what());
        }
    }
}

RunResult
Simulation::run()
{
    std::unique_ptr<Scenario> scenario;
    try
    {
        scenario = Scenario::forAttack(mParams);
    }
    catch (std::exception const& e)
    {
        reset();
        CLOG_ERROR(Simulation, "Could not build scenario: {}", e.what());
        recordFailure(e.what());
        return mResult;
    }

    if (!scenario)
    {
        reset();
        auto name = attackTypeName(mParams.mAttack);
        CLOG_WARNING(Simulation, "No round script for attack '{}'", name);
        mResult.mStatus = RunResult::NOT_IMPLEMENTED;
        try
        {
            auto ev = makeEvent(SimulationEvent::NOT_IMPLEMENTED);
            ev.mMessage = fmt::format(
                FMT_STRING("Attack '{}' is not implemented; no round was "
                           "run. Try the equivocation attack."),
                name);
            emit(ev);
        }
        catch (std::exception const& e)
        {
            CLOG_ERROR(Simulation, "Reporting attack '{}' failed: {}", name,
                       e.what());
            recordFailure(fmt::format(
                FMT_STRING("Reporting attack '{}' failed: {}"), name,
                e.what()));
        }
        return mResult;
    }
    return run(*scenario);
}

RunResult
Simulation::run(Scenario const& scenario)
{
    reset();
    CLOG_INFO(Simulation, "Running '{}' with N={} f={} Q={}",
              scenario.getName(), mParams.mValidatorCount, mParams.mFaults,
              mParams.getQuorum());

    auto const& rounds = scenario.getRounds();
    for (size_t i = 0; i < rounds.size(); ++i)
    {
        auto const& round = rounds[i];
        try
        {
            if (i > 0)
            {
                runViewChange(round);
            }
            if (round.mKind == RoundSpec::ATTACK_ROUND)
            {
                runAttackRound(round);
            }
            else
            {
                runSafeRound(round);
            }
        }
        catch (std::exception const& e)
        {
            CLOG_ERROR(Simulation, "Round in view {} failed: {}", round.mView,
                       e.what());
            recordFailure(fmt::format(FMT_STRING("Round in view {} failed: {}"),
                                      round.mView, e.what()));
            return mResult;
        }
    }

    try
    {
        reportCommits();
        advanceTo(RoundPhase::COMPLETE);
        auto done = makeEvent(SimulationEvent::RUN_COMPLETE);
        done.mMessage = "Simulation complete.";
        emit(done);
    }
    catch (std::exception const& e)
    {
        CLOG_ERROR(Simulation, "Final report in phase {} failed: {}",
                   phaseName(mPhase), e.what());
        recordFailure(fmt::format(FMT_STRING("Final report in phase {} "
                                             "failed: {}"),
                                  phaseName(mPhase), e.what()));
    }
    return mResult;
}

void
Simulation::deliver(Vote const& vote)
{
    for (auto const& id : mNodeIDs)
    {
        auto& node = *mNodes[id];
        auto before = node.getEvidence().size();
        node.recordVote(vote);
        // evidence is never retracted
        releaseAssertOrThrow(node.getEvidence().size() >= before);
    }
}

void
Simulation::dispatchProposals(RoundSpec const& round)
{
    for (auto const& d : round.mDispatches)
    {
        CLOG_INFO(Simulation, "{} (leader) sends {} to {}", round.mLeader,
                  d.mProposal.getIdentity(), idsToStr(d.mRecipients));
        auto ev = makeEvent(SimulationEvent::PROPOSAL_DISPATCHED);
        ev.mNode = round.mLeader;
        ev.mProposal = d.mProposal;
        ev.mNodes = d.mRecipients;
        emit(ev);
    }
}

void
Simulation::castVotes(RoundSpec const& round)
{
    for (auto const& d : round.mDispatches)
    {
        for (auto const& voter : d.mRecipients)
        {
            if (mNodes.find(voter) == mNodes.end())
            {
                throw std::invalid_argument(fmt::format(
                    FMT_STRING("recipient '{}' is not a validator"), voter));
            }
            auto vote = Vote::castBy(voter, d.mProposal);
            deliver(vote);
            CLOG_DEBUG(Simulation, "{} voted for {}", voter,
                       d.mProposal.getIdentity());

            auto ev = makeEvent(SimulationEvent::VOTE_CAST);
            ev.mNode = voter;
            ev.mProposal = d.mProposal;
            ev.mSignature = vote.mSignature;
            emit(ev);
        }
    }
}

std::vector<std::string>
Simulation::formQCs(RoundSpec const& round, bool commit)
{
    std::vector<std::string> formed;
    auto quorum = mParams.getQuorum();

    for (auto const& d : round.mDispatches)
    {
        auto pid = d.mProposal.getIdentity();
        QuorumCertificatePtr first;
        std::vector<NodeID> committers;

        for (auto const& id : mNodeIDs)
        {
            auto& node = *mNodes[id];
            auto qc = node.tryFormQC(d.mProposal, quorum);
            if (!qc)
            {
                continue;
            }
            if (!first)
            {
                first = qc;
            }
            if (commit && node.applyQCCommit(*qc))
            {
                committers.emplace_back(id);
            }
        }

        auto ev = makeEvent(SimulationEvent::QC_OUTCOME);
        ev.mProposal = d.mProposal;
        ev.mCount = mNodes.begin()->second->getVotes(pid).size();
        ev.mQuorumReached = static_cast<bool>(first);
        if (first)
        {
            ev.mNodes = first->mVoters;
            formed.emplace_back(pid);
            mResult.mFormedQCs.emplace_back(first);
        }
        emit(ev);

        if (commit)
        {
            if (!committers.empty())
            {
                CLOG_INFO(Simulation, "QC formed for {}, {} node(s) commit {}",
                          pid, committers.size(), d.mProposal.getBlockID());
                auto c = makeEvent(SimulationEvent::COMMIT_APPLIED);
                c.mProposal = d.mProposal;
                c.mNodes = committers;
                emit(c);
            }
            else if (!first)
            {
                CLOG_ERROR(Simulation, "No QC formed for {} (unexpected)",
                           pid);
            }
        }
    }
    return formed;
}

void
Simulation::runAttackRound(RoundSpec const& round)
{
    mView = round.mView;
    advanceTo(RoundPhase::PROPOSAL);
    CLOG_INFO(Simulation, "View {}: leader is {}", mView, round.mLeader);
    auto leader = makeEvent(SimulationEvent::LEADER_ANNOUNCED);
    leader.mNode = round.mLeader;
    emit(leader);
    dispatchProposals(round);

    advanceTo(RoundPhase::VOTING);
    castVotes(round);

    advanceTo(RoundPhase::QC_FORMATION);
    auto formed = formQCs(round, false);
    if (formed.empty())
    {
        // the split worked as quorum math says it should
        CLOG_INFO(Simulation,
                  "No QC formed in view {} (no side reached quorum {}). "
                  "Safety preserved.",
                  mView, mParams.getQuorum());
    }
    else
    {
        mResult.mUnexpectedQC = true;
        auto ev = makeEvent(SimulationEvent::SAFETY_WARNING);
        ev.mNodes = {round.mLeader};
        if (formed.size() > 1)
        {
            mResult.mSafetyViolated = true;
            ev.mMessage = fmt::format(
                FMT_STRING("SAFETY VIOLATION: conflicting QCs formed in view "
                           "{} for {}; quorum {} is too small for N={}"),
                mView, fmt::join(formed, " and "), mParams.getQuorum(),
                mParams.mValidatorCount);
            CLOG_ERROR(Simulation, "{}", ev.mMessage);
        }
        else
        {
            ev.mMessage = fmt::format(
                FMT_STRING("Unexpected QC formed in view {} for {}; check the "
                           "quorum threshold against the split"),
                mView, formed.front());
            CLOG_WARNING(Simulation, "{}", ev.mMessage);
        }
        emit(ev);
    }

    advanceTo(RoundPhase::EVIDENCE_REPORT);
    std::unordered_set<EquivocationEvidence> all;
    for (auto const& kv : mNodes)
    {
        auto const& ev = kv.second->getEvidence();
        all.insert(ev.begin(), ev.end());
    }
    std::vector<EquivocationEvidence> evidence(all.begin(), all.end());
    std::sort(evidence.begin(), evidence.end());
    for (auto const& e : evidence)
    {
        CLOG_WARNING(Simulation, "Evidence: {}", e.toString());
    }
    mResult.mEvidence.insert(mResult.mEvidence.end(), evidence.begin(),
                             evidence.end());

    auto report = makeEvent(SimulationEvent::EVIDENCE_REPORT);
    report.mEvidence = evidence;
    emit(report);
}

void
Simulation::runViewChange(RoundSpec const& next)
{
    advanceTo(RoundPhase::VIEW_CHANGE);
    mView = next.mView;
    CLOG_INFO(Simulation, "View change -> view {}, leader {}", mView,
              next.mLeader);
    auto ev = makeEvent(SimulationEvent::VIEW_CHANGE);
    ev.mNode = next.mLeader;
    emit(ev);
}

void
Simulation::runSafeRound(RoundSpec const& round)
{
    mView = round.mView;
    advanceTo(RoundPhase::SAFE_ROUND);
    dispatchProposals(round);
    castVotes(round);

    advanceTo(RoundPhase::COMMIT);
    formQCs(round, true);
}

void
Simulation::reportCommits()
{
    for (auto const& id : mNodeIDs)
    {
        mResult.mCommitLogs[id] = mNodes[id]->getCommitted();
    }
    auto ev = makeEvent(SimulationEvent::COMMIT_SNAPSHOT);
    ev.mCommitLogs = mResult.mCommitLogs;
    emit(ev);
}

Json::Value
Simulation::getJsonInfo() const
{
    Json::Value ret;
    ret["validators"] = static_cast<Json::UInt>(mParams.mValidatorCount);
    ret["faults"] = static_cast<Json::UInt>(mParams.mFaults);
    ret["quorum"] = static_cast<Json::UInt>(mParams.getQuorum());
    ret["attack"] = attackTypeName(mParams.mAttack);
    ret["phase"] = phaseName(mPhase);
    ret["view"] = static_cast<Json::UInt>(mView);
    if (mParams.mFaultyLeader)
    {
        ret["faulty_leader"] = *mParams.mFaultyLeader;
    }
    auto& nodes = ret["nodes"];
    for (auto const& id : mNodeIDs)
    {
        nodes.append(mNodes.at(id)->getJsonInfo());
    }
    return ret;
}
}
