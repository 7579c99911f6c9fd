// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "simulation/SimulationEvent.h"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <json/json.h>

namespace hotbft
{

char const*
phaseName(RoundPhase phase)
{
    switch (phase)
    {
    case RoundPhase::IDLE:
        return "IDLE";
    case RoundPhase::PROPOSAL:
        return "PROPOSAL";
    case RoundPhase::VOTING:
        return "VOTING";
    case RoundPhase::QC_FORMATION:
        return "QC_FORMATION";
    case RoundPhase::EVIDENCE_REPORT:
        return "EVIDENCE_REPORT";
    case RoundPhase::VIEW_CHANGE:
        return "VIEW_CHANGE";
    case RoundPhase::SAFE_ROUND:
        return "SAFE_ROUND";
    case RoundPhase::COMMIT:
        return "COMMIT";
    case RoundPhase::COMPLETE:
        return "COMPLETE";
    }
    return "UNKNOWN";
}

SimulationEvent::SimulationEvent(Kind kind, RoundPhase phase, ViewNumber view)
    : mKind(kind), mPhase(phase), mView(view)
{
}

char const*
SimulationEvent::kindName(Kind kind)
{
    switch (kind)
    {
    case LEADER_ANNOUNCED:
        return "LEADER_ANNOUNCED";
    case PROPOSAL_DISPATCHED:
        return "PROPOSAL_DISPATCHED";
    case VOTE_CAST:
        return "VOTE_CAST";
    case QC_OUTCOME:
        return "QC_OUTCOME";
    case SAFETY_WARNING:
        return "SAFETY_WARNING";
    case EVIDENCE_REPORT:
        return "EVIDENCE_REPORT";
    case VIEW_CHANGE:
        return "VIEW_CHANGE";
    case COMMIT_APPLIED:
        return "COMMIT_APPLIED";
    case COMMIT_SNAPSHOT:
        return "COMMIT_SNAPSHOT";
    case NOT_IMPLEMENTED:
        return "NOT_IMPLEMENTED";
    case ROUND_FAILED:
        return "ROUND_FAILED";
    case RUN_COMPLETE:
        return "RUN_COMPLETE";
    }
    return "UNKNOWN";
}

bool
SimulationEvent::isWarning() const
{
    return mKind == SAFETY_WARNING || mKind == ROUND_FAILED ||
           (mKind == EVIDENCE_REPORT && !mEvidence.empty());
}

std::string
SimulationEvent::toString() const
{
    auto pid = mProposal ? mProposal->getIdentity() : std::string("-");
    switch (mKind)
    {
    case LEADER_ANNOUNCED:
        return fmt::format(FMT_STRING("View {}: leader is {}"), mView, mNode);
    case PROPOSAL_DISPATCHED:
        return fmt::format(FMT_STRING("{} (leader) sends {} to {}"), mNode,
                           pid, idsToStr(mNodes));
    case VOTE_CAST:
        return fmt::format(FMT_STRING("{} voted for {} {}"), mNode, pid,
                           mSignature);
    case QC_OUTCOME:
        if (mQuorumReached)
        {
            return fmt::format(
                FMT_STRING("QC formed for {} ({} vote(s)), voters {}"), pid,
                mCount, idsToStr(mNodes));
        }
        return fmt::format(FMT_STRING("No QC formed for {} ({} vote(s))"),
                           pid, mCount);
    case SAFETY_WARNING:
    case NOT_IMPLEMENTED:
    case ROUND_FAILED:
    case RUN_COMPLETE:
        return mMessage;
    case EVIDENCE_REPORT:
    {
        if (mEvidence.empty())
        {
            return "No equivocation evidence found.";
        }
        std::vector<std::string> lines;
        for (auto const& e : mEvidence)
        {
            lines.emplace_back(" - " + e.toString());
        }
        return fmt::format(
            FMT_STRING("Equivocation evidence detected across nodes:\n{}"),
            fmt::join(lines, "\n"));
    }
    case VIEW_CHANGE:
        return fmt::format(
            FMT_STRING("Triggering view-change -> new view {}, new leader {}"),
            mView, mNode);
    case COMMIT_APPLIED:
        return fmt::format(FMT_STRING("{} node(s) commit {}: {}"),
                           mNodes.size(),
                           mProposal ? mProposal->getBlockID() : "-",
                           idsToStr(mNodes));
    case COMMIT_SNAPSHOT:
    {
        std::vector<std::string> lines;
        for (auto const& kv : mCommitLogs)
        {
            lines.emplace_back(fmt::format(FMT_STRING(" {}: [{}]"), kv.first,
                                           fmt::join(kv.second, ", ")));
        }
        return fmt::format(FMT_STRING("Final committed blocks per node:\n{}"),
                           fmt::join(lines, "\n"));
    }
    }
    return mMessage;
}

Json::Value
SimulationEvent::toJson() const
{
    Json::Value ret;
    ret["kind"] = kindName(mKind);
    ret["phase"] = phaseName(mPhase);
    ret["view"] = static_cast<Json::UInt>(mView);
    if (!mNode.empty())
    {
        ret["node"] = mNode;
    }
    if (mProposal)
    {
        ret["proposal"] = mProposal->toJson();
    }
    if (!mNodes.empty())
    {
        auto& nodes = ret["nodes"];
        for (auto const& n : mNodes)
        {
            nodes.append(n);
        }
    }
    if (!mSignature.empty())
    {
        ret["signature"] = mSignature;
    }
    if (mKind == QC_OUTCOME)
    {
        ret["quorum_reached"] = mQuorumReached;
        ret["count"] = static_cast<Json::UInt64>(mCount);
    }
    if (mKind == EVIDENCE_REPORT)
    {
        auto& evidence = ret["evidence"];
        evidence = Json::arrayValue;
        for (auto const& e : mEvidence)
        {
            evidence.append(e.toJson());
        }
    }
    if (mKind == COMMIT_SNAPSHOT)
    {
        auto& logs = ret["commits"];
        logs = Json::objectValue;
        for (auto const& kv : mCommitLogs)
        {
            auto& entry = logs[kv.first];
            entry = Json::arrayValue;
            for (auto const& b : kv.second)
            {
                entry.append(b);
            }
        }
    }
    if (!mMessage.empty())
    {
        ret["message"] = mMessage;
    }
    return ret;
}
}
