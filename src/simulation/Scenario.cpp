// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "simulation/Scenario.h"
#include <algorithm>
#include <fmt/format.h>
#include <stdexcept>

namespace hotbft
{

BlockID const Scenario::GENESIS = "GENESIS";

Scenario::Scenario(std::string const& name,
                   std::vector<RoundSpec> const& rounds)
    : mName(name), mRounds(rounds)
{
    if (mRounds.empty())
    {
        throw std::invalid_argument("scenario needs at least one round");
    }

    bool seenAttack = false;
    bool seenSafe = false;
    ViewNumber lastView = 0;
    for (auto const& r : mRounds)
    {
        if (r.mView <= lastView)
        {
            throw std::invalid_argument(
                fmt::format(FMT_STRING("round view {} does not follow view {}"),
                            r.mView, lastView));
        }
        lastView = r.mView;

        if (r.mKind == RoundSpec::ATTACK_ROUND)
        {
            if (seenAttack || seenSafe)
            {
                throw std::invalid_argument(
                    "attack round must come first and only once");
            }
            seenAttack = true;
        }
        else
        {
            if (seenSafe)
            {
                throw std::invalid_argument("only one safe round per run");
            }
            seenSafe = true;
        }

        if (r.mDispatches.empty())
        {
            throw std::invalid_argument(fmt::format(
                FMT_STRING("round in view {} proposes nothing"), r.mView));
        }
        for (auto const& d : r.mDispatches)
        {
            if (d.mProposal.getView() != r.mView ||
                d.mProposal.getProposer() != r.mLeader)
            {
                throw std::invalid_argument(fmt::format(
                    FMT_STRING("proposal {} does not belong to the round of "
                               "{} in view {}"),
                    d.mProposal.getIdentity(), r.mLeader, r.mView));
            }
        }
    }
}

NodeID
Scenario::nextLeader(std::vector<NodeID> const& ids, NodeID const& leader)
{
    auto it = std::find(ids.begin(), ids.end(), leader);
    if (it == ids.end())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("'{}' is not a validator"), leader));
    }
    auto idx = static_cast<size_t>(std::distance(ids.begin(), it));
    return ids[(idx + 1) % ids.size()];
}

Scenario
Scenario::equivocation(SimulationParameters const& params)
{
    auto ids = params.getValidatorIDs();
    ViewNumber view = 1;

    auto leader = params.mFaultyLeader ? *params.mFaultyLeader : ids.front();

    Proposal propX("X", GENESIS, view, leader);
    Proposal propY("Y", GENESIS, view, leader);

    auto half = ids.size() / 2;
    std::vector<NodeID> targetsX(ids.begin(), ids.begin() + half);
    std::vector<NodeID> targetsY(ids.begin() + half, ids.end());

    // double voters are shown the proposal of the other half as well
    for (auto const& v : params.mDoubleVoters)
    {
        if (std::find(targetsX.begin(), targetsX.end(), v) == targetsX.end())
        {
            targetsX.emplace_back(v);
        }
        else if (std::find(targetsY.begin(), targetsY.end(), v) ==
                 targetsY.end())
        {
            targetsY.emplace_back(v);
        }
    }

    RoundSpec attack{RoundSpec::ATTACK_ROUND,
                     view,
                     leader,
                     {{propX, targetsX}, {propY, targetsY}}};

    // no chain state is tracked, so the recovery block extends genesis too
    auto safeLeader = nextLeader(ids, leader);
    Proposal propZ("Z", GENESIS, view + 1, safeLeader);
    RoundSpec safe{RoundSpec::SAFE_ROUND, view + 1, safeLeader, {{propZ, ids}}};

    return Scenario(attackTypeName(AttackType::EQUIVOCATION), {attack, safe});
}

std::unique_ptr<Scenario>
Scenario::forAttack(SimulationParameters const& params)
{
    switch (params.mAttack)
    {
    case AttackType::EQUIVOCATION:
        return std::make_unique<Scenario>(equivocation(params));
    case AttackType::WITHHOLD_QC:
    case AttackType::DROP_MESSAGES:
        return nullptr;
    }
    return nullptr;
}
}
