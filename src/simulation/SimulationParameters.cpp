// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "simulation/SimulationParameters.h"
#include "hotstuff/QuorumUtils.h"
#include "hotstuff/Signing.h"
#include <algorithm>
#include <fmt/format.h>
#include <stdexcept>

namespace hotbft
{

uint32 const SimulationParameters::MIN_VALIDATORS = 4;
uint32 const SimulationParameters::MAX_VALIDATORS = 13;

std::string
attackTypeName(AttackType attack)
{
    switch (attack)
    {
    case AttackType::EQUIVOCATION:
        return "equivocation";
    case AttackType::WITHHOLD_QC:
        return "withhold-qc";
    case AttackType::DROP_MESSAGES:
        return "drop-messages";
    }
    throw std::invalid_argument("unknown attack type");
}

AttackType
attackTypeFromString(std::string const& name)
{
    for (auto a : {AttackType::EQUIVOCATION, AttackType::WITHHOLD_QC,
                   AttackType::DROP_MESSAGES})
    {
        if (iequals(name, attackTypeName(a)))
        {
            return a;
        }
    }
    throw std::invalid_argument(
        fmt::format(FMT_STRING("unknown attack type '{}'"), name));
}

uint32
SimulationParameters::getQuorum() const
{
    return mQuorumOverride ? *mQuorumOverride : quorumThresholdFor(mFaults);
}

std::vector<NodeID>
SimulationParameters::getValidatorIDs() const
{
    return makeValidatorIDs(mValidatorCount);
}

void
SimulationParameters::validate() const
{
    if (mValidatorCount < MIN_VALIDATORS || mValidatorCount > MAX_VALIDATORS)
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("validator count {} not in [{}, {}]"),
                        mValidatorCount, MIN_VALIDATORS, MAX_VALIDATORS));
    }

    char const* errString = nullptr;
    if (!isQuorumConfigSane(mValidatorCount, mFaults, getQuorum(), errString))
    {
        throw std::invalid_argument(fmt::format(
            FMT_STRING("invalid quorum configuration (N={}, f={}, Q={}): {}"),
            mValidatorCount, mFaults, getQuorum(), errString));
    }

    auto ids = getValidatorIDs();
    auto isValidator = [&](NodeID const& id) {
        return std::find(ids.begin(), ids.end(), id) != ids.end();
    };
    if (mFaultyLeader && !isValidator(*mFaultyLeader))
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("faulty leader '{}' is not a validator"),
                        *mFaultyLeader));
    }
    for (auto const& v : mDoubleVoters)
    {
        if (!isValidator(v))
        {
            throw std::invalid_argument(fmt::format(
                FMT_STRING("double voter '{}' is not a validator"), v));
        }
    }
}

uint32
SimulationParameters::defaultFaultsFor(uint32 validatorCount)
{
    uint32 maxF = maxFaultsFor(validatorCount);
    return std::min(std::max<uint32>(1, std::min<uint32>(2, maxF)), maxF);
}
}
