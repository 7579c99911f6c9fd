#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/types.h"
#include <optional>
#include <string>
#include <vector>

namespace hotbft
{

enum class AttackType
{
    EQUIVOCATION,  // leader splits the validators between two proposals
    WITHHOLD_QC,   // not implemented
    DROP_MESSAGES  // not implemented
};

std::string attackTypeName(AttackType attack);

// accepts "equivocation", "withhold-qc", "drop-messages" (any case);
// throws std::invalid_argument otherwise
AttackType attackTypeFromString(std::string const& name);

/**
 * Inputs to one simulated run. Validators are named by makeValidatorIDs,
 * the quorum defaults to 2f+1.
 */
struct SimulationParameters
{
    static uint32 const MIN_VALIDATORS;
    static uint32 const MAX_VALIDATORS;

    uint32 mValidatorCount{7};
    uint32 mFaults{2};
    std::optional<uint32> mQuorumOverride;

    // nullopt when no leader is designated faulty; the first validator
    // then leads the attack round
    std::optional<NodeID> mFaultyLeader{NodeID("A")};
    AttackType mAttack{AttackType::EQUIVOCATION};

    // validators that sign both conflicting proposals of the attack round
    std::vector<NodeID> mDoubleVoters;

    uint32 getQuorum() const;
    std::vector<NodeID> getValidatorIDs() const;

    // throws std::invalid_argument describing the first problem found
    void validate() const;

    // default f for n validators: max(1, min(2, floor((n-1)/3))), capped
    // at floor((n-1)/3)
    static uint32 defaultFaultsFor(uint32 validatorCount);
};
}
