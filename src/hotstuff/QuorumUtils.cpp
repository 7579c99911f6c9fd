// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "hotstuff/QuorumUtils.h"

namespace hotbft
{

uint32
maxFaultsFor(uint32 validatorCount)
{
    if (validatorCount == 0)
    {
        return 0;
    }
    return (validatorCount - 1) / 3;
}

uint32
quorumThresholdFor(uint32 faults)
{
    return 2 * faults + 1;
}

bool
isQuorumConfigSane(uint32 validatorCount, uint32 faults, uint32 quorum,
                   char const*& errString)
{
    if (validatorCount < 1)
    {
        errString = "Validator count must be greater than 0";
        return false;
    }

    if (faults > maxFaultsFor(validatorCount))
    {
        errString = "Fault bound exceeds floor((N-1)/3)";
        return false;
    }

    if (quorum < 1)
    {
        errString = "Quorum threshold must be greater than 0";
        return false;
    }

    if (quorum > validatorCount)
    {
        errString = "Quorum threshold exceeds the number of validators";
        return false;
    }

    return true;
}
}
