#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/types.h"

namespace hotbft
{

// largest f such that n >= 3f+1
uint32 maxFaultsFor(uint32 validatorCount);

// 2f+1
uint32 quorumThresholdFor(uint32 faults);

// Checks validator count, fault bound and quorum threshold against each
// other; on failure returns false and points errString at the reason.
bool isQuorumConfigSane(uint32 validatorCount, uint32 faults, uint32 quorum,
                        char const*& errString);
}
