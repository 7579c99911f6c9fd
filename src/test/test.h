#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "simulation/SimulationParameters.h"
#include "util/Logging.h"

namespace hotbft
{

int runTest(int argc, char* const* argv);

// validated parameters for an equivocation run with quorum 2f+1
SimulationParameters getTestParameters(uint32 validatorCount = 7,
                                       uint32 faults = 2);
}
