#pragma once

// Copyright 2018 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/Config.h"
#include "simulation/Simulation.h"
#include <iosfwd>

namespace hotbft
{

// process exit code for a run outcome
int exitCodeFor(RunResult::Status status);

// Validates `cfg`, runs the configured scenario and presents it on `out`.
// Throws std::invalid_argument on a configuration error.
int runSimulation(Config const& cfg, bool json, std::ostream& out);

// Writes validator IDs, faulty leader and ring edges as JSON.
void printTopology(Config const& cfg, std::ostream& out);
}
