// Copyright 2018 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/ApplicationUtils.h"
#include "main/EventRenderer.h"
#include "simulation/Topologies.h"
#include "util/Logging.h"
#include <json/json.h>
#include <ostream>

namespace hotbft
{

int
exitCodeFor(RunResult::Status status)
{
    switch (status)
    {
    case RunResult::COMPLETED:
        return 0;
    case RunResult::NOT_IMPLEMENTED:
        return 2;
    case RunResult::FAILED:
        return 1;
    }
    return 1;
}

int
runSimulation(Config const& cfg, bool json, std::ostream& out)
{
    cfg.validate();
    auto params = cfg.toSimulationParameters();

    std::chrono::milliseconds delay{0};
    if (cfg.AUTO_PLAY && !json)
    {
        delay = std::chrono::milliseconds(cfg.STEP_DELAY_MS);
    }

    EventRenderer renderer(out, json, delay);
    Simulation simulation(params, &renderer);
    auto result = simulation.run();
    renderer.finish(result);

    LOG_INFO(DEFAULT_LOG, "Run finished: {}",
             RunResult::statusName(result.mStatus));
    if (result.mSafetyViolated)
    {
        LOG_ERROR(DEFAULT_LOG, "Conflicting QCs formed in a single view");
    }
    return exitCodeFor(result.mStatus);
}

void
printTopology(Config const& cfg, std::ostream& out)
{
    cfg.validate();
    auto params = cfg.toSimulationParameters();
    out << Topologies::toJson(params.getValidatorIDs(), params.mFaultyLeader)
               .toStyledString()
        << std::endl;
}
}
