// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/EventRenderer.h"
#include <fmt/format.h>
#include <json/json.h>
#include <ostream>
#include <thread>

namespace hotbft
{

EventRenderer::EventRenderer(std::ostream& out, bool json,
                             std::chrono::milliseconds stepDelay)
    : mOut(out), mJson(json), mStepDelay(stepDelay)
{
}

void
EventRenderer::eventEmitted(SimulationEvent const& event)
{
    if (mJson)
    {
        return;
    }

    if (event.mPhase != mLastPhase)
    {
        if (mStepDelay.count() > 0 && mLastPhase != RoundPhase::IDLE)
        {
            std::this_thread::sleep_for(mStepDelay);
        }
        mOut << fmt::format(FMT_STRING("-- {} --"), phaseName(event.mPhase))
             << std::endl;
        mLastPhase = event.mPhase;
    }

    mOut << (event.isWarning() ? "!! " : "   ") << event.toString()
         << std::endl;
}

void
EventRenderer::finish(RunResult const& result)
{
    if (mJson)
    {
        mOut << result.toJson().toStyledString() << std::endl;
        return;
    }
    mOut << fmt::format(FMT_STRING("Result: {}"),
                        RunResult::statusName(result.mStatus))
         << std::endl;
}
}
