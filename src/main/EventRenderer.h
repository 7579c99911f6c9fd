#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "simulation/Simulation.h"
#include <chrono>
#include <iosfwd>

namespace hotbft
{

/**
 * Presents a run as it happens. In text mode each event is written on its
 * own line as it is emitted, waiting `stepDelay` whenever the round moves
 * to a new phase. In JSON mode nothing is written until finish(), which
 * dumps the whole RunResult.
 */
class EventRenderer : public SimulationObserver
{
  public:
    EventRenderer(std::ostream& out, bool json,
                  std::chrono::milliseconds stepDelay);

    void eventEmitted(SimulationEvent const& event) override;

    void finish(RunResult const& result);

  private:
    std::ostream& mOut;
    bool const mJson;
    std::chrono::milliseconds const mStepDelay;
    RoundPhase mLastPhase{RoundPhase::IDLE};
};
}
