#pragma once

// Copyright 2017 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

// Always include this file instead of catch2/catch.hpp in order to get access
// to Catch2.
// This is necessary for the StringMaker specializations to work properly
// without violating the one definition rule.
// Define any StringMaker specialzations here for pretty printing the custom
// types.

#include "hotstuff/EquivocationEvidence.h"
#include "hotstuff/Proposal.h"
#include "simulation/SimulationEvent.h"
#include <catch2/catch.hpp>

namespace Catch
{
template <> struct StringMaker<hotbft::Proposal>
{
    static std::string
    convert(hotbft::Proposal const& p)
    {
        return p.getIdentity();
    }
};

template <> struct StringMaker<hotbft::EquivocationEvidence>
{
    static std::string
    convert(hotbft::EquivocationEvidence const& e)
    {
        return e.toString();
    }
};

template <> struct StringMaker<hotbft::RoundPhase>
{
    static std::string
    convert(hotbft::RoundPhase const& phase)
    {
        return hotbft::phaseName(phase);
    }
};
} // namespace Catch
