#pragma once
// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "simulation/SimulationParameters.h"
#include "util/types.h"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cpptoml
{
class table;
}

namespace hotbft
{

class Config
{
    void processConfig(std::shared_ptr<cpptoml::table> t);

  public:
    static uint32 const MIN_STEP_DELAY_MS;
    static uint32 const MAX_STEP_DELAY_MS;

    // reading this file name reads the configuration from stdin
    static std::string const STDIN_SPECIAL_NAME;

    // number of validators, MIN_VALIDATORS..MAX_VALIDATORS
    uint32 VALIDATOR_COUNT;

    // f; when unset, SimulationParameters::defaultFaultsFor(VALIDATOR_COUNT)
    std::optional<uint32> FAILURE_SAFETY;

    // Q; when unset, 2f+1
    std::optional<uint32> QUORUM_THRESHOLD;

    // leader of the attack round, nullopt for "none"
    std::optional<NodeID> FAULTY_LEADER;

    AttackType ATTACK_TYPE;

    // validators that vote for both conflicting proposals
    std::vector<NodeID> DOUBLE_VOTERS;

    // pacing between phases when presenting a run; never read by the
    // protocol
    uint32 STEP_DELAY_MS;
    bool AUTO_PLAY;

    // logging
    std::string LOG_FILE_PATH; // empty: log to stderr only
    bool LOG_COLOR;

    Config();

    void load(std::string const& filename);
    void load(std::istream& in);

    // "none" (any case) maps to nullopt
    static std::optional<NodeID> parseFaultyLeader(std::string const& value);

    SimulationParameters toSimulationParameters() const;

    // throws std::invalid_argument describing the first problem found
    void validate() const;
};
}
