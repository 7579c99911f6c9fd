// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/Config.h"
#include "util/Logging.h"

#include <cpptoml.h>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <map>
#include <type_traits>

namespace hotbft
{

namespace fs = std::filesystem;

uint32 const Config::MIN_STEP_DELAY_MS = 300;
uint32 const Config::MAX_STEP_DELAY_MS = 2000;
std::string const Config::STDIN_SPECIAL_NAME = "-";

Config::Config()
{
    // fill in defaults
    VALIDATOR_COUNT = 7;
    FAULTY_LEADER = NodeID("A");
    ATTACK_TYPE = AttackType::EQUIVOCATION;
    STEP_DELAY_MS = 900;
    AUTO_PLAY = true;

    LOG_FILE_PATH = "";
    LOG_COLOR = false;
}

namespace
{

using ConfigItem = std::pair<std::string, std::shared_ptr<cpptoml::base>>;

bool
readBool(ConfigItem const& item)
{
    if (!item.second->as<bool>())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("invalid '{}'"), item.first));
    }
    return item.second->as<bool>()->get();
}

std::string
readString(ConfigItem const& item)
{
    if (!item.second->as<std::string>())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("invalid '{}'"), item.first));
    }
    return item.second->as<std::string>()->get();
}

template <typename T>
std::vector<T>
readArray(ConfigItem const& item)
{
    auto result = std::vector<T>{};
    if (!item.second->is_array())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("'{}' must be an array"), item.first));
    }
    for (auto v : item.second->as_array()->get())
    {
        if (!v->as<T>())
        {
            throw std::invalid_argument(
                fmt::format(FMT_STRING("invalid element of '{}'"), item.first));
        }
        result.push_back(v->as<T>()->get());
    }
    return result;
}

template <typename T>
std::enable_if_t<std::is_unsigned_v<T>, T>
castInt(int64_t v, std::string const& name, T min, T max)
{
    if (v < 0 || static_cast<uint64_t>(v) < min ||
        static_cast<uint64_t>(v) > max)
    {
        throw std::invalid_argument(fmt::format(FMT_STRING("bad '{}'"), name));
    }
    return static_cast<T>(v);
}

template <typename T>
T
readInt(ConfigItem const& item, T min = std::numeric_limits<T>::min(),
        T max = std::numeric_limits<T>::max())
{
    if (!item.second->as<int64_t>())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("invalid '{}'"), item.first));
    }
    return castInt<T>(item.second->as<int64_t>()->get(), item.first, min, max);
}
}

std::optional<NodeID>
Config::parseFaultyLeader(std::string const& value)
{
    if (value.empty())
    {
        throw std::invalid_argument("FAULTY_LEADER must not be empty");
    }
    if (iequals(value, "none"))
    {
        return std::nullopt;
    }
    return value;
}

void
Config::load(std::string const& filename)
{
    if (filename != Config::STDIN_SPECIAL_NAME && !fs::exists(filename))
    {
        std::string s;
        s = "No config file ";
        s += filename + " found";
        throw std::invalid_argument(s);
    }

    CLOG_DEBUG(Config, "Loading config from: {}", filename);
    try
    {
        if (filename == Config::STDIN_SPECIAL_NAME)
        {
            load(std::cin);
        }
        else
        {
            std::ifstream ifs(filename);
            if (!ifs)
            {
                throw std::runtime_error(fmt::format(
                    FMT_STRING("Error opening file '{}'"), filename));
            }
            ifs.exceptions(std::ios::badbit);
            load(ifs);
        }
    }
    catch (std::exception const& ex)
    {
        std::string err("Failed to parse '");
        err += filename;
        err += "' :";
        err += ex.what();
        throw std::invalid_argument(err);
    }
}

void
Config::load(std::istream& in)
{
    std::shared_ptr<cpptoml::table> t;
    cpptoml::parser p(in);
    t = p.parse();
    processConfig(t);
}

void
Config::processConfig(std::shared_ptr<cpptoml::table> t)
{
    if (!t)
    {
        throw std::runtime_error("Could not parse toml");
    }

    for (auto& item : *t)
    {
        CLOG_DEBUG(Config, "Config item: {}", item.first);

        std::map<std::string, std::function<void()>> confProcessor = {
            {"VALIDATOR_COUNT",
             [&]() {
                 VALIDATOR_COUNT = readInt<uint32>(
                     item, SimulationParameters::MIN_VALIDATORS,
                     SimulationParameters::MAX_VALIDATORS);
             }},
            {"FAILURE_SAFETY",
             [&]() { FAILURE_SAFETY = readInt<uint32>(item); }},
            {"QUORUM_THRESHOLD",
             [&]() { QUORUM_THRESHOLD = readInt<uint32>(item, 1); }},
            {"FAULTY_LEADER",
             [&]() { FAULTY_LEADER = parseFaultyLeader(readString(item)); }},
            {"ATTACK_TYPE",
             [&]() { ATTACK_TYPE = attackTypeFromString(readString(item)); }},
            {"DOUBLE_VOTERS",
             [&]() { DOUBLE_VOTERS = readArray<std::string>(item); }},
            {"STEP_DELAY_MS",
             [&]() {
                 STEP_DELAY_MS = readInt<uint32>(item, MIN_STEP_DELAY_MS,
                                                 MAX_STEP_DELAY_MS);
             }},
            {"AUTO_PLAY", [&]() { AUTO_PLAY = readBool(item); }},
            {"LOG_FILE_PATH", [&]() { LOG_FILE_PATH = readString(item); }},
            {"LOG_COLOR", [&]() { LOG_COLOR = readBool(item); }}};

        auto it = confProcessor.find(item.first);
        if (it != confProcessor.end())
        {
            it->second();
        }
        else
        {
            std::string err("Unknown configuration entry: '");
            err += item.first;
            err += "'";
            throw std::invalid_argument(err);
        }
    }
}

SimulationParameters
Config::toSimulationParameters() const
{
    SimulationParameters params;
    params.mValidatorCount = VALIDATOR_COUNT;
    params.mFaults = FAILURE_SAFETY
                         ? *FAILURE_SAFETY
                         : SimulationParameters::defaultFaultsFor(
                               VALIDATOR_COUNT);
    params.mQuorumOverride = QUORUM_THRESHOLD;
    params.mFaultyLeader = FAULTY_LEADER;
    params.mAttack = ATTACK_TYPE;
    params.mDoubleVoters = DOUBLE_VOTERS;
    return params;
}

void
Config::validate() const
{
    if (STEP_DELAY_MS < MIN_STEP_DELAY_MS || STEP_DELAY_MS > MAX_STEP_DELAY_MS)
    {
        throw std::invalid_argument(fmt::format(
            FMT_STRING("STEP_DELAY_MS must be in [{}, {}], got {}"),
            MIN_STEP_DELAY_MS, MAX_STEP_DELAY_MS, STEP_DELAY_MS));
    }
    toSimulationParameters().validate();
}
}
