// Copyright 2018 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/CommandLine.h"
#include "main/ApplicationUtils.h"
#include "main/Config.h"
#include "util/Logging.h"
#include "util/types.h"

#include <algorithm>
#include <clara.hpp>
#include <fmt/format.h>
#include <functional>
#include <iostream>
#include <optional>

#ifndef HOTBFT_VERSION
#define HOTBFT_VERSION "unknown"
#endif

namespace hotbft
{

void
writeWithTextFlow(std::ostream& os, std::string const& text)
{
    size_t consoleWidth = CLARA_TEXTFLOW_CONFIG_CONSOLE_WIDTH;
    os << clara::TextFlow::Column(text).width(consoleWidth) << "\n\n";
}

namespace
{

class CommandLine
{
  public:
    struct ConfigOption
    {
        using Common = std::pair<std::string, bool>;
        static const std::vector<Common> COMMON_OPTIONS;

        LogLevel mLogLevel{LogLevel::LVL_INFO};
        std::string mConfigFile;

        Config getConfig() const;
    };

    class Command
    {
      public:
        using RunFunc = std::function<int(CommandLineArgs const& args)>;

        Command(std::string const& name, std::string const& description,
                RunFunc const& runFunc);
        int run(CommandLineArgs const& args) const;
        std::string name() const;
        std::string description() const;

      private:
        std::string mName;
        std::string mDescription;
        RunFunc mRunFunc;
    };

    explicit CommandLine(std::vector<Command> const& commands);

    using AdjustedCommandLine =
        std::pair<std::string, std::vector<std::string>>;
    AdjustedCommandLine adjustCommandLine(clara::detail::Args const& args);
    std::optional<Command> selectCommand(std::string const& commandName);
    void writeToStream(std::string const& exeName, std::ostream& os) const;

  private:
    std::vector<Command> mCommands;
};

const std::vector<std::pair<std::string, bool>>
    CommandLine::ConfigOption::COMMON_OPTIONS{
        {"--conf", true}, {"--ll", true}, {"--help", false}};

class ParserWithValidation
{
  public:
    ParserWithValidation(
        clara::Parser parser,
        std::function<std::string()> isValid = [] { return std::string{}; })
    {
        mParser = parser;
        mIsValid = isValid;
    }

    ParserWithValidation(
        clara::Opt opt,
        std::function<std::string()> isValid = [] { return std::string{}; })
    {
        mParser = clara::Parser{} | opt;
        mIsValid = isValid;
    }

    const clara::Parser&
    parser() const
    {
        return mParser;
    }

    std::string
    validate() const
    {
        return mIsValid();
    }

  private:
    clara::Parser mParser;
    std::function<std::string()> mIsValid;
};

// options that override the configuration file
struct RunOverrides
{
    std::optional<uint32> mValidators;
    std::optional<uint32> mFaults;
    std::optional<uint32> mQuorum;
    std::optional<std::string> mLeader;
    std::optional<std::string> mAttack;
    std::vector<std::string> mDoubleVoters;
    std::optional<uint32> mDelayMs;
    bool mNoPacing{false};

    void apply(Config& cfg) const;
};

void
RunOverrides::apply(Config& cfg) const
{
    if (mValidators)
    {
        cfg.VALIDATOR_COUNT = *mValidators;
    }
    if (mFaults)
    {
        cfg.FAILURE_SAFETY = mFaults;
    }
    if (mQuorum)
    {
        cfg.QUORUM_THRESHOLD = mQuorum;
    }
    if (mLeader)
    {
        cfg.FAULTY_LEADER = Config::parseFaultyLeader(*mLeader);
    }
    if (mAttack)
    {
        cfg.ATTACK_TYPE = attackTypeFromString(*mAttack);
    }
    if (!mDoubleVoters.empty())
    {
        cfg.DOUBLE_VOTERS = mDoubleVoters;
    }
    if (mDelayMs)
    {
        cfg.STEP_DELAY_MS = *mDelayMs;
    }
    if (mNoPacing)
    {
        cfg.AUTO_PLAY = false;
    }
}

clara::Opt
logLevelParser(LogLevel& value)
{
    return clara::Opt{
        [&](std::string const& arg) { value = Logging::getLLfromString(arg); },
        "LEVEL"}["--ll"]("set the log level");
}

clara::Parser
configurationParser(CommandLine::ConfigOption& configOption)
{
    return clara::Parser{} | logLevelParser(configOption.mLogLevel) |
           clara::Opt{configOption.mConfigFile,
                      "FILE-NAME"}["--conf"](fmt::format(
               FMT_STRING("specify a config file ('{}' for STDIN, built-in "
                          "defaults when omitted)"),
               Config::STDIN_SPECIAL_NAME));
}

clara::Opt
uintParser(std::optional<uint32>& value, std::string const& hint,
           std::string const& name, std::string const& description)
{
    return clara::Opt{[&](uint32 arg) { value = arg; }, hint}[name](
        description);
}

clara::Opt
validatorsParser(std::optional<uint32>& value)
{
    return uintParser(value, "N", "--validators",
                      fmt::format(FMT_STRING("number of validators ({}-{})"),
                                  SimulationParameters::MIN_VALIDATORS,
                                  SimulationParameters::MAX_VALIDATORS));
}

clara::Opt
leaderParser(std::optional<std::string>& value)
{
    return clara::Opt{[&](std::string const& arg) { value = arg; },
                      "ID"}["--leader"](
        "faulty leader of the attack round, or 'none'");
}

clara::Parser
runOverridesParser(RunOverrides& o)
{
    return clara::Parser{} | validatorsParser(o.mValidators) |
           uintParser(o.mFaults, "F", "--faults",
                      "fault bound f, at most floor((N-1)/3)") |
           uintParser(o.mQuorum, "Q", "--quorum",
                      "quorum threshold override (default 2f+1)") |
           leaderParser(o.mLeader) |
           clara::Opt{[&](std::string const& arg) { o.mAttack = arg; },
                      "TYPE"}["--attack"](
               "equivocation, withhold-qc or drop-messages") |
           clara::Opt{o.mDoubleVoters, "ID"}["--double-voter"](
               "validator that votes for both conflicting proposals "
               "(repeatable)") |
           uintParser(o.mDelayMs, "MS", "--delay-ms",
                      fmt::format(FMT_STRING("pacing between phases ({}-{})"),
                                  Config::MIN_STEP_DELAY_MS,
                                  Config::MAX_STEP_DELAY_MS)) |
           clara::Opt{o.mNoPacing}["--no-pacing"](
               "render every event without waiting");
}

clara::Opt
jsonParser(bool& json)
{
    return clara::Opt{json}["--json"]("write the run result as JSON");
}

int
runWithHelp(CommandLineArgs const& args,
            std::vector<ParserWithValidation> parsers, std::function<int()> f)
{
    auto isHelp = false;
    auto parser = clara::Parser{} | clara::Help(isHelp);
    for (auto const& p : parsers)
        parser |= p.parser();
    auto errorMessage =
        parser
            .parse(args.mCommandName,
                   clara::detail::TokenStream{std::begin(args.mArgs),
                                              std::end(args.mArgs)})
            .errorMessage();
    if (errorMessage.empty())
    {
        for (auto const& p : parsers)
        {
            errorMessage = p.validate();
            if (!errorMessage.empty())
            {
                break;
            }
        }
    }

    if (!errorMessage.empty())
    {
        writeWithTextFlow(std::cerr, errorMessage);
        writeWithTextFlow(std::cerr, args.mCommandDescription);
        parser.writeToStream(std::cerr);
        return 1;
    }

    if (isHelp)
    {
        writeWithTextFlow(std::cout, args.mCommandDescription);
        parser.writeToStream(std::cout);
        return 0;
    }

    return f();
}

CommandLine::Command::Command(std::string const& name,
                              std::string const& description,
                              RunFunc const& runFunc)
    : mName{name}, mDescription{description}, mRunFunc{runFunc}
{
}

int
CommandLine::Command::run(CommandLineArgs const& args) const
{
    return mRunFunc(args);
}

std::string
CommandLine::Command::name() const
{
    return mName;
}

std::string
CommandLine::Command::description() const
{
    return mDescription;
}

Config
CommandLine::ConfigOption::getConfig() const
{
    Config config;
    Logging::setLogLevel(mLogLevel, nullptr);
    if (!mConfigFile.empty())
    {
        LOG_INFO(DEFAULT_LOG, "Config from {}", mConfigFile);
        config.load(mConfigFile);
    }

    if (!config.LOG_FILE_PATH.empty())
    {
        Logging::setLoggingToFile(config.LOG_FILE_PATH);
    }
    if (config.LOG_COLOR)
    {
        Logging::setLoggingColor(true);
    }
    Logging::setLogLevel(mLogLevel, nullptr);
    return config;
}

CommandLine::CommandLine(std::vector<Command> const& commands)
    : mCommands{commands}
{
    mCommands.push_back(Command{"help", "display list of available commands",
                                [this](CommandLineArgs const& args) {
                                    writeToStream(args.mExeName, std::cout);
                                    return 0;
                                }});

    std::sort(
        std::begin(mCommands), std::end(mCommands),
        [](Command const& x, Command const& y) { return x.name() < y.name(); });
}

CommandLine::AdjustedCommandLine
CommandLine::adjustCommandLine(clara::detail::Args const& args)
{
    auto tokens = clara::detail::TokenStream{args};
    auto command = std::string{};
    auto remainingTokens = std::vector<std::string>{};
    auto found = false;
    auto optionValue = false;

    while (tokens)
    {
        auto token = *tokens;
        if (found || optionValue)
        {
            remainingTokens.push_back(token.token);
            optionValue = false;
        }
        else if (token.type == clara::detail::TokenType::Argument)
        {
            command = token.token;
            found = true;
        }
        else // clara::detail::TokenType::Option
        {
            auto commonIt =
                std::find_if(std::begin(ConfigOption::COMMON_OPTIONS),
                             std::end(ConfigOption::COMMON_OPTIONS),
                             [&](ConfigOption::Common const& option) {
                                 return token.token == option.first;
                             });
            if (commonIt != std::end(ConfigOption::COMMON_OPTIONS))
            {
                remainingTokens.push_back(token.token);
                optionValue = commonIt->second;
            }
            else
            {
                // unknown option before the command: show help
                return {};
            }
        }
        ++tokens;
    }

    return CommandLine::AdjustedCommandLine{command, remainingTokens};
}

std::optional<CommandLine::Command>
CommandLine::selectCommand(std::string const& commandName)
{
    auto command = std::find_if(
        std::begin(mCommands), std::end(mCommands),
        [&](Command const& command) { return command.name() == commandName; });
    if (command != std::end(mCommands))
    {
        return std::make_optional<Command>(*command);
    }

    command = std::find_if(
        std::begin(mCommands), std::end(mCommands),
        [&](Command const& command) { return command.name() == "help"; });
    if (command != std::end(mCommands))
    {
        return std::make_optional<Command>(*command);
    }
    return std::nullopt;
}

void
CommandLine::writeToStream(std::string const& exeName, std::ostream& os) const
{
    os << "usage:\n"
       << "  " << exeName << " "
       << "COMMAND";
    os << "\n\nwhere COMMAND is one of following:" << std::endl;

    size_t consoleWidth = CLARA_TEXTFLOW_CONFIG_CONSOLE_WIDTH;
    size_t commandWidth = 0;
    for (auto const& command : mCommands)
        commandWidth = std::max(commandWidth, command.name().size() + 2);

    commandWidth = std::min(commandWidth, consoleWidth / 2);

    for (auto const& command : mCommands)
    {
        auto row = clara::TextFlow::Column(command.name())
                       .width(commandWidth)
                       .indent(2) +
                   clara::TextFlow::Spacer(4) +
                   clara::TextFlow::Column(command.description())
                       .width(consoleWidth - 7 - commandWidth);
        os << row << std::endl;
    }
}

int
runRun(CommandLineArgs const& args)
{
    CommandLine::ConfigOption configOption;
    RunOverrides overrides;
    bool json = false;

    return runWithHelp(args,
                       {configurationParser(configOption),
                        runOverridesParser(overrides), jsonParser(json)},
                       [&] {
                           auto cfg = configOption.getConfig();
                           overrides.apply(cfg);
                           return runSimulation(cfg, json, std::cout);
                       });
}

int
runTopology(CommandLineArgs const& args)
{
    CommandLine::ConfigOption configOption;
    std::optional<uint32> validators;
    std::optional<std::string> leader;

    return runWithHelp(args,
                       {configurationParser(configOption),
                        validatorsParser(validators), leaderParser(leader)},
                       [&] {
                           auto cfg = configOption.getConfig();
                           RunOverrides overrides;
                           overrides.mValidators = validators;
                           overrides.mLeader = leader;
                           overrides.apply(cfg);
                           printTopology(cfg, std::cout);
                           return 0;
                       });
}

int
runVersion(CommandLineArgs const&)
{
    std::cout << HOTBFT_VERSION << std::endl;
    return 0;
}
}

int
handleCommandLine(int argc, char* const* argv)
{
    auto commandLine = CommandLine{
        {{"run", "run the attack scenario and report every protocol event",
          runRun},
         {"topology",
          "print validator IDs, faulty leader and ring edges as JSON",
          runTopology},
         {"version", "print version information", runVersion}}};

    auto adjustedCommandLine = commandLine.adjustCommandLine({argc, argv});
    auto command = commandLine.selectCommand(adjustedCommandLine.first);
    bool didDefaultToHelp = command->name() != adjustedCommandLine.first;

    auto exeName = "hotbft";
    auto commandName =
        fmt::format(FMT_STRING("{0} {1}"), exeName, command->name());
    auto args = CommandLineArgs{exeName, commandName, command->description(),
                                adjustedCommandLine.second};

    try
    {
        int res = command->run(args);
        return didDefaultToHelp ? 1 : res;
    }
    catch (std::exception& e)
    {
        LOG_FATAL(DEFAULT_LOG, "Got an exception: {}", e.what());
        return 1;
    }
}
}
