// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "test/Catch2.h"
#include "util/Logging.h"
#include "util/types.h"

using namespace hotbft;

TEST_CASE("log level names", "[logging]")
{
    REQUIRE(Logging::getLLfromString("fatal") == LogLevel::LVL_FATAL);
    REQUIRE(Logging::getLLfromString("ERROR") == LogLevel::LVL_ERROR);
    REQUIRE(Logging::getLLfromString("Warning") == LogLevel::LVL_WARNING);
    REQUIRE(Logging::getLLfromString("debug") == LogLevel::LVL_DEBUG);
    REQUIRE(Logging::getLLfromString("trace") == LogLevel::LVL_TRACE);
    // anything else is info
    REQUIRE(Logging::getLLfromString("verbose") == LogLevel::LVL_INFO);

    REQUIRE(Logging::getStringFromLL(LogLevel::LVL_WARNING) == "Warning");
    REQUIRE(Logging::getStringFromLL(LogLevel::LVL_TRACE) == "Trace");
}

TEST_CASE("partition log levels", "[logging]")
{
    auto saved = Logging::getLogLevel("Node");

    Logging::setLogLevel(LogLevel::LVL_TRACE, "Node");
    REQUIRE(Logging::getLogLevel("Node") == LogLevel::LVL_TRACE);
    CLOG_TRACE(Node, "trace enabled for {}", "Node");

    // a global level resets every partition override
    Logging::setLogLevel(saved, nullptr);
    REQUIRE(Logging::getLogLevel("Node") == saved);
    REQUIRE(Logging::getLogLevel("Simulation") == saved);
}

TEST_CASE("id list formatting", "[logging]")
{
    REQUIRE(idsToStr({}) == "[]");
    REQUIRE(idsToStr({"A", "B", "C"}) == "[A, B, C]");
    REQUIRE(iequals("none", "NONE"));
    REQUIRE(!iequals("none", "non"));
}
