// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/Hex.h"
#include "crypto/SHA.h"
#include "test/Catch2.h"
#include "util/Logging.h"
#include <map>
#include <stdexcept>

using namespace hotbft;

static std::map<std::vector<uint8_t>, std::string> hexTestVectors = {
    {{}, ""},
    {{0x72}, "72"},
    {{0x54, 0x4c}, "544c"},
    {{0x34, 0x75, 0x52, 0x45, 0x34, 0x75}, "347552453475"},
    {{0x4f, 0x46, 0x79, 0x58, 0x43, 0x6d, 0x68, 0x37, 0x51},
     "4f467958436d683751"}};

TEST_CASE("hex tests", "[crypto]")
{
    for (auto const& pair : hexTestVectors)
    {
        LOG_DEBUG(DEFAULT_LOG, "fixed test vector hex: \"{}\"", pair.second);

        auto enc = binToHex(pair.first);
        CHECK(enc.size() == pair.second.size());
        CHECK(enc == pair.second);
    }
}

TEST_CASE("hex abbreviation", "[crypto]")
{
    std::vector<uint8_t> bytes{0x4f, 0x46, 0x79, 0x58, 0x43};
    REQUIRE(hexAbbrev(bytes) == "4f4679");
    REQUIRE(hexAbbrev(std::vector<uint8_t>{0x72}) == "72");
    REQUIRE(hexAbbrev(std::vector<uint8_t>{}) == "");
}

static std::map<std::string, std::string> sha256TestVectors = {
    {"", "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"},

    {"a", "ca978112ca1bbdcafac231b39a23dc4da786eff8147c4e72b9807785afee48bb"},

    {"abc", "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"},

    {"hello world",
     "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9"}};

TEST_CASE("SHA256 tests", "[crypto]")
{
    for (auto const& pair : sha256TestVectors)
    {
        LOG_DEBUG(DEFAULT_LOG, "fixed test vector SHA256: \"{}\"",
                  pair.second);

        auto hash = binToHex(sha256(pair.first));
        CHECK(hash.size() == pair.second.size());
        CHECK(hash == pair.second);
    }
}

TEST_CASE("stateful SHA256 tests", "[crypto]")
{
    for (auto const& pair : sha256TestVectors)
    {
        SHA256 h;
        for (auto c : pair.first)
        {
            h.add(std::string(1, c));
        }
        CHECK(binToHex(h.finish()) == pair.second);
    }

    SECTION("finished hasher rejects input until reset")
    {
        SHA256 h;
        h.add("hello ");
        h.finish();
        REQUIRE_THROWS_AS(h.add("world"), std::runtime_error);
        REQUIRE_THROWS_AS(h.finish(), std::runtime_error);

        h.reset();
        h.add("hello ");
        h.add("world");
        REQUIRE(binToHex(h.finish()) == sha256TestVectors["hello world"]);
    }
}
