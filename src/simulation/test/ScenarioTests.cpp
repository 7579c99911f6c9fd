// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "hotstuff/Signing.h"
#include "simulation/Scenario.h"
#include "simulation/Topologies.h"
#include "test/Catch2.h"
#include "test/test.h"
#include <json/json.h>

using namespace hotbft;

TEST_CASE("equivocation scenario layout", "[simulation][scenario]")
{
    auto scenario = Scenario::equivocation(getTestParameters(7, 2));
    REQUIRE(scenario.getName() == "equivocation");

    auto const& rounds = scenario.getRounds();
    REQUIRE(rounds.size() == 2);

    auto const& attack = rounds[0];
    REQUIRE(attack.mKind == RoundSpec::ATTACK_ROUND);
    REQUIRE(attack.mView == 1);
    REQUIRE(attack.mLeader == "A");
    REQUIRE(attack.mDispatches.size() == 2);
    REQUIRE(attack.mDispatches[0].mProposal.getParentID() ==
            Scenario::GENESIS);

    auto const& safe = rounds[1];
    REQUIRE(safe.mKind == RoundSpec::SAFE_ROUND);
    REQUIRE(safe.mView == 2);
    REQUIRE(safe.mLeader == "B");
    REQUIRE(safe.mDispatches.size() == 1);
    REQUIRE(safe.mDispatches[0].mProposal.getIdentity() == "Z@v2");
    REQUIRE(safe.mDispatches[0].mRecipients.size() == 7);
}

TEST_CASE("scenario for attack type", "[simulation][scenario]")
{
    auto params = getTestParameters();
    REQUIRE(Scenario::forAttack(params));
    params.mAttack = AttackType::WITHHOLD_QC;
    REQUIRE(!Scenario::forAttack(params));
    params.mAttack = AttackType::DROP_MESSAGES;
    REQUIRE(!Scenario::forAttack(params));
}

TEST_CASE("next leader wraps around", "[simulation][scenario]")
{
    auto ids = makeValidatorIDs(4);
    REQUIRE(Scenario::nextLeader(ids, "A") == "B");
    REQUIRE(Scenario::nextLeader(ids, "D") == "A");
    REQUIRE_THROWS_AS(Scenario::nextLeader(ids, "E"), std::invalid_argument);
}

TEST_CASE("scenario round ordering is enforced", "[simulation][scenario]")
{
    Proposal x1("X", Scenario::GENESIS, 1, "A");
    Proposal z2("Z", Scenario::GENESIS, 2, "B");
    std::vector<NodeID> all{"A", "B", "C", "D"};

    RoundSpec attack{RoundSpec::ATTACK_ROUND, 1, "A", {{x1, all}}};
    RoundSpec safe{RoundSpec::SAFE_ROUND, 2, "B", {{z2, all}}};

    REQUIRE_NOTHROW(Scenario("ok", {attack, safe}));
    REQUIRE_THROWS_AS(Scenario("empty", {}), std::invalid_argument);
    REQUIRE_THROWS_AS(Scenario("reversed", {safe, attack}),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(Scenario("two attacks", {attack, attack}),
                      std::invalid_argument);

    RoundSpec sameView = safe;
    sameView.mView = 1;
    sameView.mDispatches = {{Proposal("Z", Scenario::GENESIS, 1, "B"), all}};
    REQUIRE_THROWS_AS(Scenario("same view", {attack, sameView}),
                      std::invalid_argument);

    RoundSpec foreign = safe;
    foreign.mLeader = "C";
    REQUIRE_THROWS_AS(Scenario("foreign proposal", {attack, foreign}),
                      std::invalid_argument);

    RoundSpec empty = safe;
    empty.mDispatches.clear();
    REQUIRE_THROWS_AS(Scenario("nothing proposed", {attack, empty}),
                      std::invalid_argument);
}

TEST_CASE("ring with chords topology", "[simulation][topology]")
{
    SECTION("four validators")
    {
        auto edges = Topologies::ringWithChords(makeValidatorIDs(4));
        std::vector<Edge> expected{{"A", "B"}, {"B", "C"}, {"C", "D"},
                                   {"A", "D"}, {"A", "C"}, {"B", "D"}};
        REQUIRE(edges == expected);
    }
    SECTION("seven validators")
    {
        auto edges = Topologies::ringWithChords(makeValidatorIDs(7));
        // 7 ring edges plus A-D, B-E, C-F
        REQUIRE(edges.size() == 10);
        REQUIRE(edges.back() == Edge{"C", "F"});
    }
    SECTION("degenerate sets")
    {
        REQUIRE(Topologies::ringWithChords({}).empty());
        REQUIRE(Topologies::ringWithChords({"A"}).empty());
        REQUIRE(Topologies::ringWithChords({"A", "B"}).size() == 1);
    }
}

TEST_CASE("topology json", "[simulation][topology]")
{
    auto ids = makeValidatorIDs(4);
    auto json = Topologies::toJson(ids, NodeID("A"));
    REQUIRE(json["validators"].size() == 4);
    REQUIRE(json["faulty_leader"].asString() == "A");
    REQUIRE(json["edges"].size() == 6);
    REQUIRE(json["edges"][0][0].asString() == "A");
    REQUIRE(json["edges"][0][1].asString() == "B");

    auto none = Topologies::toJson(ids, std::nullopt);
    REQUIRE(none["faulty_leader"].isNull());
}
