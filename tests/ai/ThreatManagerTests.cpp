/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ThreatManagerTests
#include <boost/test/unit_test.hpp>

#include "ai/threat/ThreatCalculator.hpp"
#include "ai/threat/ThreatManager.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include <string>
#include <vector>

using namespace HexCrawl;

struct ThreatManagerFixture {
    ThreatManagerFixture() { HEXCRAWL_ENABLE_BENCHMARK_MODE(); }
    ~ThreatManagerFixture() { HEXCRAWL_DISABLE_BENCHMARK_MODE(); }

    static TargetCandidate candidate(const std::string& id, int hp, int maxHp = 100) {
        TargetCandidate c;
        c.id = id;
        c.name = id;
        c.currentHp = hp;
        c.maxHp = maxHp;
        c.alive = hp > 0;
        return c;
    }

    ThreatManager manager;
};

BOOST_FIXTURE_TEST_SUITE(ThreatAccumulationTests, ThreatManagerFixture)

BOOST_AUTO_TEST_CASE(TestAttackThreatFormula) {
    // armor 2 x damage 20 x 0.5 + damage 20 x 1.0
    BOOST_CHECK(manager.addThreat(ThreatCalculator::createAttackThreat("fighter", 20, 2)));
    BOOST_CHECK_CLOSE(manager.getThreat("fighter"), 40.0, 0.0001);

    BOOST_CHECK(manager.addThreat(ThreatCalculator::createAttackThreat("fighter", 10, 0)));
    BOOST_CHECK_CLOSE(manager.getThreat("fighter"), 50.0, 0.0001);
}

BOOST_AUTO_TEST_CASE(TestHealingThreat) {
    BOOST_CHECK(manager.addThreat(ThreatCalculator::createHealingThreat("cleric", 20, 3)));
    BOOST_CHECK_CLOSE(manager.getThreat("cleric"), 30.0, 0.0001);
}

BOOST_AUTO_TEST_CASE(TestInvalidUpdatesIgnored) {
    BOOST_CHECK(!manager.addThreat(ThreatCalculator::createAttackThreat("", 20, 2)));
    BOOST_CHECK(!manager.addThreat(ThreatCalculator::createAttackThreat("fighter", -5, 0)));
    BOOST_CHECK(!manager.addThreat(ThreatCalculator::createAttackThreat("fighter", 0, 0)));
    BOOST_CHECK(manager.getAllThreats().empty());
}

BOOST_AUTO_TEST_CASE(TestDisabledManagerIsInert) {
    ThreatManager disabled(ThreatConfig::createDisabled());
    BOOST_CHECK(!disabled.isEnabled());
    BOOST_CHECK(!disabled.addThreat(ThreatCalculator::createAttackThreat("fighter", 20, 2)));
    BOOST_CHECK_EQUAL(disabled.getThreat("fighter"), 0.0);

    TargetingResult result = disabled.selectTarget({candidate("fighter", 50)});
    BOOST_CHECK(!result.hasTarget());
}

BOOST_AUTO_TEST_CASE(TestHistoryIsBounded) {
    for (int i = 0; i < 15; ++i) {
        manager.addThreat(ThreatCalculator::createAttackThreat("fighter", 5, 0));
    }
    BOOST_CHECK_EQUAL(manager.getThreatHistory("fighter").size(),
                      ThreatManager::MAX_HISTORY_PER_ENTITY);
    BOOST_CHECK_CLOSE(manager.getTotalThreatGenerated("fighter"), 50.0, 0.0001);
    BOOST_CHECK(manager.getThreatHistory("nobody").empty());
}

BOOST_AUTO_TEST_CASE(TestTopThreatsSortedDescending) {
    manager.setThreat("a", 10.0);
    manager.setThreat("b", 30.0);
    manager.setThreat("c", 20.0);
    manager.setThreat("d", 5.0);

    auto top = manager.getTopThreats(3);
    BOOST_REQUIRE_EQUAL(top.size(), 3u);
    BOOST_CHECK_EQUAL(top[0].entityId, "b");
    BOOST_CHECK_EQUAL(top[1].entityId, "c");
    BOOST_CHECK_EQUAL(top[2].entityId, "a");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ThreatDecayTests, ThreatManagerFixture)

BOOST_AUTO_TEST_CASE(TestDecayStrictlyDecreases) {
    manager.setThreat("a", 10.0);
    manager.setThreat("b", 50.0);

    manager.processRound();
    BOOST_CHECK_CLOSE(manager.getThreat("a"), 9.0, 0.0001);
    BOOST_CHECK_CLOSE(manager.getThreat("b"), 45.0, 0.0001);
    BOOST_CHECK_EQUAL(manager.getRoundsActive(), 1);
}

BOOST_AUTO_TEST_CASE(TestDecayBelowThresholdReadsZero) {
    manager.setThreat("a", 0.105);
    manager.processRound();
    BOOST_CHECK_EQUAL(manager.getThreat("a"), 0.0);
    BOOST_CHECK(manager.getAllThreats().empty());

    manager.setThreat("b", 0.05);
    BOOST_CHECK_EQUAL(manager.getThreat("b"), 0.0);
}

BOOST_AUTO_TEST_CASE(TestExplicitReduction) {
    manager.setThreat("a", 40.0);
    manager.applyThreatReduction(0.5);
    BOOST_CHECK_CLOSE(manager.getThreat("a"), 20.0, 0.0001);
    BOOST_CHECK_EQUAL(manager.getRoundsActive(), 0);
}

BOOST_AUTO_TEST_CASE(TestResetForEncounter) {
    manager.setThreat("a", 40.0);
    manager.trackTarget("a");
    manager.processRound();

    manager.resetForEncounter();
    BOOST_CHECK(manager.getAllThreats().empty());
    BOOST_CHECK(manager.getLastTargets().empty());
    BOOST_CHECK_EQUAL(manager.getRoundsActive(), 0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(TargetSelectionTests, ThreatManagerFixture)

BOOST_AUTO_TEST_CASE(TestHighestThreatWins) {
    manager.setThreat("a", 15.0);
    manager.setThreat("b", 40.0);

    TargetingResult result = manager.selectTarget({candidate("a", 80), candidate("b", 80)});
    BOOST_REQUIRE(result.hasTarget());
    BOOST_CHECK_EQUAL(*result.targetId, "b");
    BOOST_CHECK_CLOSE(result.confidence, 0.9, 0.0001);
    BOOST_CHECK(!result.reason.empty());
}

BOOST_AUTO_TEST_CASE(TestFallbackToLowestHp) {
    TargetingResult result =
        manager.selectTarget({candidate("a", 60), candidate("b", 20), candidate("c", 90)});
    BOOST_REQUIRE(result.hasTarget());
    BOOST_CHECK_EQUAL(*result.targetId, "b");
    BOOST_CHECK_CLOSE(result.confidence, 0.5, 0.0001);
}

BOOST_AUTO_TEST_CASE(TestFallbackByIdWhenHpFallbackDisabled) {
    ThreatConfig config;
    config.fallbackToLowestHp = false;
    ThreatManager byId(config);

    TargetingResult result = byId.selectTarget({candidate("c", 10), candidate("a", 90)});
    BOOST_REQUIRE(result.hasTarget());
    BOOST_CHECK_EQUAL(*result.targetId, "a");
}

BOOST_AUTO_TEST_CASE(TestTieBrokenById) {
    manager.setThreat("b", 30.0);
    manager.setThreat("a", 30.0);

    TargetingResult result = manager.selectTarget({candidate("b", 50), candidate("a", 50)});
    BOOST_REQUIRE(result.hasTarget());
    BOOST_CHECK_EQUAL(*result.targetId, "a");
}

BOOST_AUTO_TEST_CASE(TestRecentTargetAvoided) {
    manager.setThreat("a", 40.0);
    manager.setThreat("b", 10.0);
    const std::vector<TargetCandidate> candidates{candidate("a", 50), candidate("b", 50)};

    BOOST_CHECK_EQUAL(*manager.selectTarget(candidates).targetId, "a");
    manager.processRound();

    // a was picked in the previous round
    BOOST_CHECK(manager.wasRecentlyTargeted("a"));
    BOOST_CHECK_EQUAL(*manager.selectTarget(candidates).targetId, "b");
}

BOOST_AUTO_TEST_CASE(TestRecentTargetKeptWhenAlone) {
    manager.setThreat("a", 40.0);
    const std::vector<TargetCandidate> candidates{candidate("a", 50)};

    BOOST_CHECK_EQUAL(*manager.selectTarget(candidates).targetId, "a");
    manager.processRound();
    BOOST_CHECK_EQUAL(*manager.selectTarget(candidates).targetId, "a");
}

BOOST_AUTO_TEST_CASE(TestAvoidanceDisabled) {
    ThreatConfig config;
    config.avoidLastTargetRounds = 0;
    ThreatManager sticky(config);
    sticky.setThreat("a", 40.0);
    sticky.setThreat("b", 10.0);
    const std::vector<TargetCandidate> candidates{candidate("a", 50), candidate("b", 50)};

    BOOST_CHECK_EQUAL(*sticky.selectTarget(candidates).targetId, "a");
    sticky.processRound();
    BOOST_CHECK_EQUAL(*sticky.selectTarget(candidates).targetId, "a");
}

BOOST_AUTO_TEST_CASE(TestDeadAndMissingCandidates) {
    manager.setThreat("dead", 90.0);
    manager.setThreat("gone", 70.0);
    manager.setThreat("alive", 10.0);

    TargetingResult result = manager.selectTarget({candidate("dead", 0), candidate("alive", 40)});
    BOOST_REQUIRE(result.hasTarget());
    BOOST_CHECK_EQUAL(*result.targetId, "alive");
    BOOST_CHECK_EQUAL(manager.getThreat("gone"), 0.0);
}

BOOST_AUTO_TEST_CASE(TestNoCandidates) {
    TargetingResult result = manager.selectTarget({});
    BOOST_CHECK(!result.hasTarget());
    BOOST_CHECK(!result.reason.empty());
    BOOST_CHECK_EQUAL(result.confidence, 0.0);
}

BOOST_AUTO_TEST_CASE(TestConfigFromSettings) {
    SettingsManager settings;
    settings.set("threat", "decayRate", 0.25f);
    settings.set("threat", "avoidLastTargetRounds", 2);
    settings.set("threat", "enableTiebreaker", false);

    ThreatConfig config = ThreatConfig::fromSettings(settings);
    BOOST_CHECK_CLOSE(config.decayRate, 0.25, 0.0001);
    BOOST_CHECK_EQUAL(config.avoidLastTargetRounds, 2);
    BOOST_CHECK(!config.enableTiebreaker);
    BOOST_CHECK(config.enabled);
    BOOST_CHECK_CLOSE(config.healingMultiplier, 1.5, 0.0001);
}

BOOST_AUTO_TEST_SUITE_END()
