/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ThreatCalculatorTests
#include <boost/test/unit_test.hpp>

#include "ai/threat/ThreatCalculator.hpp"
#include <vector>

using namespace HexCrawl;

BOOST_AUTO_TEST_SUITE(ThreatUpdateFactoryTests)

BOOST_AUTO_TEST_CASE(TestAttackThreat) {
    ThreatUpdate update = ThreatCalculator::createAttackThreat("fighter", 20, 2);
    BOOST_CHECK_EQUAL(update.entityId, "fighter");
    BOOST_CHECK_EQUAL(update.damageToSelf, 20.0);
    BOOST_CHECK_EQUAL(update.totalDamageDealt, 20.0);
    BOOST_CHECK_EQUAL(update.healingDone, 0.0);
    BOOST_CHECK_EQUAL(update.source, "attack");
}

BOOST_AUTO_TEST_CASE(TestAbilityAndSupportSources) {
    ThreatUpdate ability = ThreatCalculator::createAbilityThreat("mage", 8, 16, 0, 1, "fireball");
    BOOST_CHECK_EQUAL(ability.source, "ability:fireball");
    BOOST_CHECK_EQUAL(ability.damageToSelf, 8.0);
    BOOST_CHECK_EQUAL(ability.totalDamageDealt, 16.0);

    ThreatUpdate support = ThreatCalculator::createSupportThreat("bard", 12, 0, "inspire");
    BOOST_CHECK_EQUAL(support.healingDone, 12.0);
    BOOST_CHECK_EQUAL(support.source, "support:inspire");

    ThreatUpdate defensive = ThreatCalculator::createDefensiveThreat("knight", 6, 4, "taunt");
    BOOST_CHECK_EQUAL(defensive.totalDamageDealt, 6.0);
    BOOST_CHECK_EQUAL(defensive.damageToSelf, 0.0);
}

BOOST_AUTO_TEST_CASE(TestAoEMultiplier) {
    // 4 targets: 4 x 0.5 = 2.0
    ThreatUpdate wide = ThreatCalculator::createAoEThreat("mage", 10, 30, 4, 0, "nova");
    BOOST_CHECK_EQUAL(wide.totalDamageDealt, 60.0);

    // Never below 1.0
    ThreatUpdate single = ThreatCalculator::createAoEThreat("mage", 10, 30, 1, 0, "nova");
    BOOST_CHECK_EQUAL(single.totalDamageDealt, 30.0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ThreatMathTests)

BOOST_AUTO_TEST_CASE(TestRawThreatComponents) {
    ThreatConfig config;
    ThreatUpdate update = ThreatCalculator::createThreatUpdate("p", 10, 25, 8, 3, "mixed");
    // 3 x 10 x 0.5 + 25 x 1.0 + 8 x 1.5
    BOOST_CHECK_CLOSE(ThreatCalculator::calculateRawThreat(update, config), 52.0, 0.0001);

    config.damageMultiplier = 2.0;
    BOOST_CHECK_CLOSE(ThreatCalculator::calculateRawThreat(update, config), 77.0, 0.0001);
}

BOOST_AUTO_TEST_CASE(TestCombineUpdates) {
    ThreatConfig config;
    std::vector<ThreatUpdate> updates{ThreatCalculator::createAttackThreat("p", 10, 0),
                                      ThreatCalculator::createHealingThreat("p", 10, 0)};
    BOOST_CHECK_CLOSE(ThreatCalculator::combineThreatUpdates(updates, config), 25.0, 0.0001);
    BOOST_CHECK_EQUAL(ThreatCalculator::combineThreatUpdates({}, config), 0.0);
}

BOOST_AUTO_TEST_CASE(TestDecayOverRounds) {
    BOOST_CHECK_CLOSE(ThreatCalculator::calculateThreatDecay(100.0, 0.1), 90.0, 0.0001);
    BOOST_CHECK_CLOSE(ThreatCalculator::calculateThreatDecay(100.0, 0.1, 2), 81.0, 0.0001);
    BOOST_CHECK_CLOSE(ThreatCalculator::calculateThreatDecay(100.0, 0.1, 0), 100.0, 0.0001);
}

BOOST_AUTO_TEST_CASE(TestNormalization) {
    BOOST_CHECK_CLOSE(ThreatCalculator::normalizeThreatForAI(50.0, 200.0), 25.0, 0.0001);
    BOOST_CHECK_CLOSE(ThreatCalculator::normalizeThreatForAI(300.0, 100.0), 100.0, 0.0001);
    BOOST_CHECK_EQUAL(ThreatCalculator::normalizeThreatForAI(10.0, 0.0), 0.0);
}

BOOST_AUTO_TEST_CASE(TestFutureEstimate) {
    ThreatConfig config;
    BOOST_CHECK_EQUAL(ThreatCalculator::estimateFutureThreat({}, config), 0.0);

    std::vector<ThreatUpdate> updates{ThreatCalculator::createAttackThreat("p", 10, 0),
                                      ThreatCalculator::createAttackThreat("p", 30, 0)};
    // Average 20, one round ahead, decayed once
    BOOST_CHECK_CLOSE(ThreatCalculator::estimateFutureThreat(updates, config), 18.0, 0.0001);
}

BOOST_AUTO_TEST_CASE(TestThreatLevels) {
    BOOST_CHECK_EQUAL(ThreatCalculator::getThreatLevel(0.0), "none");
    BOOST_CHECK_EQUAL(ThreatCalculator::getThreatLevel(10.0), "low");
    BOOST_CHECK_EQUAL(ThreatCalculator::getThreatLevel(20.0), "medium");
    BOOST_CHECK_EQUAL(ThreatCalculator::getThreatLevel(50.0), "high");
    BOOST_CHECK_EQUAL(ThreatCalculator::getThreatLevel(50.5), "critical");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ThreatValidationTests)

BOOST_AUTO_TEST_CASE(TestValidUpdate) {
    ThreatValidation validation =
        ThreatCalculator::validateThreatUpdate(ThreatCalculator::createAttackThreat("p", 5, 1));
    BOOST_CHECK(validation.valid);
    BOOST_CHECK(validation.reason.empty());
}

BOOST_AUTO_TEST_CASE(TestRejectedUpdates) {
    BOOST_CHECK(!ThreatCalculator::validateThreatUpdate(
                     ThreatCalculator::createAttackThreat("   ", 5, 1)).valid);
    BOOST_CHECK(!ThreatCalculator::validateThreatUpdate(
                     ThreatCalculator::createHealingThreat("p", -1, 0)).valid);
    BOOST_CHECK(!ThreatCalculator::validateThreatUpdate(
                     ThreatCalculator::createAttackThreat("p", 5, -2)).valid);

    ThreatValidation inconsistent = ThreatCalculator::validateThreatUpdate(
        ThreatCalculator::createThreatUpdate("p", 10, 5, 0, 0));
    BOOST_CHECK(!inconsistent.valid);
    BOOST_CHECK_EQUAL(inconsistent.reason, "Total damage cannot be less than damage to self");
}

BOOST_AUTO_TEST_SUITE_END()
