/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/threat/ThreatCalculator.hpp"
#include <algorithm>
#include <cctype>

namespace HexCrawl {

ThreatUpdate ThreatCalculator::createThreatUpdate(const std::string& entityId,
                                                  double damageToSelf,
                                                  double totalDamageDealt,
                                                  double healingDone,
                                                  double armor,
                                                  const std::string& source) {
    ThreatUpdate update;
    update.entityId = entityId;
    update.damageToSelf = damageToSelf;
    update.totalDamageDealt = totalDamageDealt;
    update.healingDone = healingDone;
    update.armor = armor;
    update.source = source;
    return update;
}

ThreatUpdate ThreatCalculator::createAttackThreat(const std::string& entityId,
                                                  double damageDealt, double armor) {
    return createThreatUpdate(entityId, damageDealt, damageDealt, 0.0, armor, "attack");
}

ThreatUpdate ThreatCalculator::createHealingThreat(const std::string& entityId,
                                                   double healingAmount, double armor) {
    return createThreatUpdate(entityId, 0.0, 0.0, healingAmount, armor, "healing");
}

ThreatUpdate ThreatCalculator::createAbilityThreat(const std::string& entityId,
                                                   double damageToSelf,
                                                   double totalDamage,
                                                   double healingDone, double armor,
                                                   const std::string& abilityName) {
    return createThreatUpdate(entityId, damageToSelf, totalDamage, healingDone, armor,
                              "ability:" + abilityName);
}

ThreatUpdate ThreatCalculator::createAoEThreat(const std::string& entityId,
                                               double damageToSelf,
                                               double totalDamageToAllTargets,
                                               int targetsHit, double armor,
                                               const std::string& abilityName) {
    const double aoeMultiplier = std::max(1.0, targetsHit * 0.5);
    return createThreatUpdate(entityId, damageToSelf,
                              totalDamageToAllTargets * aoeMultiplier, 0.0, armor,
                              "aoe:" + abilityName);
}

ThreatUpdate ThreatCalculator::createDefensiveThreat(const std::string& entityId,
                                                     double defensiveValue,
                                                     double armor,
                                                     const std::string& abilityName) {
    return createThreatUpdate(entityId, 0.0, defensiveValue, 0.0, armor,
                              "defensive:" + abilityName);
}

ThreatUpdate ThreatCalculator::createSupportThreat(const std::string& entityId,
                                                   double supportValue, double armor,
                                                   const std::string& abilityName) {
    // Support effects count as healing
    return createThreatUpdate(entityId, 0.0, 0.0, supportValue, armor,
                              "support:" + abilityName);
}

double ThreatCalculator::calculateRawThreat(const ThreatUpdate& update,
                                            const ThreatConfig& config) {
    const double armorThreat = update.armor * update.damageToSelf * config.armorMultiplier;
    const double damageThreat = update.totalDamageDealt * config.damageMultiplier;
    const double healThreat = update.healingDone * config.healingMultiplier;
    return armorThreat + damageThreat + healThreat;
}

double ThreatCalculator::combineThreatUpdates(const std::vector<ThreatUpdate>& updates,
                                              const ThreatConfig& config) {
    double total = 0.0;
    for (const auto& update : updates) {
        total += calculateRawThreat(update, config);
    }
    return total;
}

double ThreatCalculator::calculateThreatDecay(double currentThreat, double decayRate,
                                              int roundsPassed) {
    double decayed = currentThreat;
    for (int i = 0; i < roundsPassed; ++i) {
        decayed *= 1.0 - decayRate;
    }
    return decayed;
}

double ThreatCalculator::normalizeThreatForAI(double threatValue,
                                              double maxObservedThreat) {
    if (maxObservedThreat <= 0.0) {
        return 0.0;
    }
    return std::min(100.0, (threatValue / maxObservedThreat) * 100.0);
}

double ThreatCalculator::estimateFutureThreat(const std::vector<ThreatUpdate>& recentUpdates,
                                              const ThreatConfig& config,
                                              int roundsAhead) {
    if (recentUpdates.empty()) {
        return 0.0;
    }
    const double average = combineThreatUpdates(recentUpdates, config) /
                           static_cast<double>(recentUpdates.size());
    return calculateThreatDecay(average * roundsAhead, config.decayRate, roundsAhead);
}

std::string ThreatCalculator::getThreatLevel(double threatValue) {
    if (threatValue <= 0.0) return "none";
    if (threatValue <= 10.0) return "low";
    if (threatValue <= 25.0) return "medium";
    if (threatValue <= 50.0) return "high";
    return "critical";
}

ThreatValidation ThreatCalculator::validateThreatUpdate(const ThreatUpdate& update) {
    const bool blankId = std::all_of(update.entityId.begin(), update.entityId.end(),
                                     [](unsigned char c) { return std::isspace(c) != 0; });
    if (blankId) {
        return {false, "Entity ID is required"};
    }
    if (update.damageToSelf < 0.0 || update.totalDamageDealt < 0.0 ||
        update.healingDone < 0.0) {
        return {false, "Threat values cannot be negative"};
    }
    if (update.armor < 0.0) {
        return {false, "Armor cannot be negative"};
    }
    if (update.totalDamageDealt < update.damageToSelf) {
        return {false, "Total damage cannot be less than damage to self"};
    }
    return {true, ""};
}

} // namespace HexCrawl
