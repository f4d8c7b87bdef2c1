/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef THREAT_CALCULATOR_HPP
#define THREAT_CALCULATOR_HPP

#include "ai/threat/ThreatConfig.hpp"
#include <string>
#include <vector>

namespace HexCrawl {

struct ThreatValidation {
    bool valid{true};
    std::string reason;
};

/**
 * @brief Builders and arithmetic for ThreatUpdate values
 *
 * Stateless. Every builder fills the fields a given kind of event
 * contributes; calculateRawThreat applies a config's multipliers.
 */
class ThreatCalculator {
public:
    static ThreatUpdate createThreatUpdate(const std::string& entityId,
                                           double damageToSelf = 0.0,
                                           double totalDamageDealt = 0.0,
                                           double healingDone = 0.0,
                                           double armor = 0.0,
                                           const std::string& source = "unknown");

    // Single-target hit: damage to this monster is also the total dealt
    static ThreatUpdate createAttackThreat(const std::string& entityId,
                                           double damageDealt, double armor);

    static ThreatUpdate createHealingThreat(const std::string& entityId,
                                            double healingAmount, double armor);

    static ThreatUpdate createAbilityThreat(const std::string& entityId,
                                            double damageToSelf,
                                            double totalDamage,
                                            double healingDone, double armor,
                                            const std::string& abilityName);

    // Total damage is scaled by max(1, targetsHit * 0.5)
    static ThreatUpdate createAoEThreat(const std::string& entityId,
                                        double damageToSelf,
                                        double totalDamageToAllTargets,
                                        int targetsHit, double armor,
                                        const std::string& abilityName);

    static ThreatUpdate createDefensiveThreat(const std::string& entityId,
                                              double defensiveValue,
                                              double armor,
                                              const std::string& abilityName);

    static ThreatUpdate createSupportThreat(const std::string& entityId,
                                            double supportValue, double armor,
                                            const std::string& abilityName);

    /**
     * @brief armor * damageToSelf * armorMult + totalDamage * damageMult
     *        + healing * healingMult
     */
    static double calculateRawThreat(const ThreatUpdate& update,
                                     const ThreatConfig& config);

    static double combineThreatUpdates(const std::vector<ThreatUpdate>& updates,
                                       const ThreatConfig& config);

    static double calculateThreatDecay(double currentThreat, double decayRate,
                                       int roundsPassed = 1);

    /**
     * @brief Threat as a percentage of the largest observed value, capped at 100
     */
    static double normalizeThreatForAI(double threatValue,
                                       double maxObservedThreat = 100.0);

    /**
     * @brief Average threat per recent event projected and decayed ahead
     */
    static double estimateFutureThreat(const std::vector<ThreatUpdate>& recentUpdates,
                                       const ThreatConfig& config,
                                       int roundsAhead = 1);

    /**
     * @return "none", "low", "medium", "high" or "critical"
     */
    static std::string getThreatLevel(double threatValue);

    static ThreatValidation validateThreatUpdate(const ThreatUpdate& update);
};

} // namespace HexCrawl

#endif // THREAT_CALCULATOR_HPP
