/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef THREAT_CONFIG_HPP
#define THREAT_CONFIG_HPP

#include <string>

namespace HexCrawl {

class SettingsManager;

/**
 * @brief Per-monster tuning for the threat table and target selection
 *
 * Built once from a monster definition or from settings, then treated as
 * read-only by the ThreatManager that owns a copy.
 */
struct ThreatConfig {
    bool enabled = true;
    double decayRate = 0.1;          // Fraction of threat lost per round
    double healingMultiplier = 1.5;  // Healing done by a candidate
    double damageMultiplier = 1.0;   // Total damage dealt by a candidate
    double armorMultiplier = 0.5;    // Candidate armor x damage taken by self
    int avoidLastTargetRounds = 1;   // 0 disables anti-repetition
    bool fallbackToLowestHp = true;  // No threat recorded: pick lowest HP%
    bool enableTiebreaker = true;    // Equal threat: pick lowest id

    static ThreatConfig createDefault() { return ThreatConfig{}; }

    static ThreatConfig createDisabled() {
        ThreatConfig config;
        config.enabled = false;
        return config;
    }

    /**
     * @brief Defaults overridden by the "threat" settings category
     */
    static ThreatConfig fromSettings(const SettingsManager& settings);
};

/**
 * @brief One threat-generating event seen by a monster
 *
 * entityId names the candidate who generated the threat.
 */
struct ThreatUpdate {
    std::string entityId;
    double damageToSelf = 0.0;      // Damage the candidate dealt to this monster
    double totalDamageDealt = 0.0;  // All damage the candidate dealt in the event
    double healingDone = 0.0;
    double armor = 0.0;             // The candidate's armor at the time
    std::string source = "unknown";
};

} // namespace HexCrawl

#endif // THREAT_CONFIG_HPP
