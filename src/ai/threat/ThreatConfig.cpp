/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/threat/ThreatConfig.hpp"
#include "managers/SettingsManager.hpp"

namespace HexCrawl {

ThreatConfig ThreatConfig::fromSettings(const SettingsManager& settings) {
    ThreatConfig config;
    config.enabled = settings.get<bool>("threat", "enabled", config.enabled);
    config.decayRate = settings.get<float>("threat", "decayRate",
                                           static_cast<float>(config.decayRate));
    config.healingMultiplier = settings.get<float>("threat", "healingMultiplier",
                                                   static_cast<float>(config.healingMultiplier));
    config.damageMultiplier = settings.get<float>("threat", "damageMultiplier",
                                                  static_cast<float>(config.damageMultiplier));
    config.armorMultiplier = settings.get<float>("threat", "armorMultiplier",
                                                 static_cast<float>(config.armorMultiplier));
    config.avoidLastTargetRounds = settings.get<int>("threat", "avoidLastTargetRounds",
                                                     config.avoidLastTargetRounds);
    config.fallbackToLowestHp = settings.get<bool>("threat", "fallbackToLowestHp",
                                                   config.fallbackToLowestHp);
    config.enableTiebreaker = settings.get<bool>("threat", "enableTiebreaker",
                                                 config.enableTiebreaker);
    return config;
}

} // namespace HexCrawl
