/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/behaviors/SupportStrategy.hpp"

namespace HexCrawl {

AIDecision SupportStrategy::decide(const CombatEntity& self, const TargetingContext& context,
                                   ThreatManager& threat, HexPathfinder& pathfinder) {
    const CombatEntity* mostWounded = nullptr;
    for (const CombatEntity* ally : context.allies) {
        if (ally->getHpPercentage() >= WOUNDED_THRESHOLD) {
            continue;
        }
        if (mostWounded == nullptr || ally->getHpPercentage() < mostWounded->getHpPercentage()) {
            mostWounded = ally;
        }
    }

    const AbilityDefinition* heal = nullptr;
    for (const auto& ability : self.abilities().getAbilitiesByVariant(AbilityVariant::Healing)) {
        if (!self.abilities().isOnCooldown(ability.id)) {
            heal = self.abilities().getAbility(ability.id);
            break;
        }
    }

    if (mostWounded != nullptr && heal != nullptr) {
        if (hexDistance(self.getPosition(), mostWounded->getPosition()) <= heal->range) {
            return AIDecision::ability(heal->id, mostWounded->getId(), "Supporting wounded ally");
        }
        if (auto step = approach(self, mostWounded->getPosition(), context, pathfinder)) {
            return AIDecision::move(*step, "Moving to support wounded ally");
        }
    }

    return m_defensive.decide(self, context, threat, pathfinder);
}

} // namespace HexCrawl
