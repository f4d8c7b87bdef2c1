/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/behaviors/DefensiveStrategy.hpp"

namespace HexCrawl {

namespace {
constexpr double RETREAT_THRESHOLD = 0.4;
}

AIDecision DefensiveStrategy::decide(const CombatEntity& self, const TargetingContext& context,
                                     ThreatManager& threat, HexPathfinder&) {
    if (self.getHpPercentage() < RETREAT_THRESHOLD) {
        if (auto cell = retreat(self, context.enemies, context)) {
            return AIDecision::move(*cell, "Defensive retreat when wounded", AIPriority::HIGH);
        }
    }

    const auto adjacent = withinRange(self, context.enemies, 1);
    if (!adjacent.empty()) {
        const CombatEntity* target = adjacent.front();
        if (threat.isEnabled() && adjacent.size() > 1) {
            TargetingResult pick = threat.selectTarget(toCandidates(adjacent));
            if (pick.hasTarget()) {
                if (const CombatEntity* picked = findById(adjacent, *pick.targetId)) {
                    target = picked;
                }
            }
        }
        return AIDecision::attack(target->getId(), "Defensive counterattack", AIPriority::MEDIUM);
    }

    return AIDecision::wait("Defensive stance");
}

} // namespace HexCrawl
