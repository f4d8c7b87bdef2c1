/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/behaviors/BerserkerStrategy.hpp"

namespace HexCrawl {

AIDecision BerserkerStrategy::decide(const CombatEntity& self, const TargetingContext& context,
                                     ThreatManager&, HexPathfinder& pathfinder) {
    const int priority = self.getHpPercentage() < 0.5 ? AIPriority::EMERGENCY : AIPriority::HIGH;

    const CombatEntity* target = weakest(context.enemies);
    if (target == nullptr) {
        return AIDecision::wait("Berserker waiting for targets");
    }

    if (isAdjacent(self, *target)) {
        return AIDecision::attack(target->getId(), "Berserker attacking weakest enemy", priority);
    }

    if (auto step = approach(self, target->getPosition(), context, pathfinder)) {
        return AIDecision::move(*step, "Berserker charging toward weakest enemy", priority);
    }

    // Path to the weakest is blocked; hit whatever is in reach
    if (const CombatEntity* close = nearest(self, withinRange(self, context.enemies, 1))) {
        return AIDecision::attack(close->getId(), "Berserker attacking adjacent enemy", priority);
    }

    return AIDecision::wait("Berserker waiting for targets");
}

} // namespace HexCrawl
