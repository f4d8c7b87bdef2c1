/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/behaviors/AggressiveStrategy.hpp"

namespace HexCrawl {

AIDecision AggressiveStrategy::decide(const CombatEntity& self, const TargetingContext& context,
                                      ThreatManager& threat, HexPathfinder& pathfinder) {
    const CombatEntity* primary = selectPrimaryTarget(self, context, threat);
    if (primary != nullptr && isAdjacent(self, *primary)) {
        return AIDecision::attack(primary->getId(), "Aggressive AI attacking primary target");
    }

    // Anything within two cells is worth engaging before chasing the primary
    if (const CombatEntity* close = nearest(self, withinRange(self, context.enemies, 2))) {
        if (isAdjacent(self, *close)) {
            return AIDecision::attack(close->getId(), "Aggressive AI attacking nearest enemy");
        }
        if (auto step = approach(self, close->getPosition(), context, pathfinder)) {
            return AIDecision::move(*step, "Aggressive AI closing on nearest enemy",
                                    AIPriority::HIGH);
        }
    }

    if (primary != nullptr) {
        if (auto step = approach(self, primary->getPosition(), context, pathfinder)) {
            return AIDecision::move(*step, "Moving toward highest threat target");
        }
    }

    return AIDecision::wait("No targets available");
}

const CombatEntity* AggressiveStrategy::selectFallbackTarget(const CombatEntity&,
                                                             const TargetingContext& context) const {
    return weakest(context.enemies);
}

} // namespace HexCrawl
