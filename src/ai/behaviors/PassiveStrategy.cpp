/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/behaviors/PassiveStrategy.hpp"

namespace HexCrawl {

AIDecision PassiveStrategy::decide(const CombatEntity& self, const TargetingContext& context,
                                   ThreatManager&, HexPathfinder&) {
    const auto threatening = withinRange(self, context.enemies, 1);
    if (!threatening.empty()) {
        return AIDecision::attack(threatening.front()->getId(), "Passive defense when threatened",
                                  AIPriority::MEDIUM);
    }
    return AIDecision::wait("Passive waiting", AIPriority::MINIMAL);
}

} // namespace HexCrawl
