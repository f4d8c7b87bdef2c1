/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/behaviors/TacticalStrategy.hpp"
#include "ai/pathfinding/HexGrid.hpp"

namespace HexCrawl {

double TacticalStrategy::tacticalScore(const CombatEntity& enemy) {
    const double lowHpBonus = (1.0 - enemy.getHpPercentage()) * 50.0;
    return lowHpBonus + enemy.getMaxHp() * 0.1;
}

const CombatEntity*
TacticalStrategy::bestTacticalTarget(const std::vector<const CombatEntity*>& enemies) {
    const CombatEntity* best = nullptr;
    double bestScore = 0.0;
    for (const CombatEntity* enemy : enemies) {
        const double score = tacticalScore(*enemy);
        if (best == nullptr || score > bestScore) {
            best = enemy;
            bestScore = score;
        }
    }
    return best;
}

AIDecision TacticalStrategy::decide(const CombatEntity& self, const TargetingContext& context,
                                    ThreatManager& threat, HexPathfinder& pathfinder) {
    const CombatEntity* target = selectPrimaryTarget(self, context, threat);
    if (target == nullptr) {
        return AIDecision::wait("Waiting for tactical opportunity");
    }

    if (isAdjacent(self, *target)) {
        return AIDecision::attack(target->getId(), "Tactical target selection");
    }

    if (self.canMove()) {
        const auto reachable = reachablePositions(self.getPosition(),
                                                  self.movement().getMovementRange(),
                                                  context.obstacles, context.occupied);
        const PositionSet reachableSet(reachable.begin(), reachable.end());

        const TacticalPositions positions = tacticalPositions(
            self.getPosition(), target->getPosition(), self.movement().getMovementRange());
        for (const auto& cell : positions.aggressive) {
            if (reachableSet.count(cell) > 0) {
                return AIDecision::move(cell, "Tactical positioning");
            }
        }

        if (auto step = approach(self, target->getPosition(), context, pathfinder)) {
            return AIDecision::move(*step, "Tactical advance");
        }
    }

    return AIDecision::wait("Waiting for tactical opportunity");
}

const CombatEntity* TacticalStrategy::selectFallbackTarget(const CombatEntity&,
                                                           const TargetingContext& context) const {
    return bestTacticalTarget(context.enemies);
}

} // namespace HexCrawl
