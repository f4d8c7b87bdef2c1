/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TACTICAL_STRATEGY_HPP
#define TACTICAL_STRATEGY_HPP

#include "ai/AIStrategy.hpp"

namespace HexCrawl {

/**
 * @brief Scores enemies by missing HP and durability, then positions within
 * striking distance of the best one before attacking
 */
class TacticalStrategy : public AIStrategy {
public:
    AIDecision decide(const CombatEntity& self, const TargetingContext& context,
                      ThreatManager& threat, HexPathfinder& pathfinder) override;

    [[nodiscard]] AIVariant getVariant() const override { return AIVariant::Tactical; }

    // (1 - hp%) * 50 + maxHp * 0.1
    static double tacticalScore(const CombatEntity& enemy);
    static const CombatEntity* bestTacticalTarget(const std::vector<const CombatEntity*>& enemies);

protected:
    const CombatEntity* selectFallbackTarget(const CombatEntity& self,
                                             const TargetingContext& context) const override;
};

} // namespace HexCrawl

#endif // TACTICAL_STRATEGY_HPP
