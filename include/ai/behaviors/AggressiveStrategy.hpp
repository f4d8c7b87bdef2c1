/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AGGRESSIVE_STRATEGY_HPP
#define AGGRESSIVE_STRATEGY_HPP

#include "ai/AIStrategy.hpp"

namespace HexCrawl {

/**
 * @brief Closes in and attacks, preferring the threat table's pick
 *
 * Without threat data the weakest enemy is the primary target.
 */
class AggressiveStrategy : public AIStrategy {
public:
    AIDecision decide(const CombatEntity& self, const TargetingContext& context,
                      ThreatManager& threat, HexPathfinder& pathfinder) override;

    [[nodiscard]] AIVariant getVariant() const override { return AIVariant::Aggressive; }

protected:
    const CombatEntity* selectFallbackTarget(const CombatEntity& self,
                                             const TargetingContext& context) const override;
};

} // namespace HexCrawl

#endif // AGGRESSIVE_STRATEGY_HPP
