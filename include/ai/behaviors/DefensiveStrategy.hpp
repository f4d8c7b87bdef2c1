/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DEFENSIVE_STRATEGY_HPP
#define DEFENSIVE_STRATEGY_HPP

#include "ai/AIStrategy.hpp"

namespace HexCrawl {

/**
 * @brief Holds ground, counterattacks adjacent enemies and retreats when
 * below 40% HP
 */
class DefensiveStrategy : public AIStrategy {
public:
    AIDecision decide(const CombatEntity& self, const TargetingContext& context,
                      ThreatManager& threat, HexPathfinder& pathfinder) override;

    [[nodiscard]] AIVariant getVariant() const override { return AIVariant::Defensive; }
};

} // namespace HexCrawl

#endif // DEFENSIVE_STRATEGY_HPP
