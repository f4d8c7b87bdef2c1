/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PASSIVE_STRATEGY_HPP
#define PASSIVE_STRATEGY_HPP

#include "ai/AIStrategy.hpp"

namespace HexCrawl {

// Only strikes back at adjacent enemies
class PassiveStrategy : public AIStrategy {
public:
    AIDecision decide(const CombatEntity& self, const TargetingContext& context,
                      ThreatManager& threat, HexPathfinder& pathfinder) override;

    [[nodiscard]] AIVariant getVariant() const override { return AIVariant::Passive; }
};

} // namespace HexCrawl

#endif // PASSIVE_STRATEGY_HPP
