/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BERSERKER_STRATEGY_HPP
#define BERSERKER_STRATEGY_HPP

#include "ai/AIStrategy.hpp"

namespace HexCrawl {

// Charges the weakest enemy; escalates to emergency priority below 50% HP
class BerserkerStrategy : public AIStrategy {
public:
    AIDecision decide(const CombatEntity& self, const TargetingContext& context,
                      ThreatManager& threat, HexPathfinder& pathfinder) override;

    [[nodiscard]] AIVariant getVariant() const override { return AIVariant::Berserker; }
};

} // namespace HexCrawl

#endif // BERSERKER_STRATEGY_HPP
