/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SUPPORT_STRATEGY_HPP
#define SUPPORT_STRATEGY_HPP

#include "ai/AIStrategy.hpp"
#include "ai/behaviors/DefensiveStrategy.hpp"

namespace HexCrawl {

/**
 * @brief Heals the most wounded ally below 60% HP with its first ready
 * healing ability, otherwise behaves defensively
 */
class SupportStrategy : public AIStrategy {
public:
    AIDecision decide(const CombatEntity& self, const TargetingContext& context,
                      ThreatManager& threat, HexPathfinder& pathfinder) override;

    [[nodiscard]] AIVariant getVariant() const override { return AIVariant::Support; }

    static constexpr double WOUNDED_THRESHOLD = 0.6;

private:
    DefensiveStrategy m_defensive;
};

} // namespace HexCrawl

#endif // SUPPORT_STRATEGY_HPP
