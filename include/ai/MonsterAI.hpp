/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MONSTER_AI_HPP
#define MONSTER_AI_HPP

#include "ai/AIDecision.hpp"
#include "ai/AIStrategy.hpp"
#include "ai/MonsterBehavior.hpp"
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace HexCrawl {

struct DecisionStats {
    int totalDecisions{0};
    std::map<ActionVariant, int> byVariant;
    double averagePriority{0.0};
    double averageConfidence{0.0};
};

/**
 * @brief Per-monster decision maker.
 *
 * Scripted behaviors are tried first, highest priority first; the first
 * one whose conditions hold and whose action resolves wins. Otherwise the
 * AI variant's strategy decides.
 */
class MonsterAI {
public:
    static constexpr size_t MAX_DECISION_HISTORY = 20;

    explicit MonsterAI(AIVariant variant = AIVariant::Aggressive,
                       std::vector<MonsterBehavior> behaviors = {});

    MonsterAI(MonsterAI&&) noexcept = default;
    MonsterAI& operator=(MonsterAI&&) noexcept = default;

    AIDecision makeDecision(const CombatEntity& self, const TargetingContext& context,
                            ThreatManager& threat, HexPathfinder& pathfinder);

    AIVariant getVariant() const { return m_variant; }
    void setVariant(AIVariant variant);

    const std::vector<MonsterBehavior>& getBehaviors() const { return m_behaviors; }
    void addBehavior(const MonsterBehavior& behavior);
    bool removeBehavior(const std::string& behaviorId);

    const std::optional<AIDecision>& getLastDecision() const { return m_lastDecision; }
    std::vector<AIDecision> getDecisionHistory() const;
    DecisionStats getDecisionStats() const;

    void resetForEncounter();

private:
    AIVariant m_variant;
    std::unique_ptr<AIStrategy> m_strategy;
    std::vector<MonsterBehavior> m_behaviors;
    std::optional<AIDecision> m_lastDecision;
    std::deque<AIDecision> m_history;

    void sortBehaviors();
    void recordDecision(const AIDecision& decision);

    std::optional<AIDecision> evaluateBehaviors(const CombatEntity& self,
                                                const TargetingContext& context,
                                                HexPathfinder& pathfinder) const;
    bool evaluateCondition(const BehaviorCondition& condition, const CombatEntity& self,
                           const TargetingContext& context) const;
    std::optional<AIDecision> resolveAction(const MonsterBehavior& behavior,
                                            const CombatEntity& self,
                                            const TargetingContext& context,
                                            HexPathfinder& pathfinder) const;
    const CombatEntity* selectByTarget(TargetSelector selector, const CombatEntity& self,
                                       const TargetingContext& context) const;
};

} // namespace HexCrawl

#endif // MONSTER_AI_HPP
