/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/MonsterAI.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <exception>
#include <type_traits>

namespace HexCrawl {

MonsterAI::MonsterAI(AIVariant variant, std::vector<MonsterBehavior> behaviors)
    : m_variant(variant),
      m_strategy(AIStrategy::create(variant)),
      m_behaviors(std::move(behaviors)) {
    sortBehaviors();
}

void MonsterAI::setVariant(AIVariant variant) {
    if (variant == m_variant) {
        return;
    }
    m_variant = variant;
    m_strategy = AIStrategy::create(variant);
}

void MonsterAI::addBehavior(const MonsterBehavior& behavior) {
    auto it = std::find_if(m_behaviors.begin(), m_behaviors.end(),
                           [&behavior](const MonsterBehavior& b) { return b.id == behavior.id; });
    if (it != m_behaviors.end()) {
        *it = behavior;
    } else {
        m_behaviors.push_back(behavior);
    }
    sortBehaviors();
}

bool MonsterAI::removeBehavior(const std::string& behaviorId) {
    auto it = std::find_if(m_behaviors.begin(), m_behaviors.end(),
                           [&behaviorId](const MonsterBehavior& b) { return b.id == behaviorId; });
    if (it == m_behaviors.end()) {
        return false;
    }
    m_behaviors.erase(it);
    return true;
}

void MonsterAI::sortBehaviors() {
    std::stable_sort(m_behaviors.begin(), m_behaviors.end(),
                     [](const MonsterBehavior& a, const MonsterBehavior& b) {
                         return a.priority > b.priority;
                     });
}

AIDecision MonsterAI::makeDecision(const CombatEntity& self, const TargetingContext& context,
                                   ThreatManager& threat, HexPathfinder& pathfinder) {
    AIDecision decision;

    if (!self.canAct()) {
        decision = AIDecision::wait("Unable to act", AIPriority::MINIMAL, 1.0);
        recordDecision(decision);
        return decision;
    }

    try {
        if (auto scripted = evaluateBehaviors(self, context, pathfinder)) {
            decision = std::move(*scripted);
        } else {
            decision = m_strategy->decide(self, context, threat, pathfinder);
        }
    } catch (const std::exception& e) {
        AI_ERROR("Decision failed for " + self.getId() + ": " + e.what());
        decision = AIDecision::wait("Decision error, holding position", AIPriority::MINIMAL, 0.0);
    }

    AI_DEBUG(self.getName() + " (" + m_strategy->getName() + ") decided " +
             toString(decision.variant()) + ": " + decision.reasoning);
    recordDecision(decision);
    return decision;
}

void MonsterAI::recordDecision(const AIDecision& decision) {
    m_lastDecision = decision;
    m_history.push_back(decision);
    while (m_history.size() > MAX_DECISION_HISTORY) {
        m_history.pop_front();
    }
}

std::vector<AIDecision> MonsterAI::getDecisionHistory() const {
    return std::vector<AIDecision>(m_history.begin(), m_history.end());
}

DecisionStats MonsterAI::getDecisionStats() const {
    DecisionStats stats;
    stats.totalDecisions = static_cast<int>(m_history.size());
    if (m_history.empty()) {
        return stats;
    }

    double prioritySum = 0.0;
    double confidenceSum = 0.0;
    for (const auto& decision : m_history) {
        ++stats.byVariant[decision.variant()];
        prioritySum += decision.priority;
        confidenceSum += decision.confidence;
    }
    stats.averagePriority = prioritySum / static_cast<double>(m_history.size());
    stats.averageConfidence = confidenceSum / static_cast<double>(m_history.size());
    return stats;
}

void MonsterAI::resetForEncounter() {
    m_lastDecision.reset();
    m_history.clear();
}

std::optional<AIDecision> MonsterAI::evaluateBehaviors(const CombatEntity& self,
                                                       const TargetingContext& context,
                                                       HexPathfinder& pathfinder) const {
    for (const auto& behavior : m_behaviors) {
        const bool conditionsHold =
            std::all_of(behavior.conditions.begin(), behavior.conditions.end(),
                        [&](const BehaviorCondition& c) { return evaluateCondition(c, self, context); });
        if (!conditionsHold) {
            continue;
        }

        if (auto decision = resolveAction(behavior, self, context, pathfinder)) {
            decision->reasoning = "Behavior: " + behavior.name;
            return decision;
        }
    }
    return std::nullopt;
}

bool MonsterAI::evaluateCondition(const BehaviorCondition& condition, const CombatEntity& self,
                                  const TargetingContext& context) const {
    return std::visit([&](auto&& arg) -> bool {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, HpBelow>) {
            return self.getHpPercentage() < arg.threshold;
        } else if constexpr (std::is_same_v<T, HpAbove>) {
            return self.getHpPercentage() > arg.threshold;
        } else if constexpr (std::is_same_v<T, EnemyInRange>) {
            return !AIStrategy::withinRange(self, context.enemies, arg.range).empty();
        } else if constexpr (std::is_same_v<T, AllyInDanger>) {
            return std::any_of(context.allies.begin(), context.allies.end(),
                               [&arg](const CombatEntity* ally) {
                                   return ally->getHpPercentage() < arg.threshold;
                               });
        } else if constexpr (std::is_same_v<T, CooldownReady>) {
            return self.abilities().hasAbility(arg.abilityId) &&
                   !self.abilities().isOnCooldown(arg.abilityId);
        } else {
            static_assert(std::is_same_v<T, RoundAtLeast>, "unhandled condition kind");
            return context.currentRound >= arg.round;
        }
    }, condition);
}

std::optional<AIDecision> MonsterAI::resolveAction(const MonsterBehavior& behavior,
                                                   const CombatEntity& self,
                                                   const TargetingContext& context,
                                                   HexPathfinder& pathfinder) const {
    const int priority = behavior.priority;

    return std::visit([&](auto&& arg) -> std::optional<AIDecision> {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, UseAbility>) {
            const AbilityDefinition* ability = self.abilities().getAbility(arg.abilityId);
            if (ability == nullptr || !self.abilities().canUseAbility(arg.abilityId).success) {
                return std::nullopt;
            }
            const CombatEntity* target = selectByTarget(arg.target, self, context);
            if (target == nullptr ||
                hexDistance(self.getPosition(), target->getPosition()) > ability->range) {
                return std::nullopt;
            }
            return AIDecision::ability(arg.abilityId, target->getId(), "", priority);
        } else if constexpr (std::is_same_v<T, MoveTo>) {
            if (arg.position) {
                if (*arg.position == self.getPosition()) {
                    return std::nullopt;
                }
                const bool direct =
                    hexDistance(self.getPosition(), *arg.position) <=
                        self.movement().getMovementRange() &&
                    context.obstacles.count(*arg.position) == 0 &&
                    context.occupied.count(*arg.position) == 0;
                if (direct) {
                    return AIDecision::move(*arg.position, "", priority);
                }
                if (auto step = AIStrategy::approach(self, *arg.position, context, pathfinder)) {
                    return AIDecision::move(*step, "", priority);
                }
                return std::nullopt;
            }
            const CombatEntity* target = selectByTarget(arg.target, self, context);
            if (target == nullptr || target == &self) {
                return std::nullopt;
            }
            if (auto step = AIStrategy::approach(self, target->getPosition(), context, pathfinder)) {
                return AIDecision::move(*step, "", priority);
            }
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, Flee>) {
            const CombatEntity* threat = selectByTarget(arg.from, self, context);
            if (threat == nullptr || threat == &self) {
                return std::nullopt;
            }
            if (auto cell = AIStrategy::retreat(self, {threat}, context)) {
                return AIDecision::move(*cell, "", priority);
            }
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, FocusTarget>) {
            const CombatEntity* target = selectByTarget(arg.target, self, context);
            if (target == nullptr || target == &self) {
                return std::nullopt;
            }
            if (hexDistance(self.getPosition(), target->getPosition()) <= 1) {
                return AIDecision::attack(target->getId(), "", priority);
            }
            if (auto step = AIStrategy::approach(self, target->getPosition(), context, pathfinder)) {
                return AIDecision::move(*step, "", priority);
            }
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, CallForHelp>) {
            if (!self.abilities().canUseAbility(arg.abilityId).success) {
                return std::nullopt;
            }
            return AIDecision::ability(arg.abilityId, std::nullopt, "", priority);
        } else {
            static_assert(std::is_same_v<T, Hold>, "unhandled action kind");
            return AIDecision::wait("", priority, 0.5);
        }
    }, behavior.action);
}

const CombatEntity* MonsterAI::selectByTarget(TargetSelector selector, const CombatEntity& self,
                                              const TargetingContext& context) const {
    switch (selector) {
    case TargetSelector::NearestEnemy:
        return AIStrategy::nearest(self, context.enemies);
    case TargetSelector::WeakestEnemy:
        return AIStrategy::weakest(context.enemies);
    case TargetSelector::StrongestEnemy:
        return AIStrategy::strongest(context.enemies);
    case TargetSelector::NearestAlly:
        return AIStrategy::nearest(self, context.allies);
    case TargetSelector::Self:
        return &self;
    }
    return nullptr;
}

} // namespace HexCrawl
