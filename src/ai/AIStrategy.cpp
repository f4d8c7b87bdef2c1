/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/AIStrategy.hpp"
#include "ai/behaviors/AggressiveStrategy.hpp"
#include "ai/behaviors/BerserkerStrategy.hpp"
#include "ai/behaviors/DefensiveStrategy.hpp"
#include "ai/behaviors/PassiveStrategy.hpp"
#include "ai/behaviors/SupportStrategy.hpp"
#include "ai/behaviors/TacticalStrategy.hpp"
#include "ai/pathfinding/HexGrid.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <limits>

namespace HexCrawl {

std::optional<AIVariant> aiVariantFromName(const std::string& name) {
    if (name == "aggressive") return AIVariant::Aggressive;
    if (name == "defensive") return AIVariant::Defensive;
    if (name == "tactical") return AIVariant::Tactical;
    if (name == "berserker") return AIVariant::Berserker;
    if (name == "support") return AIVariant::Support;
    if (name == "passive") return AIVariant::Passive;
    return std::nullopt;
}

std::string toString(AIVariant variant) {
    switch (variant) {
    case AIVariant::Aggressive:
        return "aggressive";
    case AIVariant::Defensive:
        return "defensive";
    case AIVariant::Tactical:
        return "tactical";
    case AIVariant::Berserker:
        return "berserker";
    case AIVariant::Support:
        return "support";
    case AIVariant::Passive:
        return "passive";
    }
    return "unknown";
}

std::unique_ptr<AIStrategy> AIStrategy::create(AIVariant variant) {
    switch (variant) {
    case AIVariant::Aggressive:
        return std::make_unique<AggressiveStrategy>();
    case AIVariant::Defensive:
        return std::make_unique<DefensiveStrategy>();
    case AIVariant::Tactical:
        return std::make_unique<TacticalStrategy>();
    case AIVariant::Berserker:
        return std::make_unique<BerserkerStrategy>();
    case AIVariant::Support:
        return std::make_unique<SupportStrategy>();
    case AIVariant::Passive:
        return std::make_unique<PassiveStrategy>();
    }
    AI_WARN("Unknown AI variant, falling back to passive");
    return std::make_unique<PassiveStrategy>();
}

const CombatEntity* AIStrategy::nearest(const CombatEntity& self,
                                        const std::vector<const CombatEntity*>& entities) {
    const CombatEntity* best = nullptr;
    int bestDistance = std::numeric_limits<int>::max();
    for (const CombatEntity* entity : entities) {
        const int distance = hexDistance(self.getPosition(), entity->getPosition());
        if (distance < bestDistance) {
            bestDistance = distance;
            best = entity;
        }
    }
    return best;
}

const CombatEntity* AIStrategy::weakest(const std::vector<const CombatEntity*>& entities) {
    const CombatEntity* best = nullptr;
    for (const CombatEntity* entity : entities) {
        if (best == nullptr || entity->getCurrentHp() < best->getCurrentHp()) {
            best = entity;
        }
    }
    return best;
}

const CombatEntity* AIStrategy::strongest(const std::vector<const CombatEntity*>& entities) {
    const CombatEntity* best = nullptr;
    for (const CombatEntity* entity : entities) {
        if (best == nullptr || entity->getCurrentHp() > best->getCurrentHp()) {
            best = entity;
        }
    }
    return best;
}

const CombatEntity* AIStrategy::findById(const std::vector<const CombatEntity*>& entities,
                                         const std::string& id) {
    auto it = std::find_if(entities.begin(), entities.end(),
                           [&id](const CombatEntity* e) { return e->getId() == id; });
    return it != entities.end() ? *it : nullptr;
}

std::vector<const CombatEntity*>
AIStrategy::withinRange(const CombatEntity& self, const std::vector<const CombatEntity*>& entities,
                        int range) {
    std::vector<const CombatEntity*> result;
    for (const CombatEntity* entity : entities) {
        if (hexDistance(self.getPosition(), entity->getPosition()) <= range) {
            result.push_back(entity);
        }
    }
    return result;
}

std::vector<TargetCandidate>
AIStrategy::toCandidates(const std::vector<const CombatEntity*>& entities) {
    std::vector<TargetCandidate> candidates;
    candidates.reserve(entities.size());
    for (const CombatEntity* entity : entities) {
        candidates.push_back(entity->toTargetCandidate());
    }
    return candidates;
}

std::optional<HexCoordinate> AIStrategy::approach(const CombatEntity& self,
                                                  const HexCoordinate& target,
                                                  const TargetingContext& context,
                                                  HexPathfinder& pathfinder) {
    if (!self.canMove()) {
        return std::nullopt;
    }

    PositionSet blocked = context.obstacles;
    blocked.insert(context.occupied.begin(), context.occupied.end());
    blocked.erase(self.getPosition());

    return pathfinder.stepToward(self.getPosition(), target, blocked,
                                 self.movement().getMovementRange());
}

std::optional<HexCoordinate> AIStrategy::retreat(const CombatEntity& self,
                                                 const std::vector<const CombatEntity*>& threats,
                                                 const TargetingContext& context) {
    if (!self.canMove() || threats.empty()) {
        return std::nullopt;
    }

    auto closestThreat = [&threats](const HexCoordinate& cell) {
        int closest = std::numeric_limits<int>::max();
        for (const CombatEntity* threat : threats) {
            closest = std::min(closest, hexDistance(cell, threat->getPosition()));
        }
        return closest;
    };

    int bestDistance = closestThreat(self.getPosition());
    std::optional<HexCoordinate> best;
    for (const auto& cell : reachablePositions(self.getPosition(), self.movement().getMovementRange(),
                                               context.obstacles, context.occupied)) {
        const int distance = closestThreat(cell);
        if (distance > bestDistance) {
            bestDistance = distance;
            best = cell;
        }
    }
    return best;
}

const CombatEntity* AIStrategy::selectPrimaryTarget(const CombatEntity& self,
                                                    const TargetingContext& context,
                                                    ThreatManager& threat) const {
    if (context.enemies.empty()) {
        return nullptr;
    }

    if (threat.isEnabled()) {
        TargetingResult result = threat.selectTarget(toCandidates(context.enemies));
        if (result.hasTarget()) {
            AI_DEBUG(self.getName() + " threat target " + *result.targetId + ": " + result.reason);
            if (const CombatEntity* target = findById(context.enemies, *result.targetId)) {
                return target;
            }
        }
    }

    return selectFallbackTarget(self, context);
}

const CombatEntity* AIStrategy::selectFallbackTarget(const CombatEntity& self,
                                                     const TargetingContext& context) const {
    return nearest(self, context.enemies);
}

bool AIStrategy::isAdjacent(const CombatEntity& self, const CombatEntity& other) {
    return hexDistance(self.getPosition(), other.getPosition()) <= 1;
}

} // namespace HexCrawl
