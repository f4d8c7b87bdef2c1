/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AI_STRATEGY_HPP
#define AI_STRATEGY_HPP

#include "ai/AIDecision.hpp"
#include "ai/pathfinding/HexPathfinder.hpp"
#include "ai/threat/ThreatManager.hpp"
#include "entities/CombatEntity.hpp"
#include "utils/HexCoordinate.hpp"
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace HexCrawl {

enum class AIVariant { Aggressive, Defensive, Tactical, Berserker, Support, Passive };

std::optional<AIVariant> aiVariantFromName(const std::string& name);
std::string toString(AIVariant variant);

inline std::ostream& operator<<(std::ostream& os, AIVariant variant) {
    return os << toString(variant);
}

/**
 * @brief Board snapshot handed to a monster for one decision
 *
 * Pointers are non-owning and only valid for the duration of the call.
 * Dead and untargetable entities are left out of both lists.
 */
struct TargetingContext {
    std::vector<const CombatEntity*> allies;
    std::vector<const CombatEntity*> enemies;
    PositionSet obstacles;
    PositionSet occupied;
    int currentRound{1};
};

/**
 * @brief Decision policy for one AI variant.
 *
 * Strategies are stateless; all per-monster memory lives in ThreatManager
 * and MonsterAI.
 */
class AIStrategy {
public:
    virtual ~AIStrategy() = default;

    virtual AIDecision decide(const CombatEntity& self, const TargetingContext& context,
                              ThreatManager& threat, HexPathfinder& pathfinder) = 0;

    [[nodiscard]] virtual AIVariant getVariant() const = 0;
    [[nodiscard]] std::string getName() const { return toString(getVariant()); }

    static std::unique_ptr<AIStrategy> create(AIVariant variant);

    // --- Shared board helpers ---

    // Closest by hex distance; ties keep list order
    static const CombatEntity* nearest(const CombatEntity& self,
                                       const std::vector<const CombatEntity*>& entities);
    // Lowest current HP; ties keep list order
    static const CombatEntity* weakest(const std::vector<const CombatEntity*>& entities);
    // Highest current HP; ties keep list order
    static const CombatEntity* strongest(const std::vector<const CombatEntity*>& entities);
    static const CombatEntity* findById(const std::vector<const CombatEntity*>& entities,
                                        const std::string& id);

    static std::vector<const CombatEntity*>
    withinRange(const CombatEntity& self, const std::vector<const CombatEntity*>& entities,
                int range);

    static std::vector<TargetCandidate>
    toCandidates(const std::vector<const CombatEntity*>& entities);

    /**
     * @brief Next cell toward target within this round's movement range
     *
     * Routes around obstacles and other combatants.
     */
    static std::optional<HexCoordinate> approach(const CombatEntity& self,
                                                 const HexCoordinate& target,
                                                 const TargetingContext& context,
                                                 HexPathfinder& pathfinder);

    /**
     * @brief Reachable cell that maximizes the distance to the closest enemy
     *
     * Returns nullopt when no reachable cell is farther away than the
     * current one.
     */
    static std::optional<HexCoordinate> retreat(const CombatEntity& self,
                                                const std::vector<const CombatEntity*>& threats,
                                                const TargetingContext& context);

protected:
    /**
     * @brief Threat-driven target when the threat table is enabled,
     * otherwise the variant's own fallback pick
     */
    const CombatEntity* selectPrimaryTarget(const CombatEntity& self,
                                            const TargetingContext& context,
                                            ThreatManager& threat) const;

    virtual const CombatEntity* selectFallbackTarget(const CombatEntity& self,
                                                     const TargetingContext& context) const;

    static bool isAdjacent(const CombatEntity& self, const CombatEntity& other);
};

} // namespace HexCrawl

#endif // AI_STRATEGY_HPP
