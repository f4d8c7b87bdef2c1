/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMBAT_CONTROLLER_HPP
#define COMBAT_CONTROLLER_HPP

/**
 * @file CombatController.hpp
 * @brief Resolves one round's actions against the encounter state
 *
 * CombatController handles:
 * - Movement legality (range, occupancy, path around obstacles)
 * - Melee attacks and abilities, including area of effect
 * - Status-effect application with seeded chance rolls
 * - Threat bookkeeping on monsters for player damage and healing
 *
 * Ownership: GameLoop owns the controller; GameStateManager is borrowed per call.
 */

#include "ai/pathfinding/HexPathfinder.hpp"
#include "controllers/combat/CombatAction.hpp"
#include "entities/components/StatusEffectsComponent.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace HexCrawl {

class GameStateManager;
class CombatEntity;
struct AbilityDefinition;

struct TargetHit {
    std::string targetId;
    int damageDealt{0};
    int blocked{0};
    int healingDone{0};
    bool targetDied{false};
    std::vector<StatusEffectType> effectsApplied;
};

/**
 * @brief What happened when one action was resolved
 */
struct ActionOutcome {
    std::string entityId;
    ActionVariant variant{ActionVariant::Wait};
    bool success{false};
    std::string reason;
    std::optional<std::string> abilityId;
    std::optional<HexCoordinate> newPosition;
    std::vector<TargetHit> hits;

    int totalDamage() const;
    int totalHealing() const;
};

class CombatController {
public:
    static constexpr uint32_t DEFAULT_RNG_SEED = 1337;
    static constexpr int MELEE_RANGE = 1;

    explicit CombatController(uint32_t rngSeed = DEFAULT_RNG_SEED,
                              HexPathfinder pathfinder = HexPathfinder{});

    /**
     * @brief Resolves a single action; never throws for rule violations
     */
    ActionOutcome resolve(const CombatAction& action, GameStateManager& state);

    /**
     * @brief Resolves actions in the given order
     *
     * An exception escaping one action is logged and turned into a failed
     * outcome; the remaining actions still resolve.
     */
    std::vector<ActionOutcome> resolveAll(const std::vector<CombatAction>& actions,
                                          GameStateManager& state);

    [[nodiscard]] HexPathfinder& getPathfinder() { return m_pathfinder; }

private:
    ActionOutcome resolveMove(CombatEntity& actor, const CombatAction& action,
                              GameStateManager& state);
    ActionOutcome resolveAttack(CombatEntity& actor, const CombatAction& action,
                                GameStateManager& state);
    ActionOutcome resolveAbility(CombatEntity& actor, const CombatAction& action,
                                 GameStateManager& state);

    TargetHit applyAbilityTo(CombatEntity& actor, const AbilityDefinition& ability,
                             CombatEntity& target, GameStateManager& state);
    void applyStatusEffects(const AbilityDefinition& ability, CombatEntity& target,
                            TargetHit& hit);
    void recordThreat(const CombatEntity& actor, const AbilityDefinition* ability,
                      CombatEntity& target, const TargetHit& hit, GameStateManager& state);

    static ActionOutcome failure(const CombatAction& action, const std::string& reason);

    std::mt19937 m_rng;
    HexPathfinder m_pathfinder;
};

} // namespace HexCrawl

#endif // COMBAT_CONTROLLER_HPP
