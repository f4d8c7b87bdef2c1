/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/combat/CombatController.hpp"
#include "ai/pathfinding/HexGrid.hpp"
#include "core/Logger.hpp"
#include "entities/CombatEntity.hpp"
#include "entities/Monster.hpp"
#include "entities/Player.hpp"
#include "managers/GameStateManager.hpp"
#include <exception>

namespace HexCrawl {

int ActionOutcome::totalDamage() const {
    int total = 0;
    for (const auto& hit : hits) {
        total += hit.damageDealt;
    }
    return total;
}

int ActionOutcome::totalHealing() const {
    int total = 0;
    for (const auto& hit : hits) {
        total += hit.healingDone;
    }
    return total;
}

CombatController::CombatController(uint32_t rngSeed, HexPathfinder pathfinder)
    : m_rng(rngSeed), m_pathfinder(std::move(pathfinder)) {}

ActionOutcome CombatController::failure(const CombatAction& action, const std::string& reason) {
    ActionOutcome outcome;
    outcome.entityId = action.entityId;
    outcome.variant = action.variant;
    outcome.success = false;
    outcome.reason = reason;
    outcome.abilityId = action.abilityId;
    return outcome;
}

std::vector<ActionOutcome> CombatController::resolveAll(const std::vector<CombatAction>& actions,
                                                        GameStateManager& state) {
    std::vector<ActionOutcome> outcomes;
    outcomes.reserve(actions.size());

    for (const auto& action : actions) {
        try {
            outcomes.push_back(resolve(action, state));
        } catch (const std::exception& e) {
            COMBAT_ERROR("Action " + toString(action.variant) + " by " + action.entityId +
                         " failed: " + e.what());
            outcomes.push_back(failure(action, std::string("Internal error: ") + e.what()));
        }
    }
    return outcomes;
}

ActionOutcome CombatController::resolve(const CombatAction& action, GameStateManager& state) {
    CombatEntity* actor = state.findEntity(action.entityId);
    if (actor == nullptr) {
        return failure(action, "Entity " + action.entityId + " not found");
    }
    if (!actor->isAlive()) {
        return failure(action, "Entity is dead");
    }
    if (auto invalid = action.validateFields()) {
        return failure(action, *invalid);
    }

    if (action.variant == ActionVariant::Wait) {
        ActionOutcome outcome;
        outcome.entityId = action.entityId;
        outcome.variant = ActionVariant::Wait;
        outcome.success = true;
        return outcome;
    }

    if (!actor->canAct()) {
        return failure(action, "Entity cannot act this round");
    }

    switch (action.variant) {
    case ActionVariant::Move:
        return resolveMove(*actor, action, state);
    case ActionVariant::Attack:
        return resolveAttack(*actor, action, state);
    case ActionVariant::Ability:
        return resolveAbility(*actor, action, state);
    case ActionVariant::Wait:
        break;
    }
    return failure(action, "Unhandled action variant");
}

ActionOutcome CombatController::resolveMove(CombatEntity& actor, const CombatAction& action,
                                            GameStateManager& state) {
    const HexCoordinate from = actor.getPosition();
    const HexCoordinate& destination = *action.targetPosition;
    if (destination == from) {
        return failure(action, "Already at destination");
    }

    const PositionSet& occupied = state.getOccupiedPositions();
    const PositionSet& obstacles = state.getObstacles();
    const int range = actor.movement().getMovementRange();

    const bool basicChecksPass = !actor.movement().hasMovedThisRound() &&
                                 hexDistance(from, destination) <= range &&
                                 occupied.count(destination) == 0 &&
                                 obstacles.count(destination) == 0;

    // Straight-line range is not enough when walls force a detour
    if (basicChecksPass) {
        PositionSet blocked = obstacles;
        blocked.insert(occupied.begin(), occupied.end());
        blocked.erase(from);

        std::vector<HexCoordinate> path;
        const PathfindingResult result = m_pathfinder.findPath(from, destination, blocked, path);
        if (result != PathfindingResult::SUCCESS ||
            static_cast<int>(path.size()) - 1 > range) {
            return failure(action, "Destination not reachable within movement range");
        }
    }

    MoveResult moved = actor.moveTo(destination, occupied, obstacles);
    if (!moved.success) {
        return failure(action, moved.reason);
    }

    state.updateOccupiedPosition(from, destination);
    COMBAT_DEBUG(actor.getName() + " moved " + from.toString() + " -> " + destination.toString());

    ActionOutcome outcome;
    outcome.entityId = actor.getId();
    outcome.variant = ActionVariant::Move;
    outcome.success = true;
    outcome.newPosition = destination;
    return outcome;
}

ActionOutcome CombatController::resolveAttack(CombatEntity& actor, const CombatAction& action,
                                              GameStateManager& state) {
    CombatEntity* target = state.findEntity(*action.targetId);
    if (target == nullptr) {
        return failure(action, "Target " + *action.targetId + " not found");
    }
    if (target == &actor) {
        return failure(action, "Cannot attack self");
    }
    if (!target->isAlive()) {
        return failure(action, "Target is already dead");
    }
    if (!state.areOpponents(actor, *target)) {
        return failure(action, "Cannot attack an ally");
    }
    if (!target->canBeTargeted()) {
        return failure(action, "Target cannot be targeted");
    }

    const int distance = hexDistance(actor.getPosition(), target->getPosition());
    if (distance > MELEE_RANGE) {
        return failure(action, "Target out of range (distance: " + std::to_string(distance) + ")");
    }

    const DamageResult damage = target->takeDamage(actor.calculateDamageOutput(), actor.getId());

    TargetHit hit;
    hit.targetId = target->getId();
    hit.damageDealt = damage.damageDealt;
    hit.blocked = damage.blocked;
    hit.targetDied = damage.died;
    recordThreat(actor, nullptr, *target, hit, state);

    COMBAT_INFO(actor.getName() + " hit " + target->getName() + " for " +
                std::to_string(damage.damageDealt) + (damage.died ? " (defeated)" : ""));

    ActionOutcome outcome;
    outcome.entityId = actor.getId();
    outcome.variant = ActionVariant::Attack;
    outcome.success = true;
    outcome.hits.push_back(std::move(hit));
    return outcome;
}

ActionOutcome CombatController::resolveAbility(CombatEntity& actor, const CombatAction& action,
                                               GameStateManager& state) {
    const std::string& abilityId = *action.abilityId;
    AbilityUseResult usable = actor.abilities().canUseAbility(abilityId);
    if (!usable.success) {
        return failure(action, usable.reason);
    }
    const AbilityDefinition ability = *actor.abilities().getAbility(abilityId);

    CombatEntity* target = nullptr;
    if (action.targetId) {
        target = state.findEntity(*action.targetId);
        if (target == nullptr) {
            return failure(action, "Target " + *action.targetId + " not found");
        }
        if (!target->isAlive()) {
            return failure(action, "Target is already dead");
        }
    } else if (ability.variant == AbilityVariant::Healing ||
               ability.variant == AbilityVariant::Defense) {
        target = &actor;
    } else if (ability.variant == AbilityVariant::Attack) {
        return failure(action, "Ability '" + ability.name + "' requires a target");
    }

    if (target != nullptr && target != &actor) {
        const bool hostile = state.areOpponents(actor, *target);
        if (ability.variant == AbilityVariant::Attack && !hostile) {
            return failure(action, "Cannot use '" + ability.name + "' on an ally");
        }
        if ((ability.variant == AbilityVariant::Healing ||
             ability.variant == AbilityVariant::Defense) && hostile) {
            return failure(action, "Cannot use '" + ability.name + "' on an enemy");
        }
        if (!target->canBeTargeted()) {
            return failure(action, "Target cannot be targeted");
        }
        if (!isValidAbilityTarget(actor.getPosition(), target->getPosition(), ability.range,
                                  state.getObstacles())) {
            return failure(action, "Target out of range or line of sight");
        }
    }

    AbilityUseResult used = actor.abilities().useAbility(abilityId);
    if (!used.success) {
        return failure(action, used.reason);
    }

    ActionOutcome outcome;
    outcome.entityId = actor.getId();
    outcome.variant = ActionVariant::Ability;
    outcome.success = true;
    outcome.abilityId = abilityId;

    if (target == nullptr) {
        COMBAT_DEBUG(actor.getName() + " used " + ability.name);
        return outcome;
    }

    const HexCoordinate center = target->getPosition();
    outcome.hits.push_back(applyAbilityTo(actor, ability, *target, state));

    if (ability.areaOfEffect > 0) {
        std::vector<CombatEntity*> splash;
        auto collect = [&](CombatEntity* other) {
            if (other == target || !other->isAlive() ||
                hexDistance(center, other->getPosition()) > ability.areaOfEffect) {
                return;
            }
            const bool hostile = state.areOpponents(actor, *other);
            if ((ability.variant == AbilityVariant::Attack) == hostile) {
                splash.push_back(other);
            }
        };
        for (const auto& player : state.getPlayers()) {
            collect(player.get());
        }
        for (const auto& monster : state.getMonsters()) {
            collect(monster.get());
        }
        for (CombatEntity* other : splash) {
            outcome.hits.push_back(applyAbilityTo(actor, ability, *other, state));
        }
    }

    COMBAT_INFO(actor.getName() + " used " + ability.name + " (" +
                std::to_string(outcome.hits.size()) + " targets, " +
                std::to_string(outcome.totalDamage()) + " damage, " +
                std::to_string(outcome.totalHealing()) + " healing)");
    return outcome;
}

TargetHit CombatController::applyAbilityTo(CombatEntity& actor, const AbilityDefinition& ability,
                                           CombatEntity& target, GameStateManager& state) {
    TargetHit hit;
    hit.targetId = target.getId();

    switch (ability.variant) {
    case AbilityVariant::Attack: {
        const int damage = actor.calculateDamageOutput(ability.damage);
        if (damage > 0) {
            const DamageResult result = target.takeDamage(damage, actor.getId());
            hit.damageDealt = result.damageDealt;
            hit.blocked = result.blocked;
            hit.targetDied = result.died;
        }
        break;
    }
    case AbilityVariant::Healing: {
        const int amount = actor.abilities().calculateHealing(ability.id);
        if (amount > 0) {
            hit.healingDone = target.heal(amount).amountHealed;
        }
        break;
    }
    case AbilityVariant::Defense:
    case AbilityVariant::Utility:
        break;
    }

    if (target.isAlive()) {
        applyStatusEffects(ability, target, hit);
    }
    recordThreat(actor, &ability, target, hit, state);
    return hit;
}

void CombatController::applyStatusEffects(const AbilityDefinition& ability, CombatEntity& target,
                                          TargetHit& hit) {
    std::uniform_real_distribution<double> roll(0.0, 1.0);
    for (const auto& application : ability.statusEffects) {
        if (application.chance < 1.0 && roll(m_rng) >= application.chance) {
            continue;
        }
        EffectApplyResult applied =
            target.addStatusEffect(application.effect, application.duration, application.value);
        if (applied.success) {
            hit.effectsApplied.push_back(application.effect);
        } else {
            COMBAT_DEBUG(toString(application.effect) + " not applied to " + target.getName() +
                         ": " + applied.reason);
        }
    }
}

void CombatController::recordThreat(const CombatEntity& actor, const AbilityDefinition* ability,
                                    CombatEntity& target, const TargetHit& hit,
                                    GameStateManager& state) {
    if (actor.getKind() != EntityKind::Player) {
        return;
    }
    Player* player = state.findPlayer(actor.getId());
    if (player == nullptr) {
        return;
    }
    player->recordDamageDealt(hit.damageDealt);
    player->recordHealingDone(hit.healingDone);

    const int armor = actor.getEffectiveArmor();

    if (hit.damageDealt > 0 && target.getKind() == EntityKind::Monster) {
        if (Monster* monster = state.findMonster(target.getId())) {
            if (ability != nullptr) {
                monster->recordAbilityThreat(actor.getId(), ability->id, hit.damageDealt, 0, armor);
            } else {
                monster->recordDamageFrom(actor.getId(), hit.damageDealt, armor);
            }
        }
    }

    // Every monster notices a healer
    if (hit.healingDone > 0) {
        for (const auto& monster : state.getLivingMonsters()) {
            monster->recordHealingObserved(actor.getId(), hit.healingDone, armor);
        }
    }
}

} // namespace HexCrawl
