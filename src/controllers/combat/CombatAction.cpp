/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/combat/CombatAction.hpp"

namespace HexCrawl {

std::string toString(ActionVariant variant) {
    switch (variant) {
    case ActionVariant::Move:
        return "move";
    case ActionVariant::Attack:
        return "attack";
    case ActionVariant::Ability:
        return "ability";
    case ActionVariant::Wait:
        return "wait";
    }
    return "unknown";
}

std::optional<ActionVariant> actionVariantFromName(const std::string& name) {
    if (name == "move") return ActionVariant::Move;
    if (name == "attack") return ActionVariant::Attack;
    if (name == "ability") return ActionVariant::Ability;
    if (name == "wait") return ActionVariant::Wait;
    return std::nullopt;
}

CombatAction CombatAction::wait(const std::string& entityId) {
    CombatAction action;
    action.entityId = entityId;
    action.variant = ActionVariant::Wait;
    return action;
}

CombatAction CombatAction::move(const std::string& entityId, const HexCoordinate& destination) {
    CombatAction action;
    action.entityId = entityId;
    action.variant = ActionVariant::Move;
    action.targetPosition = destination;
    return action;
}

CombatAction CombatAction::attack(const std::string& entityId, const std::string& targetId) {
    CombatAction action;
    action.entityId = entityId;
    action.variant = ActionVariant::Attack;
    action.targetId = targetId;
    return action;
}

CombatAction CombatAction::ability(const std::string& entityId, const std::string& abilityId,
                                   std::optional<std::string> targetId,
                                   std::optional<HexCoordinate> targetPosition) {
    CombatAction action;
    action.entityId = entityId;
    action.variant = ActionVariant::Ability;
    action.abilityId = abilityId;
    action.targetId = std::move(targetId);
    action.targetPosition = targetPosition;
    return action;
}

std::optional<std::string> CombatAction::validateFields() const {
    if (entityId.empty()) {
        return "Action has no entity id";
    }

    switch (variant) {
    case ActionVariant::Move:
        if (!targetPosition) {
            return "Move action requires a target position";
        }
        break;
    case ActionVariant::Attack:
        if (!targetId || targetId->empty()) {
            return "Attack action requires a target id";
        }
        break;
    case ActionVariant::Ability:
        if (!abilityId || abilityId->empty()) {
            return "Ability action requires an ability id";
        }
        break;
    case ActionVariant::Wait:
        break;
    }
    return std::nullopt;
}

} // namespace HexCrawl
