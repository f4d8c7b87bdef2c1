/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AI_DECISION_HPP
#define AI_DECISION_HPP

#include "controllers/combat/CombatAction.hpp"
#include "utils/HexCoordinate.hpp"
#include <optional>
#include <string>
#include <variant>

namespace HexCrawl {

namespace AIPriority {
    constexpr int EMERGENCY = 10;
    constexpr int HIGH = 8;
    constexpr int MEDIUM = 5;
    constexpr int LOW = 3;
    constexpr int MINIMAL = 1;
}

struct WaitPayload {};

struct MovePayload {
    HexCoordinate destination;
};

struct AttackPayload {
    std::string targetId;
};

struct AbilityPayload {
    std::string abilityId;
    std::optional<std::string> targetId;
    std::optional<HexCoordinate> targetPosition;
};

using DecisionPayload = std::variant<WaitPayload, MovePayload, AttackPayload, AbilityPayload>;

/**
 * @brief What a monster wants to do this round and how strongly
 */
struct AIDecision {
    int priority{AIPriority::LOW};
    double confidence{0.1};
    std::string reasoning;
    DecisionPayload payload{WaitPayload{}};

    ActionVariant variant() const {
        switch (payload.index()) {
        case 1:
            return ActionVariant::Move;
        case 2:
            return ActionVariant::Attack;
        case 3:
            return ActionVariant::Ability;
        default:
            return ActionVariant::Wait;
        }
    }

    CombatAction toAction(const std::string& entityId) const {
        if (const auto* move = std::get_if<MovePayload>(&payload)) {
            return CombatAction::move(entityId, move->destination);
        }
        if (const auto* attack = std::get_if<AttackPayload>(&payload)) {
            return CombatAction::attack(entityId, attack->targetId);
        }
        if (const auto* ability = std::get_if<AbilityPayload>(&payload)) {
            return CombatAction::ability(entityId, ability->abilityId, ability->targetId,
                                         ability->targetPosition);
        }
        return CombatAction::wait(entityId);
    }

    static AIDecision wait(const std::string& reasoning, int priority = AIPriority::LOW,
                           double confidence = 0.1) {
        return {priority, confidence, reasoning, WaitPayload{}};
    }

    static AIDecision move(const HexCoordinate& destination, const std::string& reasoning,
                           int priority = AIPriority::MEDIUM, double confidence = 0.6) {
        return {priority, confidence, reasoning, MovePayload{destination}};
    }

    static AIDecision attack(const std::string& targetId, const std::string& reasoning,
                             int priority = AIPriority::HIGH, double confidence = 0.8) {
        return {priority, confidence, reasoning, AttackPayload{targetId}};
    }

    static AIDecision ability(const std::string& abilityId, std::optional<std::string> targetId,
                              const std::string& reasoning, int priority = AIPriority::HIGH,
                              double confidence = 0.7,
                              std::optional<HexCoordinate> targetPosition = std::nullopt) {
        return {priority, confidence, reasoning,
                AbilityPayload{abilityId, std::move(targetId), targetPosition}};
    }
};

} // namespace HexCrawl

#endif // AI_DECISION_HPP
