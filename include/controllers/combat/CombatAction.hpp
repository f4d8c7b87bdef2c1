/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMBAT_ACTION_HPP
#define COMBAT_ACTION_HPP

#include "utils/HexCoordinate.hpp"
#include <optional>
#include <ostream>
#include <string>

namespace HexCrawl {

enum class ActionVariant { Move, Attack, Ability, Wait };

std::string toString(ActionVariant variant);
std::optional<ActionVariant> actionVariantFromName(const std::string& name);

inline std::ostream& operator<<(std::ostream& os, ActionVariant variant) {
    return os << toString(variant);
}

/**
 * @brief One entity's intent for a round, submitted by a player or
 * produced from a monster's AIDecision
 */
struct CombatAction {
    std::string entityId;
    ActionVariant variant{ActionVariant::Wait};
    std::optional<HexCoordinate> targetPosition;
    std::optional<std::string> targetId;
    std::optional<std::string> abilityId;

    static CombatAction wait(const std::string& entityId);
    static CombatAction move(const std::string& entityId, const HexCoordinate& destination);
    static CombatAction attack(const std::string& entityId, const std::string& targetId);
    static CombatAction ability(const std::string& entityId, const std::string& abilityId,
                                std::optional<std::string> targetId = std::nullopt,
                                std::optional<HexCoordinate> targetPosition = std::nullopt);

    /**
     * @brief Checks the fields the variant requires
     * @return Rejection reason, or std::nullopt when the action is well formed
     */
    std::optional<std::string> validateFields() const;
};

} // namespace HexCrawl

#endif // COMBAT_ACTION_HPP
