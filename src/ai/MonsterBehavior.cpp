/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/MonsterBehavior.hpp"
#include <type_traits>

namespace HexCrawl {

std::optional<TargetSelector> targetSelectorFromName(const std::string& name) {
    if (name == "nearest_enemy") return TargetSelector::NearestEnemy;
    if (name == "weakest_enemy") return TargetSelector::WeakestEnemy;
    if (name == "strongest_enemy") return TargetSelector::StrongestEnemy;
    if (name == "nearest_ally") return TargetSelector::NearestAlly;
    if (name == "self") return TargetSelector::Self;
    return std::nullopt;
}

std::string toString(TargetSelector selector) {
    switch (selector) {
    case TargetSelector::NearestEnemy:
        return "nearest_enemy";
    case TargetSelector::WeakestEnemy:
        return "weakest_enemy";
    case TargetSelector::StrongestEnemy:
        return "strongest_enemy";
    case TargetSelector::NearestAlly:
        return "nearest_ally";
    case TargetSelector::Self:
        return "self";
    }
    return "unknown";
}

std::string conditionKindName(const BehaviorCondition& condition) {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, HpBelow>) {
            return "hp_below";
        } else if constexpr (std::is_same_v<T, HpAbove>) {
            return "hp_above";
        } else if constexpr (std::is_same_v<T, EnemyInRange>) {
            return "enemy_in_range";
        } else if constexpr (std::is_same_v<T, AllyInDanger>) {
            return "ally_in_danger";
        } else if constexpr (std::is_same_v<T, CooldownReady>) {
            return "cooldown_ready";
        } else {
            static_assert(std::is_same_v<T, RoundAtLeast>, "unhandled condition kind");
            return "round_at_least";
        }
    }, condition);
}

std::string actionKindName(const BehaviorAction& action) {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, UseAbility>) {
            return "use_ability";
        } else if constexpr (std::is_same_v<T, MoveTo>) {
            return "move_to";
        } else if constexpr (std::is_same_v<T, Flee>) {
            return "flee";
        } else if constexpr (std::is_same_v<T, FocusTarget>) {
            return "focus_target";
        } else if constexpr (std::is_same_v<T, CallForHelp>) {
            return "call_for_help";
        } else {
            static_assert(std::is_same_v<T, Hold>, "unhandled action kind");
            return "hold";
        }
    }, action);
}

} // namespace HexCrawl
