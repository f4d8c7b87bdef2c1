/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MONSTER_BEHAVIOR_HPP
#define MONSTER_BEHAVIOR_HPP

#include "utils/HexCoordinate.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace HexCrawl {

enum class TargetSelector {
    NearestEnemy,
    WeakestEnemy,
    StrongestEnemy,
    NearestAlly,
    Self
};

std::optional<TargetSelector> targetSelectorFromName(const std::string& name);
std::string toString(TargetSelector selector);

// --- Conditions ---

struct HpBelow {
    double threshold{0.5};
};

struct HpAbove {
    double threshold{0.5};
};

struct EnemyInRange {
    int range{1};
};

struct AllyInDanger {
    double threshold{0.3};
};

struct CooldownReady {
    std::string abilityId;
};

struct RoundAtLeast {
    int round{1};
};

using BehaviorCondition =
    std::variant<HpBelow, HpAbove, EnemyInRange, AllyInDanger, CooldownReady, RoundAtLeast>;

// --- Actions ---

struct UseAbility {
    std::string abilityId;
    TargetSelector target{TargetSelector::NearestEnemy};
};

struct MoveTo {
    std::optional<HexCoordinate> position;
    TargetSelector target{TargetSelector::NearestEnemy};
};

struct Flee {
    TargetSelector from{TargetSelector::NearestEnemy};
};

struct FocusTarget {
    TargetSelector target{TargetSelector::WeakestEnemy};
};

struct CallForHelp {
    std::string abilityId{"call_for_help"};
};

struct Hold {};

using BehaviorAction = std::variant<UseAbility, MoveTo, Flee, FocusTarget, CallForHelp, Hold>;

/**
 * @brief Scripted override checked before the monster's AI variant
 *
 * Fires when every condition holds; an empty condition list always holds.
 */
struct MonsterBehavior {
    std::string id;
    std::string name;
    int priority{0};
    std::vector<BehaviorCondition> conditions;
    BehaviorAction action{Hold{}};
};

// Kind names as they appear in monster definition files
std::string conditionKindName(const BehaviorCondition& condition);
std::string actionKindName(const BehaviorAction& action);

} // namespace HexCrawl

#endif // MONSTER_BEHAVIOR_HPP
