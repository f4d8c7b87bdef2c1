/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef STATUS_EFFECTS_COMPONENT_HPP
#define STATUS_EFFECTS_COMPONENT_HPP

#include <boost/container/flat_map.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace HexCrawl {

enum class StatusEffectType {
    Poison,
    Regeneration,
    Stunned,
    Shielded,
    Vulnerable,
    Enraged,
    Weakened,
    Invisible,
    Burning,
    Frozen,
    Blessed,
    Cursed
};

enum class EffectCategory { Buff, Debuff };

struct StatusEffectInfo {
    const char* name;
    const char* description;
    EffectCategory category;
    bool stackable;
    int maxStacks;   // 1 for non-stackable effects
};

const StatusEffectInfo& getStatusEffectInfo(StatusEffectType type);

// Lowercase data-file name ("poison", "frozen", ...)
std::optional<StatusEffectType> statusEffectFromName(const std::string& name);
std::string toString(StatusEffectType type);

inline std::ostream& operator<<(std::ostream& os, StatusEffectType type) {
    return os << toString(type);
}

/**
 * @brief One active effect; stacks multiply the base value
 */
struct StatusEffect {
    StatusEffectType type{StatusEffectType::Poison};
    int duration{0};
    std::optional<int> baseValue;
    int stacks{1};

    int value() const { return baseValue ? *baseValue * stacks : 0; }
};

struct EffectApplyResult {
    bool success{false};
    std::string reason;
    int stacks{0};
};

/**
 * @brief Per-round effect output, e.g. {"poison_damage", 6}
 */
struct EffectTick {
    std::string type;
    int value{0};
};

struct StatusEffectRoundResult {
    std::vector<StatusEffectType> expired;
    std::vector<EffectTick> ticks;
};

/**
 * @brief Active status effects of one entity
 *
 * Stacking: a stackable effect keeps its first base value; its aggregate
 * value is base x stacks and its duration the longer of the two. A
 * non-stackable effect is replaced only by a longer or stronger one.
 */
class StatusEffectsComponent {
public:
    EffectApplyResult addEffect(StatusEffectType type, int duration,
                                std::optional<int> value = std::nullopt);
    bool removeEffect(StatusEffectType type);

    bool hasEffect(StatusEffectType type) const;
    const StatusEffect* getEffect(StatusEffectType type) const;
    int getStacks(StatusEffectType type) const;
    bool hasEffects() const { return !m_effects.empty(); }

    std::vector<StatusEffect> getEffects() const;
    std::vector<StatusEffect> getEffectsByCategory(EffectCategory category) const;

    std::vector<StatusEffectType> clearEffects();
    std::vector<StatusEffectType> clearEffectsByCategory(EffectCategory category);

    /**
     * @brief Emits damage/heal ticks, then counts durations down
     */
    StatusEffectRoundResult processRound();

    bool canAct() const;
    bool canMove() const;
    bool canBeTargeted() const;

    double getDamageModifier() const;
    double getDamageTakenModifier() const;
    double getHealingModifier() const;
    int getArmorBonus() const;

    void resetForEncounter() { m_effects.clear(); }

private:
    // Ordered by type so ticks come out in a fixed order
    boost::container::flat_map<StatusEffectType, StatusEffect> m_effects;

    int valueOr(StatusEffectType type, int fallback) const;
};

} // namespace HexCrawl

#endif // STATUS_EFFECTS_COMPONENT_HPP
