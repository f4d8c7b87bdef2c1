/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ABILITIES_COMPONENT_HPP
#define ABILITIES_COMPONENT_HPP

#include "entities/components/StatusEffectsComponent.hpp"
#include <boost/container/flat_map.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace HexCrawl {

enum class AbilityVariant { Attack, Defense, Utility, Healing };

std::optional<AbilityVariant> abilityVariantFromName(const std::string& name);
std::string toString(AbilityVariant variant);

inline std::ostream& operator<<(std::ostream& os, AbilityVariant variant) {
    return os << toString(variant);
}

struct StatusEffectApplication {
    StatusEffectType effect{StatusEffectType::Poison};
    int duration{1};
    std::optional<int> value;
    double chance{1.0};   // 0.0 to 1.0
};

struct AbilityDefinition {
    std::string id;
    std::string name;
    AbilityVariant variant{AbilityVariant::Attack};
    int damage{0};
    int healing{0};
    int range{1};
    int cooldown{0};
    std::string description;
    int areaOfEffect{0};
    std::vector<StatusEffectApplication> statusEffects;
};

struct AbilityUseResult {
    bool success{false};
    std::string reason;
};

/**
 * @brief Known abilities, cooldowns and usage counts of one entity
 *
 * basic_attack and wait are always available in addition to the class
 * abilities handed to the constructor.
 */
class AbilitiesComponent {
public:
    static constexpr const char* BASIC_ATTACK_ID = "basic_attack";
    static constexpr const char* WAIT_ID = "wait";

    explicit AbilitiesComponent(std::vector<AbilityDefinition> classAbilities = {});

    static AbilityDefinition createBasicAttack();
    static AbilityDefinition createWait();

    const AbilityDefinition* getAbility(const std::string& abilityId) const;
    std::vector<AbilityDefinition> getAbilities() const;
    std::vector<AbilityDefinition> getAvailableAbilities() const;
    std::vector<AbilityDefinition> getAbilitiesByVariant(AbilityVariant variant) const;
    bool hasAbility(const std::string& abilityId) const;

    int getCooldown(const std::string& abilityId) const;
    bool isOnCooldown(const std::string& abilityId) const { return getCooldown(abilityId) > 0; }
    void setCooldown(const std::string& abilityId, int rounds);
    void clearAllCooldowns() { m_cooldowns.clear(); }

    AbilityUseResult canUseAbility(const std::string& abilityId) const;

    /**
     * @brief Validates, starts the cooldown and counts the use
     */
    AbilityUseResult useAbility(const std::string& abilityId);
    int getUsageCount(const std::string& abilityId) const;

    void addAbility(const AbilityDefinition& ability);
    bool removeAbility(const std::string& abilityId);

    // Ticks every cooldown down; returns abilities that became ready
    std::vector<std::string> processRound();

    int calculateDamage(const std::string& abilityId, double damageModifier = 1.0) const;
    int calculateHealing(const std::string& abilityId, double healingModifier = 1.0) const;
    bool isTargetRequired(const std::string& abilityId) const;

    void resetForEncounter();

private:
    std::vector<AbilityDefinition> m_abilities;
    boost::container::flat_map<std::string, int> m_cooldowns;
    boost::container::flat_map<std::string, int> m_usageCount;
};

} // namespace HexCrawl

#endif // ABILITIES_COMPONENT_HPP
