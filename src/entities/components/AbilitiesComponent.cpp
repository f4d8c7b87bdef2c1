/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/components/AbilitiesComponent.hpp"
#include <algorithm>
#include <cmath>

namespace HexCrawl {

std::optional<AbilityVariant> abilityVariantFromName(const std::string& name) {
    if (name == "attack") return AbilityVariant::Attack;
    if (name == "defense") return AbilityVariant::Defense;
    if (name == "utility") return AbilityVariant::Utility;
    if (name == "healing") return AbilityVariant::Healing;
    return std::nullopt;
}

std::string toString(AbilityVariant variant) {
    switch (variant) {
    case AbilityVariant::Attack:
        return "attack";
    case AbilityVariant::Defense:
        return "defense";
    case AbilityVariant::Utility:
        return "utility";
    case AbilityVariant::Healing:
        return "healing";
    }
    return "unknown";
}

AbilitiesComponent::AbilitiesComponent(std::vector<AbilityDefinition> classAbilities)
    : m_abilities(std::move(classAbilities)) {
    addAbility(createBasicAttack());
    addAbility(createWait());
}

AbilityDefinition AbilitiesComponent::createBasicAttack() {
    AbilityDefinition ability;
    ability.id = BASIC_ATTACK_ID;
    ability.name = "Basic Attack";
    ability.variant = AbilityVariant::Attack;
    ability.damage = 10;
    ability.range = 1;
    ability.description = "A simple melee attack";
    return ability;
}

AbilityDefinition AbilitiesComponent::createWait() {
    AbilityDefinition ability;
    ability.id = WAIT_ID;
    ability.name = "Wait";
    ability.variant = AbilityVariant::Utility;
    ability.range = 0;
    ability.description = "Skip your turn";
    return ability;
}

const AbilityDefinition* AbilitiesComponent::getAbility(const std::string& abilityId) const {
    auto it = std::find_if(m_abilities.begin(), m_abilities.end(),
                           [&abilityId](const AbilityDefinition& a) { return a.id == abilityId; });
    return it != m_abilities.end() ? &(*it) : nullptr;
}

std::vector<AbilityDefinition> AbilitiesComponent::getAbilities() const {
    return m_abilities;
}

std::vector<AbilityDefinition> AbilitiesComponent::getAvailableAbilities() const {
    std::vector<AbilityDefinition> available;
    for (const auto& ability : m_abilities) {
        if (!isOnCooldown(ability.id)) {
            available.push_back(ability);
        }
    }
    return available;
}

std::vector<AbilityDefinition> AbilitiesComponent::getAbilitiesByVariant(AbilityVariant variant) const {
    std::vector<AbilityDefinition> matching;
    for (const auto& ability : m_abilities) {
        if (ability.variant == variant) {
            matching.push_back(ability);
        }
    }
    return matching;
}

bool AbilitiesComponent::hasAbility(const std::string& abilityId) const {
    return getAbility(abilityId) != nullptr;
}

int AbilitiesComponent::getCooldown(const std::string& abilityId) const {
    auto it = m_cooldowns.find(abilityId);
    return it != m_cooldowns.end() ? it->second : 0;
}

void AbilitiesComponent::setCooldown(const std::string& abilityId, int rounds) {
    if (rounds > 0) {
        m_cooldowns[abilityId] = rounds;
    } else {
        m_cooldowns.erase(abilityId);
    }
}

AbilityUseResult AbilitiesComponent::canUseAbility(const std::string& abilityId) const {
    const AbilityDefinition* ability = getAbility(abilityId);
    if (ability == nullptr) {
        return {false, "Ability '" + abilityId + "' does not exist"};
    }
    if (isOnCooldown(abilityId)) {
        return {false, "Ability '" + ability->name + "' is on cooldown (" +
                           std::to_string(getCooldown(abilityId)) + " rounds remaining)"};
    }
    return {true, ""};
}

AbilityUseResult AbilitiesComponent::useAbility(const std::string& abilityId) {
    AbilityUseResult check = canUseAbility(abilityId);
    if (!check.success) {
        return check;
    }

    const AbilityDefinition* ability = getAbility(abilityId);
    if (ability->cooldown > 0) {
        setCooldown(abilityId, ability->cooldown);
    }
    ++m_usageCount[abilityId];
    return {true, ""};
}

int AbilitiesComponent::getUsageCount(const std::string& abilityId) const {
    auto it = m_usageCount.find(abilityId);
    return it != m_usageCount.end() ? it->second : 0;
}

void AbilitiesComponent::addAbility(const AbilityDefinition& ability) {
    auto it = std::find_if(m_abilities.begin(), m_abilities.end(),
                           [&ability](const AbilityDefinition& a) { return a.id == ability.id; });
    if (it != m_abilities.end()) {
        *it = ability;
    } else {
        m_abilities.push_back(ability);
    }
}

bool AbilitiesComponent::removeAbility(const std::string& abilityId) {
    auto it = std::find_if(m_abilities.begin(), m_abilities.end(),
                           [&abilityId](const AbilityDefinition& a) { return a.id == abilityId; });
    if (it == m_abilities.end()) {
        return false;
    }
    m_abilities.erase(it);
    m_cooldowns.erase(abilityId);
    return true;
}

std::vector<std::string> AbilitiesComponent::processRound() {
    std::vector<std::string> ready;
    for (auto it = m_cooldowns.begin(); it != m_cooldowns.end();) {
        if (it->second <= 1) {
            ready.push_back(it->first);
            it = m_cooldowns.erase(it);
        } else {
            --it->second;
            ++it;
        }
    }
    return ready;
}

int AbilitiesComponent::calculateDamage(const std::string& abilityId, double damageModifier) const {
    const AbilityDefinition* ability = getAbility(abilityId);
    if (ability == nullptr || ability->damage <= 0) {
        return 0;
    }
    return static_cast<int>(std::floor(ability->damage * damageModifier));
}

int AbilitiesComponent::calculateHealing(const std::string& abilityId, double healingModifier) const {
    const AbilityDefinition* ability = getAbility(abilityId);
    if (ability == nullptr || ability->healing <= 0) {
        return 0;
    }
    return static_cast<int>(std::floor(ability->healing * healingModifier));
}

bool AbilitiesComponent::isTargetRequired(const std::string& abilityId) const {
    const AbilityDefinition* ability = getAbility(abilityId);
    if (ability == nullptr) {
        return false;
    }
    return ability->variant == AbilityVariant::Attack ||
           (ability->variant == AbilityVariant::Healing && ability->range > 0) ||
           (ability->variant == AbilityVariant::Defense && ability->range > 0);
}

void AbilitiesComponent::resetForEncounter() {
    m_cooldowns.clear();
    m_usageCount.clear();
}

} // namespace HexCrawl
