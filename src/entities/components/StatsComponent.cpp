/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/components/StatsComponent.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace HexCrawl {

StatsComponent::StatsComponent(const EntityStats& baseStats)
    : m_baseStats(baseStats), m_currentHp(baseStats.maxHp) {
    if (baseStats.maxHp <= 0) {
        ENTITY_ERROR("Invalid maxHp: " + std::to_string(baseStats.maxHp));
        throw std::invalid_argument("maxHp must be positive");
    }
}

double StatsComponent::getHpPercentage() const {
    return static_cast<double>(m_currentHp) / m_baseStats.maxHp;
}

bool StatsComponent::isCriticallyWounded(double threshold) const {
    return getHpPercentage() <= threshold;
}

DamageResult StatsComponent::takeDamage(int amount, const std::string& source, int bonusArmor) {
    if (!isAlive() || amount <= 0) {
        return DamageResult{};
    }

    const int blocked = calculateArmorReduction(amount, getEffectiveArmor() + bonusArmor);
    const int afterArmor = std::max(1, amount - blocked);

    const int oldHp = m_currentHp;
    m_currentHp = std::max(0, m_currentHp - afterArmor);

    DamageResult result;
    result.damageDealt = oldHp - m_currentHp;
    result.blocked = blocked;
    result.died = m_currentHp == 0;

    ENTITY_DEBUG("Took " + std::to_string(result.damageDealt) + " damage from " + source +
                 " (" + std::to_string(blocked) + " blocked)");
    return result;
}

HealResult StatsComponent::heal(int amount) {
    if (!isAlive() || amount <= 0) {
        return HealResult{0, m_currentHp};
    }

    const int oldHp = m_currentHp;
    m_currentHp = std::min(m_baseStats.maxHp, m_currentHp + amount);
    return HealResult{m_currentHp - oldHp, m_currentHp};
}

void StatsComponent::setCurrentHp(int hp) {
    m_currentHp = std::clamp(hp, 0, m_baseStats.maxHp);
}

void StatsComponent::revive(double hpPercentage) {
    if (isAlive()) {
        return;
    }
    const int reviveHp = static_cast<int>(std::floor(m_baseStats.maxHp * hpPercentage));
    m_currentHp = std::clamp(reviveHp, 1, m_baseStats.maxHp);
}

void StatsComponent::addTemporaryArmor(int amount) {
    m_temporaryArmor += std::max(0, amount);
}

void StatsComponent::removeTemporaryArmor(int amount) {
    m_temporaryArmor = std::max(0, m_temporaryArmor - amount);
}

int StatsComponent::calculateDamageOutput(int baseDamage) const {
    return static_cast<int>(std::floor(baseDamage * m_damageModifier));
}

void StatsComponent::setDamageModifier(double modifier) {
    m_damageModifier = std::max(MIN_DAMAGE_MODIFIER, modifier);
}

void StatsComponent::addDamageModifier(double amount) {
    m_damageModifier = std::max(MIN_DAMAGE_MODIFIER, m_damageModifier + amount);
}

void StatsComponent::resetToFullHealth() {
    m_currentHp = m_baseStats.maxHp;
    m_temporaryArmor = 0;
}

void StatsComponent::resetToStartingStats() {
    resetToFullHealth();
    m_damageModifier = 1.0;
}

int StatsComponent::calculateArmorReduction(int damage, int armor) {
    if (armor <= 0) {
        return 0;
    }
    const double reduction = std::min(MAX_ARMOR_REDUCTION, armor * ARMOR_REDUCTION_RATE);
    return static_cast<int>(std::floor(damage * reduction));
}

} // namespace HexCrawl
