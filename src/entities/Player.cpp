/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Player.hpp"
#include "core/Logger.hpp"

namespace HexCrawl {

Player::Player(const std::string& id, const std::string& name, const EntityStats& stats,
               const HexCoordinate& position, std::vector<AbilityDefinition> abilities)
    : CombatEntity(id, name, stats, position, std::move(abilities)) {
    ENTITY_DEBUG("Player created: " + name + " (" + id + ") at " + position.toString());
}

EntityStats Player::getDefaultStats() {
    EntityStats stats;
    stats.maxHp = 100;
    stats.baseArmor = 2;
    stats.baseDamage = 15;
    stats.movementRange = 3;
    return stats;
}

std::shared_ptr<Player> Player::createAdventurer(const std::string& id, const std::string& name,
                                                 const HexCoordinate& position) {
    return std::make_shared<Player>(id, name, getDefaultStats(), position);
}

void Player::recordDamageDealt(int amount) {
    if (amount > 0) {
        m_totalDamageDealt += amount;
    }
}

void Player::recordHealingDone(int amount) {
    if (amount > 0) {
        m_totalHealingDone += amount;
    }
}

void Player::resetForEncounter() {
    CombatEntity::resetForEncounter();
    m_totalDamageDealt = 0;
    m_totalHealingDone = 0;
}

} // namespace HexCrawl
