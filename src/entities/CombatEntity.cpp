/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/CombatEntity.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <stdexcept>

namespace HexCrawl {

std::string toString(EntityKind kind) {
    switch (kind) {
    case EntityKind::Player:
        return "player";
    case EntityKind::Monster:
        return "monster";
    }
    return "unknown";
}

CombatEntity::CombatEntity(const std::string& id, const std::string& name,
                           const EntityStats& stats, const HexCoordinate& position,
                           std::vector<AbilityDefinition> abilities)
    : m_id(id),
      m_name(name),
      m_stats(stats),
      m_abilities(std::move(abilities)),
      m_movement(position, stats.movementRange) {
    if (m_id.empty()) {
        throw std::invalid_argument("CombatEntity requires a non-empty id");
    }
}

int CombatEntity::getEffectiveArmor() const {
    return m_stats.getEffectiveArmor() + m_statusEffects.getArmorBonus();
}

bool CombatEntity::canAct() const {
    return isAlive() && m_statusEffects.canAct();
}

bool CombatEntity::canMove() const {
    return isAlive() && m_statusEffects.canMove();
}

bool CombatEntity::canBeTargeted() const {
    return isAlive() && m_statusEffects.canBeTargeted();
}

DamageResult CombatEntity::takeDamage(int amount, const std::string& source) {
    if (!isAlive() || amount <= 0) {
        return DamageResult{};
    }

    const int modified =
        static_cast<int>(std::floor(amount * m_statusEffects.getDamageTakenModifier()));
    DamageResult result = m_stats.takeDamage(modified, source, m_statusEffects.getArmorBonus());

    ENTITY_DEBUG(m_name + " took " + std::to_string(result.damageDealt) + " damage from " +
                 source + " (" + std::to_string(result.blocked) + " blocked)");
    if (result.died) {
        ENTITY_INFO(m_name + " (" + m_id + ") was defeated");
    }
    return result;
}

HealResult CombatEntity::heal(int amount) {
    if (!isAlive() || amount <= 0) {
        return HealResult{0, getCurrentHp()};
    }
    const int modified =
        static_cast<int>(std::floor(amount * m_statusEffects.getHealingModifier()));
    return m_stats.heal(modified);
}

int CombatEntity::calculateDamageOutput() const {
    return calculateDamageOutput(m_stats.getBaseDamage());
}

int CombatEntity::calculateDamageOutput(int baseDamage) const {
    return static_cast<int>(std::floor(m_stats.calculateDamageOutput(baseDamage) *
                                       m_statusEffects.getDamageModifier()));
}

MoveResult CombatEntity::moveTo(const HexCoordinate& target, const PositionSet& occupied,
                                const PositionSet& obstacles) {
    if (!isAlive()) {
        return {false, "Entity is dead", std::nullopt};
    }
    if (!m_statusEffects.canMove()) {
        return {false, "Cannot move while stunned or frozen", std::nullopt};
    }
    return m_movement.moveTo(target, occupied, obstacles);
}

EffectApplyResult CombatEntity::addStatusEffect(StatusEffectType type, int duration,
                                                std::optional<int> value) {
    if (!isAlive()) {
        return {false, "Cannot apply effects to a dead entity", 0};
    }
    return m_statusEffects.addEffect(type, duration, value);
}

TargetCandidate CombatEntity::toTargetCandidate() const {
    TargetCandidate candidate;
    candidate.id = m_id;
    candidate.name = m_name;
    candidate.currentHp = getCurrentHp();
    candidate.maxHp = getMaxHp();
    candidate.alive = isAlive();
    return candidate;
}

void CombatEntity::startRound() {
    m_movement.resetForNewRound();
}

EndOfRoundResult CombatEntity::endRound() {
    EndOfRoundResult result;
    result.entityId = m_id;

    if (!isAlive()) {
        return result;
    }

    StatusEffectRoundResult effects = m_statusEffects.processRound();
    for (const auto& tick : effects.ticks) {
        if (tick.type == "regeneration_heal") {
            result.healingReceived += m_stats.heal(tick.value).amountHealed;
        } else {
            const std::string source = tick.type.substr(0, tick.type.find('_'));
            DamageResult damage = m_stats.takeDamage(tick.value, source);
            result.damageTaken += damage.damageDealt;
            result.died = result.died || damage.died;
        }
        result.ticks.push_back(tick);
        if (!isAlive()) {
            break;
        }
    }
    result.expiredEffects = std::move(effects.expired);
    result.readyAbilities = m_abilities.processRound();

    if (result.died) {
        ENTITY_INFO(m_name + " (" + m_id + ") succumbed to status effects");
    }
    return result;
}

void CombatEntity::resetForEncounter() {
    m_stats.resetToStartingStats();
    m_statusEffects.clearEffects();
    m_abilities.resetForEncounter();
    m_movement.setStartingPosition(m_movement.getStartingPosition());
}

} // namespace HexCrawl
