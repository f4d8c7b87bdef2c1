/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/Monster.hpp"
#include "ai/threat/ThreatCalculator.hpp"
#include "core/Logger.hpp"

namespace HexCrawl {

Monster::Monster(const std::string& id, const std::string& name, const EntityStats& stats,
                 const HexCoordinate& position, std::vector<AbilityDefinition> abilities,
                 AIVariant aiVariant, const ThreatConfig& threatConfig,
                 std::vector<MonsterBehavior> behaviors)
    : CombatEntity(id, name, stats, position, std::move(abilities)),
      m_threat(threatConfig),
      m_ai(aiVariant, std::move(behaviors)) {
    ENTITY_DEBUG("Monster created: " + name + " (" + id + ", " + toString(aiVariant) + ") at " +
                 position.toString());
}

AIDecision Monster::makeDecision(const TargetingContext& context, HexPathfinder& pathfinder) {
    return m_ai.makeDecision(*this, context, m_threat, pathfinder);
}

void Monster::recordDamageFrom(const std::string& attackerId, int damage, int attackerArmor) {
    if (damage <= 0) {
        return;
    }
    m_threat.addThreat(ThreatCalculator::createAttackThreat(attackerId, damage, attackerArmor));
}

void Monster::recordHealingObserved(const std::string& healerId, int healing, int healerArmor) {
    if (healing <= 0) {
        return;
    }
    m_threat.addThreat(ThreatCalculator::createHealingThreat(healerId, healing, healerArmor));
}

void Monster::recordAbilityThreat(const std::string& attackerId, const std::string& abilityId,
                                  int damage, int healing, int attackerArmor) {
    if (damage <= 0 && healing <= 0) {
        return;
    }
    m_threat.addThreat(ThreatCalculator::createAbilityThreat(attackerId, damage, damage, healing,
                                                             attackerArmor, abilityId));
}

EndOfRoundResult Monster::endRound() {
    EndOfRoundResult result = CombatEntity::endRound();
    m_threat.processRound();
    return result;
}

void Monster::resetForEncounter() {
    CombatEntity::resetForEncounter();
    m_threat.resetForEncounter();
    m_ai.resetForEncounter();
}

} // namespace HexCrawl
