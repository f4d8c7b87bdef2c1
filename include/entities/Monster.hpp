/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef MONSTER_HPP
#define MONSTER_HPP

#include "ai/MonsterAI.hpp"
#include "ai/threat/ThreatConfig.hpp"
#include "ai/threat/ThreatManager.hpp"
#include "entities/CombatEntity.hpp"
#include <memory>
#include <string>
#include <vector>

namespace HexCrawl {

/**
 * @brief AI-controlled combatant.
 *
 * Each monster keeps its own threat table and decision history; nothing is
 * shared between monsters.
 */
class Monster : public CombatEntity {
public:
    Monster(const std::string& id, const std::string& name, const EntityStats& stats,
            const HexCoordinate& position, std::vector<AbilityDefinition> abilities = {},
            AIVariant aiVariant = AIVariant::Aggressive,
            const ThreatConfig& threatConfig = ThreatConfig::createDefault(),
            std::vector<MonsterBehavior> behaviors = {});
    ~Monster() override = default;

    [[nodiscard]] EntityKind getKind() const override { return EntityKind::Monster; }

    // Id of the definition this monster was spawned from, empty for hand-built ones
    const std::string& getDefinitionId() const { return m_definitionId; }
    void setDefinitionId(const std::string& definitionId) { m_definitionId = definitionId; }

    AIDecision makeDecision(const TargetingContext& context, HexPathfinder& pathfinder);

    /**
     * @brief Threat from a player's hit on this monster
     */
    void recordDamageFrom(const std::string& attackerId, int damage, int attackerArmor);

    // Threat from healing this monster saw a player do
    void recordHealingObserved(const std::string& healerId, int healing, int healerArmor);

    // Threat from a player ability that hit this monster or healed its foes
    void recordAbilityThreat(const std::string& attackerId, const std::string& abilityId,
                             int damage, int healing, int attackerArmor);

    ThreatManager& threat() { return m_threat; }
    const ThreatManager& threat() const { return m_threat; }
    MonsterAI& ai() { return m_ai; }
    const MonsterAI& ai() const { return m_ai; }

    EndOfRoundResult endRound() override;
    void resetForEncounter() override;

private:
    std::string m_definitionId;
    ThreatManager m_threat;
    MonsterAI m_ai;
};

using MonsterPtr = std::shared_ptr<Monster>;

} // namespace HexCrawl

#endif // MONSTER_HPP
