/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef COMBAT_ENTITY_HPP
#define COMBAT_ENTITY_HPP

#include "ai/threat/ThreatManager.hpp"
#include "entities/components/AbilitiesComponent.hpp"
#include "entities/components/MovementComponent.hpp"
#include "entities/components/StatsComponent.hpp"
#include "entities/components/StatusEffectsComponent.hpp"
#include "utils/HexCoordinate.hpp"
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace HexCrawl {

enum class EntityKind { Player, Monster };

std::string toString(EntityKind kind);

inline std::ostream& operator<<(std::ostream& os, EntityKind kind) {
    return os << toString(kind);
}

/**
 * @brief Status-effect ticks and cooldown recovery applied to one entity
 * at the end of a round
 */
struct EndOfRoundResult {
    std::string entityId;
    std::vector<EffectTick> ticks;
    std::vector<StatusEffectType> expiredEffects;
    std::vector<std::string> readyAbilities;
    int damageTaken{0};
    int healingReceived{0};
    bool died{false};
};

/**
 * @brief Pure virtual base for everything that fights on the hex board.
 *
 * Composes the stats, status-effect, ability and movement components and
 * routes damage and healing through the status-effect modifiers.
 */
class CombatEntity {
public:
    /**
     * @throws std::invalid_argument on an empty id or non-positive maxHp
     */
    CombatEntity(const std::string& id, const std::string& name, const EntityStats& stats,
                 const HexCoordinate& position, std::vector<AbilityDefinition> abilities = {});
    virtual ~CombatEntity() = default;

    CombatEntity(const CombatEntity&) = delete;
    CombatEntity& operator=(const CombatEntity&) = delete;

    [[nodiscard]] virtual EntityKind getKind() const = 0;

    const std::string& getId() const { return m_id; }
    const std::string& getName() const { return m_name; }

    const HexCoordinate& getPosition() const { return m_movement.getCurrentPosition(); }
    void setPosition(const HexCoordinate& position) { m_movement.setPosition(position); }

    int getCurrentHp() const { return m_stats.getCurrentHp(); }
    int getMaxHp() const { return m_stats.getMaxHp(); }
    double getHpPercentage() const { return m_stats.getHpPercentage(); }
    int getEffectiveArmor() const;
    bool isAlive() const { return m_stats.isAlive(); }

    // Direct HP override, clamped to [0, maxHp]
    void setCurrentHp(int hp) { m_stats.setCurrentHp(hp); }

    bool canAct() const;
    bool canMove() const;
    bool canBeTargeted() const;

    /**
     * @brief Applies vulnerability, then armor (base + shield) through stats
     */
    DamageResult takeDamage(int amount, const std::string& source = "unknown");

    // Scaled by blessed/cursed before clamping at maxHp
    HealResult heal(int amount);

    int calculateDamageOutput() const;
    int calculateDamageOutput(int baseDamage) const;

    MoveResult moveTo(const HexCoordinate& target, const PositionSet& occupied,
                      const PositionSet& obstacles);

    EffectApplyResult addStatusEffect(StatusEffectType type, int duration,
                                      std::optional<int> value = std::nullopt);

    TargetCandidate toTargetCandidate() const;

    virtual void startRound();
    virtual EndOfRoundResult endRound();
    virtual void resetForEncounter();

    StatsComponent& stats() { return m_stats; }
    const StatsComponent& stats() const { return m_stats; }
    StatusEffectsComponent& statusEffects() { return m_statusEffects; }
    const StatusEffectsComponent& statusEffects() const { return m_statusEffects; }
    AbilitiesComponent& abilities() { return m_abilities; }
    const AbilitiesComponent& abilities() const { return m_abilities; }
    MovementComponent& movement() { return m_movement; }
    const MovementComponent& movement() const { return m_movement; }

protected:
    std::string m_id;
    std::string m_name;

private:
    StatsComponent m_stats;
    StatusEffectsComponent m_statusEffects;
    AbilitiesComponent m_abilities;
    MovementComponent m_movement;
};

using CombatEntityPtr = std::shared_ptr<CombatEntity>;

} // namespace HexCrawl

#endif // COMBAT_ENTITY_HPP
