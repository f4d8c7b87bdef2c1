/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef STATS_COMPONENT_HPP
#define STATS_COMPONENT_HPP

#include <string>

namespace HexCrawl {

/**
 * @brief Immutable base stats of an entity
 */
struct EntityStats {
    int maxHp = 100;
    int baseArmor = 0;
    int baseDamage = 10;
    int movementRange = 3;
};

struct DamageResult {
    int damageDealt{0};
    int blocked{0};
    bool died{false};
};

struct HealResult {
    int amountHealed{0};
    int newHp{0};
};

/**
 * @brief HP, armor and damage bookkeeping for one combat entity
 *
 * Armor blocks 10% of incoming damage per point, capped at 90%. A hit that
 * lands always deals at least 1 damage.
 */
class StatsComponent {
public:
    static constexpr double ARMOR_REDUCTION_RATE = 0.1;
    static constexpr double MAX_ARMOR_REDUCTION = 0.9;
    static constexpr double MIN_DAMAGE_MODIFIER = 0.1;

    /**
     * @throws std::invalid_argument if maxHp is not positive
     */
    explicit StatsComponent(const EntityStats& baseStats = EntityStats{});

    const EntityStats& getBaseStats() const { return m_baseStats; }
    int getCurrentHp() const { return m_currentHp; }
    int getMaxHp() const { return m_baseStats.maxHp; }
    int getBaseArmor() const { return m_baseStats.baseArmor; }
    int getTemporaryArmor() const { return m_temporaryArmor; }
    int getEffectiveArmor() const { return m_baseStats.baseArmor + m_temporaryArmor; }
    int getBaseDamage() const { return m_baseStats.baseDamage; }
    int getMovementRange() const { return m_baseStats.movementRange; }
    double getDamageModifier() const { return m_damageModifier; }

    bool isAlive() const { return m_currentHp > 0; }
    double getHpPercentage() const;
    bool isAtFullHealth() const { return m_currentHp == m_baseStats.maxHp; }
    bool isCriticallyWounded(double threshold = 0.25) const;

    /**
     * @brief Applies armor reduction and subtracts the rest from HP
     * @param bonusArmor Armor granted by status effects for this hit
     *
     * Non-positive amounts and hits on a dead entity do nothing.
     */
    DamageResult takeDamage(int amount, const std::string& source = "unknown",
                            int bonusArmor = 0);

    // Clamped at maxHp; dead entities cannot be healed
    HealResult heal(int amount);

    // Clamped to [0, maxHp]
    void setCurrentHp(int hp);
    void revive(double hpPercentage = 0.5);

    void addTemporaryArmor(int amount);
    void removeTemporaryArmor(int amount);
    void clearTemporaryArmor() { m_temporaryArmor = 0; }

    int calculateDamageOutput() const { return calculateDamageOutput(m_baseStats.baseDamage); }
    int calculateDamageOutput(int baseDamage) const;

    void setDamageModifier(double modifier);
    void addDamageModifier(double amount);

    void resetToFullHealth();
    void resetToStartingStats();

private:
    EntityStats m_baseStats;
    int m_currentHp;
    int m_temporaryArmor{0};
    double m_damageModifier{1.0};

    static int calculateArmorReduction(int damage, int armor);
};

} // namespace HexCrawl

#endif // STATS_COMPONENT_HPP
