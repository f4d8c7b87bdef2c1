/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PLAYER_HPP
#define PLAYER_HPP

#include "entities/CombatEntity.hpp"
#include <memory>
#include <string>
#include <vector>

namespace HexCrawl {

class Player : public CombatEntity {
public:
    Player(const std::string& id, const std::string& name, const EntityStats& stats,
           const HexCoordinate& position, std::vector<AbilityDefinition> abilities = {});
    ~Player() override = default;

    [[nodiscard]] EntityKind getKind() const override { return EntityKind::Player; }

    // 100 HP, armor 2, damage 15, movement 3
    static EntityStats getDefaultStats();
    static std::shared_ptr<Player> createAdventurer(const std::string& id, const std::string& name,
                                                    const HexCoordinate& position);

    void recordDamageDealt(int amount);
    void recordHealingDone(int amount);
    int getTotalDamageDealt() const { return m_totalDamageDealt; }
    int getTotalHealingDone() const { return m_totalHealingDone; }

    void resetForEncounter() override;

private:
    int m_totalDamageDealt{0};
    int m_totalHealingDone{0};
};

using PlayerPtr = std::shared_ptr<Player>;

} // namespace HexCrawl

#endif // PLAYER_HPP
