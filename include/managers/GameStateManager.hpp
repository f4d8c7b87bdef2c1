/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GAME_STATE_MANAGER_HPP
#define GAME_STATE_MANAGER_HPP

#include "ai/AIStrategy.hpp"
#include "entities/Monster.hpp"
#include "entities/Player.hpp"
#include "utils/HexCoordinate.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace HexCrawl {

enum class GamePhase { Setup, Playing, Paused, Ended };
enum class GameWinner { Players, Monsters, Draw };

std::string toString(GamePhase phase);
std::string toString(GameWinner winner);

inline std::ostream& operator<<(std::ostream& os, GamePhase phase) {
  return os << toString(phase);
}
inline std::ostream& operator<<(std::ostream& os, GameWinner winner) {
  return os << toString(winner);
}

// Detached copy of one combatant; never aliases live state
struct EntitySnapshot {
  std::string id;
  std::string name;
  EntityKind kind{EntityKind::Player};
  HexCoordinate position;
  int currentHp{0};
  int maxHp{0};
  int armor{0};
  bool alive{false};
  bool canAct{false};
  std::vector<StatusEffect> statusEffects;
};

struct GameStateSnapshot {
  int currentRound{0};
  GamePhase phase{GamePhase::Setup};
  std::vector<EntitySnapshot> players;
  std::vector<EntitySnapshot> monsters;
  PositionSet occupiedPositions;
  PositionSet obstacles;
  std::optional<GameWinner> winner;
  std::string endReason;
};

struct GameEndCheck {
  bool ended{false};
  std::optional<GameWinner> winner;
  std::string reason;
};

/**
 * @brief Owns the combatants, board and phase of one encounter.
 *
 * Players and monsters keep insertion order, which is also the action
 * resolution order. The occupied index tracks living entities only.
 */
class GameStateManager {
 public:
  /**
   * @throws std::invalid_argument on a null entity, a duplicate id or two
   *         entities placed on the same cell
   */
  GameStateManager(std::vector<PlayerPtr> players, std::vector<MonsterPtr> monsters,
                   PositionSet obstacles = {});

  GamePhase getPhase() const { return m_phase; }
  void setPhase(GamePhase phase);

  int getCurrentRound() const { return m_currentRound; }
  void setCurrentRound(int round) { m_currentRound = round; }
  void advanceRound() { ++m_currentRound; }

  const std::vector<PlayerPtr>& getPlayers() const { return m_players; }
  const std::vector<MonsterPtr>& getMonsters() const { return m_monsters; }
  std::vector<PlayerPtr> getLivingPlayers() const;
  std::vector<MonsterPtr> getLivingMonsters() const;

  CombatEntity* findEntity(const std::string& id) const;
  Player* findPlayer(const std::string& id) const;
  Monster* findMonster(const std::string& id) const;
  bool areOpponents(const CombatEntity& a, const CombatEntity& b) const;

  const PositionSet& getOccupiedPositions() const { return m_occupied; }
  void rebuildOccupiedPositions();
  void updateOccupiedPosition(const HexCoordinate& from, const HexCoordinate& to);

  const PositionSet& getObstacles() const { return m_obstacles; }
  // Refuses cells that hold a living combatant
  bool addObstacle(const HexCoordinate& position);

  /**
   * @brief Board view for one monster: living targetable foes and allies
   */
  TargetingContext buildTargetingContext(const Monster& monster) const;

  GameEndCheck checkGameEndConditions() const;
  void endGame(GameWinner winner, const std::string& reason);
  const std::optional<GameWinner>& getWinner() const { return m_winner; }
  const std::string& getEndReason() const { return m_endReason; }

  void startRoundForAll();

  static EntitySnapshot snapshot(const CombatEntity& entity);
  GameStateSnapshot snapshot() const;

 private:
  std::vector<PlayerPtr> m_players;
  std::vector<MonsterPtr> m_monsters;
  PositionSet m_obstacles;
  PositionSet m_occupied;
  GamePhase m_phase{GamePhase::Setup};
  int m_currentRound{0};
  std::optional<GameWinner> m_winner;
  std::string m_endReason;
};

} // namespace HexCrawl

#endif  // GAME_STATE_MANAGER_HPP
