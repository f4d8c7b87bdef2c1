/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/GameStateManager.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <unordered_set>

namespace HexCrawl {

std::string toString(GamePhase phase) {
  switch (phase) {
  case GamePhase::Setup:
    return "setup";
  case GamePhase::Playing:
    return "playing";
  case GamePhase::Paused:
    return "paused";
  case GamePhase::Ended:
    return "ended";
  }
  return "unknown";
}

std::string toString(GameWinner winner) {
  switch (winner) {
  case GameWinner::Players:
    return "players";
  case GameWinner::Monsters:
    return "monsters";
  case GameWinner::Draw:
    return "draw";
  }
  return "unknown";
}

GameStateManager::GameStateManager(std::vector<PlayerPtr> players,
                                   std::vector<MonsterPtr> monsters,
                                   PositionSet obstacles)
    : m_players(std::move(players)),
      m_monsters(std::move(monsters)),
      m_obstacles(std::move(obstacles)) {
  std::unordered_set<std::string> ids;
  PositionSet positions;
  auto registerId = [&ids, &positions](const CombatEntity* entity) {
    if (entity == nullptr) {
      GAMESTATE_ERROR("Null entity handed to GameStateManager");
      throw std::invalid_argument("GameStateManager: null entity");
    }
    if (!ids.insert(entity->getId()).second) {
      GAMESTATE_ERROR("Duplicate entity id: " + entity->getId());
      throw std::invalid_argument("GameStateManager: duplicate entity id " + entity->getId());
    }
    const HexCoordinate& position = entity->getPosition();
    if (!positions.insert(position).second) {
      GAMESTATE_ERROR("Two entities placed at " + position.toString() + ", second is " +
                      entity->getId());
      throw std::invalid_argument("GameStateManager: two entities at " + position.toString());
    }
  };

  for (const auto& player : m_players) {
    registerId(player.get());
  }
  for (const auto& monster : m_monsters) {
    registerId(monster.get());
  }

  rebuildOccupiedPositions();
  GAMESTATE_INFO("Encounter created with " + std::to_string(m_players.size()) + " players, " +
                 std::to_string(m_monsters.size()) + " monsters and " +
                 std::to_string(m_obstacles.size()) + " obstacles");
}

void GameStateManager::setPhase(GamePhase phase) {
  if (m_phase == phase) {
    return;
  }
  GAMESTATE_DEBUG("Phase " + toString(m_phase) + " -> " + toString(phase));
  m_phase = phase;
}

std::vector<PlayerPtr> GameStateManager::getLivingPlayers() const {
  std::vector<PlayerPtr> living;
  std::copy_if(m_players.begin(), m_players.end(), std::back_inserter(living),
               [](const PlayerPtr& p) { return p->isAlive(); });
  return living;
}

std::vector<MonsterPtr> GameStateManager::getLivingMonsters() const {
  std::vector<MonsterPtr> living;
  std::copy_if(m_monsters.begin(), m_monsters.end(), std::back_inserter(living),
               [](const MonsterPtr& m) { return m->isAlive(); });
  return living;
}

CombatEntity* GameStateManager::findEntity(const std::string& id) const {
  if (Player* player = findPlayer(id)) {
    return player;
  }
  return findMonster(id);
}

Player* GameStateManager::findPlayer(const std::string& id) const {
  auto it = std::find_if(m_players.begin(), m_players.end(),
                         [&id](const PlayerPtr& p) { return p->getId() == id; });
  return it != m_players.end() ? it->get() : nullptr;
}

Monster* GameStateManager::findMonster(const std::string& id) const {
  auto it = std::find_if(m_monsters.begin(), m_monsters.end(),
                         [&id](const MonsterPtr& m) { return m->getId() == id; });
  return it != m_monsters.end() ? it->get() : nullptr;
}

bool GameStateManager::areOpponents(const CombatEntity& a, const CombatEntity& b) const {
  return a.getKind() != b.getKind();
}

void GameStateManager::rebuildOccupiedPositions() {
  m_occupied.clear();
  for (const auto& player : m_players) {
    if (player->isAlive()) {
      m_occupied.insert(player->getPosition());
    }
  }
  for (const auto& monster : m_monsters) {
    if (monster->isAlive()) {
      m_occupied.insert(monster->getPosition());
    }
  }
}

void GameStateManager::updateOccupiedPosition(const HexCoordinate& from, const HexCoordinate& to) {
  m_occupied.erase(from);
  m_occupied.insert(to);
}

bool GameStateManager::addObstacle(const HexCoordinate& position) {
  if (m_occupied.count(position) > 0) {
    GAMESTATE_WARN("Cannot place obstacle on occupied cell " + position.toString());
    return false;
  }
  return m_obstacles.insert(position).second;
}

TargetingContext GameStateManager::buildTargetingContext(const Monster& monster) const {
  TargetingContext context;
  context.obstacles = m_obstacles;
  context.occupied = m_occupied;
  context.currentRound = m_currentRound;

  for (const auto& other : m_monsters) {
    if (other.get() != &monster && other->canBeTargeted()) {
      context.allies.push_back(other.get());
    }
  }
  for (const auto& player : m_players) {
    if (player->canBeTargeted()) {
      context.enemies.push_back(player.get());
    }
  }
  return context;
}

GameEndCheck GameStateManager::checkGameEndConditions() const {
  const bool anyPlayerAlive = std::any_of(m_players.begin(), m_players.end(),
                                          [](const PlayerPtr& p) { return p->isAlive(); });
  const bool anyMonsterAlive = std::any_of(m_monsters.begin(), m_monsters.end(),
                                           [](const MonsterPtr& m) { return m->isAlive(); });

  if (!anyPlayerAlive && !anyMonsterAlive) {
    return {true, GameWinner::Draw, "All combatants defeated"};
  }
  if (!anyMonsterAlive) {
    return {true, GameWinner::Players, "All monsters defeated"};
  }
  if (!anyPlayerAlive) {
    return {true, GameWinner::Monsters, "All players defeated"};
  }
  return {};
}

void GameStateManager::endGame(GameWinner winner, const std::string& reason) {
  m_phase = GamePhase::Ended;
  m_winner = winner;
  m_endReason = reason;
  GAMESTATE_INFO("Game ended: " + toString(winner) + " (" + reason + ")");
}

void GameStateManager::startRoundForAll() {
  for (const auto& player : m_players) {
    if (player->isAlive()) {
      player->startRound();
    }
  }
  for (const auto& monster : m_monsters) {
    if (monster->isAlive()) {
      monster->startRound();
    }
  }
}

EntitySnapshot GameStateManager::snapshot(const CombatEntity& entity) {
  EntitySnapshot snap;
  snap.id = entity.getId();
  snap.name = entity.getName();
  snap.kind = entity.getKind();
  snap.position = entity.getPosition();
  snap.currentHp = entity.getCurrentHp();
  snap.maxHp = entity.getMaxHp();
  snap.armor = entity.getEffectiveArmor();
  snap.alive = entity.isAlive();
  snap.canAct = entity.canAct();
  snap.statusEffects = entity.statusEffects().getEffects();
  return snap;
}

GameStateSnapshot GameStateManager::snapshot() const {
  GameStateSnapshot state;
  state.currentRound = m_currentRound;
  state.phase = m_phase;
  for (const auto& player : m_players) {
    state.players.push_back(snapshot(*player));
  }
  for (const auto& monster : m_monsters) {
    state.monsters.push_back(snapshot(*monster));
  }
  state.occupiedPositions = m_occupied;
  state.obstacles = m_obstacles;
  state.winner = m_winner;
  state.endReason = m_endReason;
  return state;
}

} // namespace HexCrawl
