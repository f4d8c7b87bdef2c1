/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/pathfinding/HexPathfinder.hpp"
#include "core/GameLoop.hpp"
#include "core/Logger.hpp"
#include "entities/Player.hpp"
#include "managers/MonsterTemplateManager.hpp"
#include "managers/SettingsManager.hpp"
#include <algorithm>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#ifndef HEXCRAWL_APP_NAME
#define HEXCRAWL_APP_NAME "hexcrawl_demo"
#endif

namespace {

struct DemoOptions {
  std::string settingsPath{"res/settings.json"};
  std::string monstersPath{"res/data/monsters.json"};
  int rounds{0};  // 0 keeps game.maxRounds
  int monsterCount{3};
  bool quiet{false};
};

void printUsage() {
  std::cout << "Usage: " << HEXCRAWL_APP_NAME
            << " [--settings <file>] [--monsters <file>] [--rounds <n>] [--count <n>] [--quiet]\n";
}

bool parseOptions(int argc, char* argv[], DemoOptions& options) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool hasValue = i + 1 < argc;
    if (arg == "--settings" && hasValue) {
      options.settingsPath = argv[++i];
    } else if (arg == "--monsters" && hasValue) {
      options.monstersPath = argv[++i];
    } else if (arg == "--rounds" && hasValue) {
      options.rounds = std::atoi(argv[++i]);
    } else if (arg == "--count" && hasValue) {
      options.monsterCount = std::max(1, std::atoi(argv[++i]));
    } else if (arg == "--quiet") {
      options.quiet = true;
    } else {
      return false;
    }
  }
  return true;
}

// Players attack an adjacent monster, otherwise walk toward the nearest one
HexCrawl::CombatAction choosePlayerAction(const HexCrawl::EntitySnapshot& player,
                                          const HexCrawl::GameStateSnapshot& state,
                                          HexCrawl::HexPathfinder& pathfinder) {
  using namespace HexCrawl;

  const EntitySnapshot* nearest = nullptr;
  int nearestDistance = 0;
  for (const auto& monster : state.monsters) {
    if (!monster.alive) {
      continue;
    }
    const int distance = hexDistance(player.position, monster.position);
    if (nearest == nullptr || distance < nearestDistance) {
      nearest = &monster;
      nearestDistance = distance;
    }
  }

  if (nearest == nullptr || !player.canAct) {
    return CombatAction::wait(player.id);
  }
  if (nearestDistance <= 1) {
    return CombatAction::attack(player.id, nearest->id);
  }

  PositionSet blocked = state.obstacles;
  blocked.insert(state.occupiedPositions.begin(), state.occupiedPositions.end());
  blocked.erase(player.position);

  auto step = pathfinder.stepToward(player.position, nearest->position, blocked,
                                    Player::getDefaultStats().movementRange);
  if (!step) {
    return CombatAction::wait(player.id);
  }
  return CombatAction::move(player.id, *step);
}

void printRound(const HexCrawl::RoundResult& round) {
  std::cout << "--- Round " << round.roundNumber << " ---\n";
  for (const auto& [monsterId, decision] : round.monsterDecisions) {
    std::cout << "  " << monsterId << " decides " << decision.variant() << " ("
              << decision.reasoning << ")\n";
  }
  for (const auto& outcome : round.actionResults) {
    std::cout << "  " << outcome.entityId << " " << outcome.variant << ": "
              << (outcome.success ? "ok" : "failed - " + outcome.reason);
    if (outcome.newPosition) {
      std::cout << " -> " << outcome.newPosition->toString();
    }
    for (const auto& hit : outcome.hits) {
      std::cout << " [" << hit.targetId << " -" << hit.damageDealt;
      if (hit.healingDone > 0) {
        std::cout << " +" << hit.healingDone;
      }
      if (hit.targetDied) {
        std::cout << " defeated";
      }
      std::cout << "]";
    }
    std::cout << "\n";
  }
  for (const auto& effects : round.statusEffectResults) {
    std::cout << "  " << effects.entityId << " effects: -" << effects.damageTaken << " +"
              << effects.healingReceived << (effects.died ? " (died)" : "") << "\n";
  }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
  using namespace HexCrawl;

  DemoOptions options;
  if (!parseOptions(argc, argv, options)) {
    printUsage();
    return 1;
  }
  if (options.quiet) {
    HEXCRAWL_ENABLE_BENCHMARK_MODE();
  }

  GAMELOOP_INFO("Initializing " + std::string(HEXCRAWL_APP_NAME));

  SettingsManager settings;
  if (!settings.loadFromFile(options.settingsPath)) {
    GAMELOOP_WARN("Failed to load " + options.settingsPath + " - using defaults");
  }

  MonsterTemplateManager templates;
  templates.registerBuiltinDefinitions();
  if (!templates.loadFromFile(options.monstersPath)) {
    GAMELOOP_WARN("Monster definitions incomplete - continuing with " +
                  std::to_string(templates.size()) + " definitions");
  }

  GameLoopConfig config = GameLoopConfig::fromSettings(settings);
  if (options.rounds > 0) {
    config.maxRounds = options.rounds;
  }

  std::vector<PlayerPtr> players{
      Player::createAdventurer("player_1", "Aldric", HexCoordinate::make(0, 0)),
      Player::createAdventurer("player_2", "Brenna", HexCoordinate::make(-1, 1))};

  const std::vector<HexCoordinate> spawnPoints{
      HexCoordinate::make(4, -2), HexCoordinate::make(5, -3), HexCoordinate::make(4, 0),
      HexCoordinate::make(5, -1), HexCoordinate::make(3, 1),  HexCoordinate::make(6, -3)};

  std::mt19937 rng(config.rngSeed);
  std::vector<MonsterPtr> monsters;
  const int count = std::min<int>(options.monsterCount, static_cast<int>(spawnPoints.size()));
  for (int i = 0; i < count; ++i) {
    const MonsterDefinition* definition = templates.pickWeighted(rng);
    if (definition == nullptr) {
      GAMELOOP_ERROR("No monster definitions available");
      return 1;
    }
    auto monster = templates.createMonster(definition->id,
                                           definition->id + "_" + std::to_string(i + 1),
                                           spawnPoints[static_cast<size_t>(i)]);
    if (monster) {
      monsters.push_back(monster);
    }
  }

  const PositionSet obstacles{HexCoordinate::make(2, -1), HexCoordinate::make(2, 1)};

  try {
    GameLoop loop(players, monsters, config, obstacles);
    HexPathfinder pathfinder(config.maxSearchDistance, config.maxIterations);

    loop.startGame();
    while (loop.isPlaying()) {
      const GameStateSnapshot state = loop.getGameState();
      for (const auto& player : state.players) {
        if (!player.alive) {
          continue;
        }
        ActionSubmitResult submitted =
            loop.submitPlayerAction(choosePlayerAction(player, state, pathfinder));
        if (!submitted.success) {
          GAMELOOP_WARN("Action for " + player.id + " rejected: " + submitted.reason);
        }
      }

      RoundResult round = loop.processRound();
      if (!options.quiet) {
        printRound(round);
      }
    }

    const auto winner = loop.getWinner();
    std::cout << "Encounter over after " << loop.getCurrentRound() << " rounds: "
              << (winner ? toString(*winner) : std::string("none")) << " ("
              << loop.getGameState().endReason << ")\n";
  } catch (const std::exception& e) {
    GAMELOOP_CRITICAL(std::string("Encounter failed: ") + e.what());
    return 1;
  }

  return 0;
}
