/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/GameLoop.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include <exception>

namespace HexCrawl {

GameLoopConfig GameLoopConfig::fromSettings(const SettingsManager& settings) {
    GameLoopConfig config;
    config.maxRounds = settings.get<int>("game", "maxRounds", config.maxRounds);
    config.turnTimeoutMs = settings.get<int>("game", "turnTimeoutMs", config.turnTimeoutMs);
    config.autoProgressAfterMs =
        settings.get<int>("game", "autoProgressAfterMs", config.autoProgressAfterMs);
    config.maxSearchDistance =
        settings.get<int>("pathfinding", "maxSearchDistance", config.maxSearchDistance);
    config.maxIterations = settings.get<int>("pathfinding", "maxIterations", config.maxIterations);
    config.rngSeed = static_cast<uint32_t>(
        settings.get<int>("combat", "rngSeed", static_cast<int>(config.rngSeed)));
    return config;
}

GameLoopConfig GameLoopConfig::normalized() const {
    GameLoopConfig config = *this;
    if (config.maxRounds < 0) {
        GAMELOOP_WARN("Negative maxRounds (" + std::to_string(config.maxRounds) +
                      "), rounds will not end the game");
        config.maxRounds = NO_ROUND_LIMIT;
    }
    if (config.turnTimeoutMs < 0) {
        GAMELOOP_WARN("Negative turnTimeoutMs clamped to 0");
        config.turnTimeoutMs = 0;
    }
    if (config.autoProgressAfterMs < 0) {
        GAMELOOP_WARN("Negative autoProgressAfterMs clamped to 0");
        config.autoProgressAfterMs = 0;
    }
    if (config.maxSearchDistance <= 0) {
        GAMELOOP_WARN("Non-positive maxSearchDistance, using default");
        config.maxSearchDistance = HexPathfinder::DEFAULT_MAX_SEARCH_DISTANCE;
    }
    if (config.maxIterations <= 0) {
        GAMELOOP_WARN("Non-positive maxIterations, using default");
        config.maxIterations = HexPathfinder::DEFAULT_MAX_ITERATIONS;
    }
    return config;
}

GameLoop::GameLoop(std::vector<PlayerPtr> players, std::vector<MonsterPtr> monsters,
                   const GameLoopConfig& config, PositionSet obstacles)
    : m_config(config.normalized()),
      m_state(std::move(players), std::move(monsters), std::move(obstacles)),
      m_combat(m_config.rngSeed,
               HexPathfinder(m_config.maxSearchDistance, m_config.maxIterations)) {
    const GameEndCheck check = m_state.checkGameEndConditions();
    if (check.ended) {
        GAMELOOP_INFO("Encounter has an empty side, starting ended");
        m_state.endGame(*check.winner, check.reason);
    }
}

void GameLoop::startGame() {
    if (m_state.getPhase() != GamePhase::Setup) {
        GAMELOOP_DEBUG("startGame ignored in phase " + toString(m_state.getPhase()));
        return;
    }
    m_state.setCurrentRound(1);
    m_state.setPhase(GamePhase::Playing);
    GAMELOOP_INFO("Game started");
}

void GameLoop::pause() {
    if (m_state.getPhase() == GamePhase::Playing) {
        m_state.setPhase(GamePhase::Paused);
        GAMELOOP_INFO("Game paused at round " + std::to_string(m_state.getCurrentRound()));
    }
}

void GameLoop::resume() {
    if (m_state.getPhase() == GamePhase::Paused) {
        m_state.setPhase(GamePhase::Playing);
        GAMELOOP_INFO("Game resumed");
    }
}

void GameLoop::stop() {
    if (m_state.getPhase() == GamePhase::Ended) {
        return;
    }
    m_pendingActions.clear();
    m_state.endGame(GameWinner::Draw, "Game stopped");
}

ActionSubmitResult GameLoop::submitPlayerAction(const CombatAction& action) {
    switch (m_state.getPhase()) {
    case GamePhase::Setup:
        return {false, "Game has not started"};
    case GamePhase::Paused:
        return {false, "Game is paused"};
    case GamePhase::Ended:
        return {false, "Game has ended"};
    case GamePhase::Playing:
        break;
    }

    Player* player = m_state.findPlayer(action.entityId);
    if (player == nullptr) {
        if (m_state.findMonster(action.entityId) != nullptr) {
            return {false, "Entity " + action.entityId + " is not a player"};
        }
        return {false, "Entity " + action.entityId + " not found"};
    }
    if (!player->isAlive()) {
        return {false, "Entity " + action.entityId + " is dead"};
    }
    if (auto invalid = action.validateFields()) {
        return {false, *invalid};
    }
    if (m_pendingActions.count(action.entityId) > 0) {
        return {false, "Action already submitted for " + action.entityId + " this round"};
    }

    m_pendingActions.emplace(action.entityId, action);
    GAMELOOP_DEBUG("Accepted " + toString(action.variant) + " from " + action.entityId);
    return {true, ""};
}

bool GameLoop::clearPlayerAction(const std::string& entityId) {
    return m_pendingActions.erase(entityId) > 0;
}

bool GameLoop::hasSubmittedAction(const std::string& entityId) const {
    return m_pendingActions.count(entityId) > 0;
}

RoundResult GameLoop::endedResult(const std::string& reason) const {
    RoundResult result;
    result.roundNumber = m_state.getCurrentRound();
    result.gameEnded = m_state.getPhase() == GamePhase::Ended;
    result.winner = m_state.getWinner();
    result.reason = reason;
    return result;
}

RoundResult GameLoop::processRound() {
    if (m_state.getPhase() != GamePhase::Playing) {
        return endedResult(m_state.getPhase() == GamePhase::Ended ? m_state.getEndReason() : "");
    }

    RoundResult result;
    result.roundNumber = m_state.getCurrentRound();

    try {
        // HP may have been changed directly between rounds
        m_state.rebuildOccupiedPositions();
        // Nothing resolves when a side is already gone; finishRound ends the game
        if (!m_state.checkGameEndConditions().ended) {
            m_state.startRoundForAll();
            const std::vector<CombatAction> actions = collectActions(result);
            result.actionResults = m_combat.resolveAll(actions, m_state);
            applyEndOfRound(result);
        }
    } catch (const std::exception& e) {
        GAMELOOP_CRITICAL("Round " + std::to_string(result.roundNumber) +
                          " aborted: " + e.what());
        result.reason = std::string("Round aborted: ") + e.what();
    }

    m_state.rebuildOccupiedPositions();
    finishRound(result);
    return result;
}

std::vector<CombatAction> GameLoop::collectActions(RoundResult& result) {
    std::vector<CombatAction> actions;

    for (const auto& player : m_state.getPlayers()) {
        if (!player->isAlive()) {
            continue;
        }
        auto it = m_pendingActions.find(player->getId());
        actions.push_back(it != m_pendingActions.end() ? it->second
                                                       : CombatAction::wait(player->getId()));
    }

    for (const auto& monster : m_state.getMonsters()) {
        if (!monster->canAct()) {
            continue;
        }
        const TargetingContext context = m_state.buildTargetingContext(*monster);
        AIDecision decision = monster->makeDecision(context, m_combat.getPathfinder());
        actions.push_back(decision.toAction(monster->getId()));
        result.monsterDecisions.emplace_back(monster->getId(), std::move(decision));
    }

    return actions;
}

void GameLoop::applyEndOfRound(RoundResult& result) {
    auto process = [&result](CombatEntity& entity) {
        if (!entity.isAlive()) {
            return;
        }
        EndOfRoundResult effects = entity.endRound();
        if (!effects.ticks.empty() || !effects.expiredEffects.empty() ||
            !effects.readyAbilities.empty()) {
            result.statusEffectResults.push_back(std::move(effects));
        }
    };

    for (const auto& player : m_state.getPlayers()) {
        process(*player);
    }
    for (const auto& monster : m_state.getMonsters()) {
        process(*monster);
    }
}

void GameLoop::finishRound(RoundResult& result) {
    const GameEndCheck check = m_state.checkGameEndConditions();
    if (check.ended) {
        m_state.endGame(*check.winner, check.reason);
    } else if (m_config.hasRoundLimit() && m_state.getCurrentRound() >= m_config.maxRounds) {
        m_state.endGame(GameWinner::Draw, "Maximum rounds reached");
    }

    if (m_state.getPhase() == GamePhase::Ended) {
        result.gameEnded = true;
        result.winner = m_state.getWinner();
        result.reason = m_state.getEndReason();
    }

    m_pendingActions.clear();
    m_state.advanceRound();
    m_roundHistory.push_back(result);

    GAMELOOP_DEBUG("Round " + std::to_string(result.roundNumber) + " processed: " +
                   std::to_string(result.actionResults.size()) + " actions" +
                   (result.gameEnded ? ", game ended (" + result.reason + ")" : ""));
}

std::vector<EntitySnapshot> GameLoop::getAlivePlayers() const {
    std::vector<EntitySnapshot> players;
    for (const auto& player : m_state.getLivingPlayers()) {
        players.push_back(GameStateManager::snapshot(*player));
    }
    return players;
}

std::vector<EntitySnapshot> GameLoop::getAliveMonsters() const {
    std::vector<EntitySnapshot> monsters;
    for (const auto& monster : m_state.getLivingMonsters()) {
        monsters.push_back(GameStateManager::snapshot(*monster));
    }
    return monsters;
}

std::optional<EntitySnapshot> GameLoop::getEntityById(const std::string& id) const {
    if (const CombatEntity* entity = m_state.findEntity(id)) {
        return GameStateManager::snapshot(*entity);
    }
    return std::nullopt;
}

GameStateSnapshot GameLoop::getGameState() const {
    return m_state.snapshot();
}

bool GameLoop::addObstacle(const HexCoordinate& position) {
    return m_state.addObstacle(position);
}

} // namespace HexCrawl
