/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GAME_LOOP_HPP
#define GAME_LOOP_HPP

#include "ai/AIDecision.hpp"
#include "controllers/combat/CombatAction.hpp"
#include "controllers/combat/CombatController.hpp"
#include "managers/GameStateManager.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace HexCrawl {

class SettingsManager;

struct GameLoopConfig {
    static constexpr int NO_ROUND_LIMIT = 0;

    int maxRounds{20};              // NO_ROUND_LIMIT disables the draw by round count
    int turnTimeoutMs{30000};
    int autoProgressAfterMs{5000};
    int maxSearchDistance{HexPathfinder::DEFAULT_MAX_SEARCH_DISTANCE};
    int maxIterations{HexPathfinder::DEFAULT_MAX_ITERATIONS};
    uint32_t rngSeed{CombatController::DEFAULT_RNG_SEED};

    /**
     * @brief Reads game.*, pathfinding.* and combat.rngSeed
     */
    static GameLoopConfig fromSettings(const SettingsManager& settings);

    /**
     * @brief Copy with misconfigured values replaced by safe ones
     *
     * Negative maxRounds becomes NO_ROUND_LIMIT, negative timeouts become 0
     * and non-positive pathfinding limits fall back to the defaults.
     * Each correction is logged as a warning.
     */
    GameLoopConfig normalized() const;

    bool hasRoundLimit() const { return maxRounds > 0; }
};

struct ActionSubmitResult {
    bool success{false};
    std::string reason;
};

/**
 * @brief Everything that happened in one processed round
 */
struct RoundResult {
    int roundNumber{0};
    std::vector<std::pair<std::string, AIDecision>> monsterDecisions;
    std::vector<ActionOutcome> actionResults;
    std::vector<EndOfRoundResult> statusEffectResults;
    bool gameEnded{false};
    std::optional<GameWinner> winner;
    std::string reason;
};

/**
 * GameLoop drives one encounter round by round.
 *
 * Phases: setup -> playing <-> paused -> ended. Ended is terminal and is
 * reached through stop() or when processRound() detects a win condition
 * or the round limit.
 *
 * Round order:
 * - living monsters that can act pick an AIDecision
 * - living players use their submitted action, or wait
 * - actions resolve players first, then monsters, each in insertion order
 * - status effects tick and cooldowns recover
 * - win conditions and the round limit are checked
 * - the round counter advances, also on the round that ends the game
 *
 * Single-threaded; every call completes synchronously.
 */
class GameLoop {
public:
    /**
     * Constructor
     * @param players Player side, in resolution order
     * @param monsters Monster side, in resolution order
     * @param config Limits; misconfigured values are normalized, not rejected
     * @param obstacles Terrain that blocks movement and line of sight
     * @throws std::invalid_argument on duplicate entity ids or shared cells
     *
     * If one side has no living members the loop starts ended with the other
     * side as winner, or a draw when both are empty.
     */
    GameLoop(std::vector<PlayerPtr> players, std::vector<MonsterPtr> monsters,
             const GameLoopConfig& config = GameLoopConfig{}, PositionSet obstacles = {});

    /**
     * Start the encounter: setup -> playing, round 1
     * No-op unless in setup.
     */
    void startGame();

    /**
     * Suspend round processing; buffered actions are kept
     */
    void pause();

    /**
     * Resume a paused encounter
     */
    void resume();

    /**
     * End the encounter immediately as a draw
     * Later processRound() calls return empty results and submissions are rejected.
     */
    void stop();

    /**
     * Buffer a player's action for the current round
     * @return Rejection reason when not playing, the entity is unknown, not a
     *         player or dead, required fields are missing, or an action is
     *         already buffered for this entity
     */
    ActionSubmitResult submitPlayerAction(const CombatAction& action);

    /**
     * Drop a buffered action so the player can submit again
     * @return true if an action was removed
     */
    bool clearPlayerAction(const std::string& entityId);

    bool hasSubmittedAction(const std::string& entityId) const;

    /**
     * Process one round
     * @return Result of the round; empty with the round unchanged when not playing
     */
    RoundResult processRound();

    // --- Read-only queries (detached copies) ---

    std::vector<EntitySnapshot> getAlivePlayers() const;
    std::vector<EntitySnapshot> getAliveMonsters() const;
    std::optional<EntitySnapshot> getEntityById(const std::string& id) const;
    GameStateSnapshot getGameState() const;
    std::vector<RoundResult> getRoundHistory() const { return m_roundHistory; }

    int getCurrentRound() const { return m_state.getCurrentRound(); }
    GamePhase getPhase() const { return m_state.getPhase(); }
    bool isPlaying() const { return m_state.getPhase() == GamePhase::Playing; }
    std::optional<GameWinner> getWinner() const { return m_state.getWinner(); }
    const GameLoopConfig& getConfig() const { return m_config; }

    PositionSet getObstacles() const { return m_state.getObstacles(); }
    bool addObstacle(const HexCoordinate& position);

private:
    GameLoopConfig m_config;
    GameStateManager m_state;
    CombatController m_combat;
    std::unordered_map<std::string, CombatAction> m_pendingActions;
    std::vector<RoundResult> m_roundHistory;

    std::vector<CombatAction> collectActions(RoundResult& result);
    void applyEndOfRound(RoundResult& result);
    void finishRound(RoundResult& result);
    RoundResult endedResult(const std::string& reason) const;
};

} // namespace HexCrawl

#endif // GAME_LOOP_HPP
