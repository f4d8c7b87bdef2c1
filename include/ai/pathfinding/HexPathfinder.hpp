/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef HEX_PATHFINDER_HPP
#define HEX_PATHFINDER_HPP

#include "utils/HexCoordinate.hpp"
#include <cstdint>
#include <optional>
#include <ostream>
#include <unordered_map>
#include <vector>

namespace HexCrawl {

class SettingsManager;

enum class PathfindingResult {
  SUCCESS,
  NO_PATH_FOUND,
  INVALID_GOAL,
  TOO_FAR,
  TIMEOUT,
  CORRUPTED_PATH
};

// Stream operator for PathfindingResult to support test output
inline std::ostream &operator<<(std::ostream &os,
                                const PathfindingResult &result) {
  switch (result) {
  case PathfindingResult::SUCCESS:
    return os << "SUCCESS";
  case PathfindingResult::NO_PATH_FOUND:
    return os << "NO_PATH_FOUND";
  case PathfindingResult::INVALID_GOAL:
    return os << "INVALID_GOAL";
  case PathfindingResult::TOO_FAR:
    return os << "TOO_FAR";
  case PathfindingResult::TIMEOUT:
    return os << "TIMEOUT";
  case PathfindingResult::CORRUPTED_PATH:
    return os << "CORRUPTED_PATH";
  default:
    return os << "UNKNOWN";
  }
}

/**
 * @brief A* over hex neighbors with unit step cost and hexDistance heuristic
 *
 * Every failure mode is a result code, never an exception: "no path" is a
 * normal answer for movement planning.
 */
class HexPathfinder {
public:
  static constexpr int DEFAULT_MAX_SEARCH_DISTANCE = 50;
  static constexpr int DEFAULT_MAX_ITERATIONS = 1000;
  static constexpr size_t MAX_PATH_LENGTH = 1000;

  using PredecessorMap = std::unordered_map<HexCoordinate, HexCoordinate>;

  /**
   * @throws std::invalid_argument if either limit is not positive
   */
  explicit HexPathfinder(int maxSearchDistance = DEFAULT_MAX_SEARCH_DISTANCE,
                         int maxIterations = DEFAULT_MAX_ITERATIONS);

  /**
   * @brief Reads pathfinding.maxSearchDistance and pathfinding.maxIterations
   */
  static HexPathfinder fromSettings(const SettingsManager &settings);

  PathfindingResult findPath(const HexCoordinate &start,
                             const HexCoordinate &goal,
                             const PositionSet &obstacles,
                             std::vector<HexCoordinate> &outPath);

  /**
   * @brief Next cell on the way to target, at most maxSteps along a path
   *
   * The target cell may be occupied (it is usually an enemy); the walk
   * stops on the last free cell before it. Returns nullopt when no path
   * exists or the mover is already adjacent.
   */
  std::optional<HexCoordinate> stepToward(const HexCoordinate &from,
                                          const HexCoordinate &target,
                                          const PositionSet &obstacles,
                                          int maxSteps);

  /**
   * @brief Walks a predecessor chain from goal back to start
   *
   * Aborts with CORRUPTED_PATH on a revisited cell, a broken link, or a
   * chain longer than MAX_PATH_LENGTH.
   */
  static PathfindingResult reconstructPath(const PredecessorMap &cameFrom,
                                           const HexCoordinate &start,
                                           const HexCoordinate &goal,
                                           std::vector<HexCoordinate> &outPath);

  int getMaxSearchDistance() const { return m_maxSearchDistance; }
  int getMaxIterations() const { return m_maxIterations; }

  struct PathfindingStats {
    uint64_t totalRequests{0};
    uint64_t successfulPaths{0};
    uint64_t failedPaths{0};
    uint64_t timeouts{0};
    uint64_t nodesExpanded{0};
  };

  void resetStats() { m_stats = PathfindingStats{}; }
  const PathfindingStats &getStats() const { return m_stats; }

private:
  int m_maxSearchDistance;
  int m_maxIterations;
  PathfindingStats m_stats{};

  PathfindingResult fail(PathfindingResult result);
};

/**
 * @brief One-shot A* with default limits
 */
std::optional<std::vector<HexCoordinate>>
findPath(const HexCoordinate &start, const HexCoordinate &goal,
         const PositionSet &obstacles);

} // namespace HexCrawl

#endif // HEX_PATHFINDER_HPP
