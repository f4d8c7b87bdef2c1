/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/HexPathfinder.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include <algorithm>
#include <queue>
#include <stdexcept>
#include <unordered_set>

namespace HexCrawl {

namespace {

struct OpenNode {
  int f;
  int h;
  uint32_t order;
  HexCoordinate hex;
};

// Lowest f first, then lowest h, then insertion order
struct OpenNodeCmp {
  bool operator()(const OpenNode &a, const OpenNode &b) const {
    if (a.f != b.f) {
      return a.f > b.f;
    }
    if (a.h != b.h) {
      return a.h > b.h;
    }
    return a.order > b.order;
  }
};

} // anonymous namespace

HexPathfinder::HexPathfinder(int maxSearchDistance, int maxIterations)
    : m_maxSearchDistance(maxSearchDistance), m_maxIterations(maxIterations) {
  if (maxSearchDistance <= 0) {
    throw std::invalid_argument("HexPathfinder search distance must be positive");
  }
  if (maxIterations <= 0) {
    throw std::invalid_argument("HexPathfinder iteration budget must be positive");
  }
}

HexPathfinder HexPathfinder::fromSettings(const SettingsManager &settings) {
  int distance = settings.get<int>("pathfinding", "maxSearchDistance",
                                   DEFAULT_MAX_SEARCH_DISTANCE);
  int iterations = settings.get<int>("pathfinding", "maxIterations",
                                     DEFAULT_MAX_ITERATIONS);
  if (distance <= 0) {
    PATHFIND_WARN("Ignoring non-positive pathfinding.maxSearchDistance");
    distance = DEFAULT_MAX_SEARCH_DISTANCE;
  }
  if (iterations <= 0) {
    PATHFIND_WARN("Ignoring non-positive pathfinding.maxIterations");
    iterations = DEFAULT_MAX_ITERATIONS;
  }
  return HexPathfinder(distance, iterations);
}

PathfindingResult HexPathfinder::fail(PathfindingResult result) {
  m_stats.failedPaths++;
  if (result == PathfindingResult::TIMEOUT) {
    m_stats.timeouts++;
  }
  return result;
}

PathfindingResult HexPathfinder::findPath(const HexCoordinate &start,
                                          const HexCoordinate &goal,
                                          const PositionSet &obstacles,
                                          std::vector<HexCoordinate> &outPath) {
  outPath.clear();
  m_stats.totalRequests++;

  const int directDistance = hexDistance(start, goal);
  if (directDistance > m_maxSearchDistance) {
    PATHFIND_DEBUG("findPath: TOO_FAR - distance " +
                   std::to_string(directDistance) + " exceeds " +
                   std::to_string(m_maxSearchDistance));
    return fail(PathfindingResult::TOO_FAR);
  }

  if (obstacles.count(goal) > 0) {
    PATHFIND_DEBUG("findPath: INVALID_GOAL - goal " + goal.toString() +
                   " is an obstacle");
    return fail(PathfindingResult::INVALID_GOAL);
  }

  if (start == goal) {
    outPath.push_back(start);
    m_stats.successfulPaths++;
    return PathfindingResult::SUCCESS;
  }

  std::priority_queue<OpenNode, std::vector<OpenNode>, OpenNodeCmp> openQueue;
  std::unordered_map<HexCoordinate, int> gScore;
  std::unordered_set<HexCoordinate> closed;
  PredecessorMap cameFrom;
  uint32_t order = 0;

  gScore[start] = 0;
  openQueue.push(OpenNode{directDistance, directDistance, order++, start});

  int iterations = 0;
  while (!openQueue.empty()) {
    const OpenNode current = openQueue.top();
    openQueue.pop();

    if (closed.count(current.hex) > 0) {
      continue;
    }
    if (iterations >= m_maxIterations) {
      PATHFIND_DEBUG("findPath: TIMEOUT after " + std::to_string(iterations) +
                     " iterations toward " + goal.toString());
      return fail(PathfindingResult::TIMEOUT);
    }
    ++iterations;
    m_stats.nodesExpanded++;

    if (current.hex == goal) {
      PathfindingResult result =
          reconstructPath(cameFrom, start, goal, outPath);
      if (result != PathfindingResult::SUCCESS) {
        return fail(result);
      }
      m_stats.successfulPaths++;
      return result;
    }

    closed.insert(current.hex);
    const int currentG = gScore[current.hex];

    for (const auto &neighbor : hexNeighbors(current.hex)) {
      if (closed.count(neighbor) > 0 || obstacles.count(neighbor) > 0) {
        continue;
      }

      const int tentativeG = currentG + 1;
      auto it = gScore.find(neighbor);
      if (it != gScore.end() && tentativeG >= it->second) {
        continue;
      }

      gScore[neighbor] = tentativeG;
      cameFrom[neighbor] = current.hex;
      const int h = hexDistance(neighbor, goal);
      openQueue.push(OpenNode{tentativeG + h, h, order++, neighbor});
    }
  }

  PATHFIND_DEBUG("findPath: NO_PATH_FOUND from " + start.toString() + " to " +
                 goal.toString());
  return fail(PathfindingResult::NO_PATH_FOUND);
}

PathfindingResult
HexPathfinder::reconstructPath(const PredecessorMap &cameFrom,
                               const HexCoordinate &start,
                               const HexCoordinate &goal,
                               std::vector<HexCoordinate> &outPath) {
  outPath.clear();
  std::unordered_set<HexCoordinate> visited;

  HexCoordinate current = goal;
  outPath.push_back(current);
  visited.insert(current);

  while (current != start) {
    auto it = cameFrom.find(current);
    if (it == cameFrom.end()) {
      PATHFIND_ERROR("reconstructPath: broken predecessor chain at " +
                     current.toString());
      outPath.clear();
      return PathfindingResult::CORRUPTED_PATH;
    }

    current = it->second;
    if (!visited.insert(current).second) {
      PATHFIND_ERROR("reconstructPath: cycle detected at " +
                     current.toString());
      outPath.clear();
      return PathfindingResult::CORRUPTED_PATH;
    }

    outPath.push_back(current);
    if (outPath.size() > MAX_PATH_LENGTH) {
      PATHFIND_ERROR("reconstructPath: path exceeds " +
                     std::to_string(MAX_PATH_LENGTH) + " cells");
      outPath.clear();
      return PathfindingResult::CORRUPTED_PATH;
    }
  }

  std::reverse(outPath.begin(), outPath.end());
  return PathfindingResult::SUCCESS;
}

std::optional<HexCoordinate>
HexPathfinder::stepToward(const HexCoordinate &from, const HexCoordinate &target,
                          const PositionSet &obstacles, int maxSteps) {
  if (maxSteps <= 0 || hexDistance(from, target) <= 1) {
    return std::nullopt;
  }

  PositionSet passable = obstacles;
  passable.erase(target);

  std::vector<HexCoordinate> path;
  if (findPath(from, target, passable, path) != PathfindingResult::SUCCESS ||
      path.size() < 3) {
    return std::nullopt;
  }

  // path[0] is the mover, path.back() is the target cell
  const size_t lastFree = path.size() - 2;
  const size_t index = std::min(static_cast<size_t>(maxSteps), lastFree);
  return path[index];
}

std::optional<std::vector<HexCoordinate>>
findPath(const HexCoordinate &start, const HexCoordinate &goal,
         const PositionSet &obstacles) {
  HexPathfinder pathfinder;
  std::vector<HexCoordinate> path;
  if (pathfinder.findPath(start, goal, obstacles, path) !=
      PathfindingResult::SUCCESS) {
    return std::nullopt;
  }
  return path;
}

} // namespace HexCrawl
