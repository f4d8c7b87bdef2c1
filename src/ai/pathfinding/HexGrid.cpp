/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/HexGrid.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace HexCrawl {

size_t hexCountInRange(int radius) {
  if (radius < 0) {
    return 0;
  }
  const size_t r = static_cast<size_t>(radius);
  return 1 + 3 * r * (r + 1);
}

std::vector<HexCoordinate> hexesInRange(const HexCoordinate &center,
                                        int radius) {
  if (radius < 0) {
    PATHFIND_ERROR("hexesInRange: negative radius " + std::to_string(radius));
    throw std::invalid_argument("Range must be non-negative, got " +
                                std::to_string(radius));
  }

  std::vector<HexCoordinate> results;
  results.reserve(hexCountInRange(radius));

  for (int q = -radius; q <= radius; ++q) {
    const int rMin = std::max(-radius, -q - radius);
    const int rMax = std::min(radius, -q + radius);
    for (int r = rMin; r <= rMax; ++r) {
      results.push_back(center + HexCoordinate::make(q, r));
    }
  }
  return results;
}

std::vector<HexCoordinate> hexRing(const HexCoordinate &center, int radius) {
  if (radius < 0) {
    PATHFIND_ERROR("hexRing: negative radius " + std::to_string(radius));
    throw std::invalid_argument("Ring radius must be non-negative, got " +
                                std::to_string(radius));
  }
  if (radius == 0) {
    return {center};
  }

  std::vector<HexCoordinate> results;
  results.reserve(6 * static_cast<size_t>(radius));

  HexCoordinate hex = center + hexDirection(HexDirection::W) * radius;
  for (const auto &direction : HEX_DIRECTIONS) {
    for (int step = 0; step < radius; ++step) {
      results.push_back(hex);
      hex = hex + direction;
    }
  }
  return results;
}

std::vector<HexCoordinate> hexLine(const HexCoordinate &from,
                                   const HexCoordinate &to) {
  const int distance = hexDistance(from, to);
  if (distance == 0) {
    return {from};
  }

  std::vector<HexCoordinate> results;
  results.reserve(static_cast<size_t>(distance + 1));

  const double step = 1.0 / static_cast<double>(distance);
  for (int i = 0; i <= distance; ++i) {
    results.push_back(hexRound(hexLerp(from, to, step * i)));
  }
  // Guard the endpoints against accumulated floating error
  results.front() = from;
  results.back() = to;
  return results;
}

bool lineOfSight(const HexCoordinate &from, const HexCoordinate &to,
                 const PositionSet &obstacles) {
  if (hexDistance(from, to) <= 1) {
    return true;
  }
  if (obstacles.empty()) {
    return true;
  }

  const std::vector<HexCoordinate> line = hexLine(from, to);
  for (size_t i = 1; i + 1 < line.size(); ++i) {
    if (obstacles.count(line[i]) > 0) {
      return false;
    }
  }
  return true;
}

bool isValidAbilityTarget(const HexCoordinate &caster,
                          const HexCoordinate &target, int range,
                          const PositionSet &obstacles) {
  if (hexDistance(caster, target) > range) {
    return false;
  }
  return lineOfSight(caster, target, obstacles);
}

TacticalPositions tacticalPositions(const HexCoordinate &current,
                                    const HexCoordinate &target,
                                    int moveRange) {
  TacticalPositions positions;

  for (const auto &hex : hexesInRange(current, moveRange)) {
    const int distance = hexDistance(hex, target);
    if (distance <= 2) {
      positions.aggressive.push_back(hex);
    } else {
      positions.defensive.push_back(hex);
    }
  }

  std::stable_sort(positions.aggressive.begin(), positions.aggressive.end(),
                   [&target](const HexCoordinate &a, const HexCoordinate &b) {
                     return hexDistance(a, target) < hexDistance(b, target);
                   });
  std::stable_sort(positions.defensive.begin(), positions.defensive.end(),
                   [&target](const HexCoordinate &a, const HexCoordinate &b) {
                     return hexDistance(a, target) > hexDistance(b, target);
                   });
  return positions;
}

std::vector<HexCoordinate> reachablePositions(const HexCoordinate &current,
                                              int moveRange,
                                              const PositionSet &obstacles,
                                              const PositionSet &occupied) {
  std::vector<HexCoordinate> results;
  if (moveRange <= 0) {
    return results;
  }

  PositionSet visited{current};
  std::vector<HexCoordinate> frontier{current};

  for (int step = 0; step < moveRange && !frontier.empty(); ++step) {
    std::vector<HexCoordinate> next;
    for (const auto &hex : frontier) {
      for (const auto &neighbor : hexNeighbors(hex)) {
        if (visited.count(neighbor) > 0 || obstacles.count(neighbor) > 0 ||
            occupied.count(neighbor) > 0) {
          continue;
        }
        visited.insert(neighbor);
        next.push_back(neighbor);
      }
    }
    std::sort(next.begin(), next.end());
    results.insert(results.end(), next.begin(), next.end());
    frontier = std::move(next);
  }
  return results;
}

} // namespace HexCrawl
