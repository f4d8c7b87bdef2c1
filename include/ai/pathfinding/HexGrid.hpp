/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef HEX_GRID_HPP
#define HEX_GRID_HPP

#include "utils/HexCoordinate.hpp"
#include <cstddef>
#include <vector>

namespace HexCrawl {

/**
 * @brief Reachable cells around a mover, split by distance to a target
 *
 * aggressive: distance to target <= 2, closest first
 * defensive:  distance to target >= 3, farthest first
 */
struct TacticalPositions {
  std::vector<HexCoordinate> aggressive;
  std::vector<HexCoordinate> defensive;
};

// Spatial queries over an unbounded hex plane. Pure functions.

/**
 * @brief Number of cells within radius, 1 + 3 * radius * (radius + 1)
 *
 * Computed in size_t so large radii do not overflow; 0 for negative radius.
 */
size_t hexCountInRange(int radius);

/**
 * @brief All cells within radius of center, center included
 * @throws std::invalid_argument on negative radius
 *
 * Size is hexCountInRange(radius). Ordered by q, then r.
 */
std::vector<HexCoordinate> hexesInRange(const HexCoordinate &center,
                                        int radius);

/**
 * @brief Cells at exactly radius from center
 * @throws std::invalid_argument on negative radius
 *
 * Starts at center + W * radius and walks the six directions.
 * Radius 0 yields {center}.
 */
std::vector<HexCoordinate> hexRing(const HexCoordinate &center, int radius);

/**
 * @brief Interpolated straight line, both endpoints included
 */
std::vector<HexCoordinate> hexLine(const HexCoordinate &from,
                                   const HexCoordinate &to);

/**
 * @brief True when no interior cell of hexLine(from, to) is an obstacle
 *
 * Adjacent or identical cells always see each other.
 */
bool lineOfSight(const HexCoordinate &from, const HexCoordinate &to,
                 const PositionSet &obstacles);

/**
 * @brief Range plus line-of-sight test for targeted abilities
 *
 * The target cell itself is not checked against obstacles; an adjacent
 * target always passes the sight test.
 */
bool isValidAbilityTarget(const HexCoordinate &caster,
                          const HexCoordinate &target, int range,
                          const PositionSet &obstacles);

TacticalPositions tacticalPositions(const HexCoordinate &current,
                                    const HexCoordinate &target,
                                    int moveRange);

/**
 * @brief Cells reachable in at most moveRange steps around blocked cells
 *
 * Blocked means in obstacles or occupied. The starting cell is excluded.
 * Ordered by step count, then by coordinate.
 */
std::vector<HexCoordinate> reachablePositions(const HexCoordinate &current,
                                              int moveRange,
                                              const PositionSet &obstacles,
                                              const PositionSet &occupied);

} // namespace HexCrawl

#endif // HEX_GRID_HPP
