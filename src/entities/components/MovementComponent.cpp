/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/components/MovementComponent.hpp"

namespace HexCrawl {

MovementComponent::MovementComponent(const HexCoordinate& startingPosition, int movementRange)
    : m_currentPosition(startingPosition),
      m_startingPosition(startingPosition),
      m_movementRange(movementRange) {
    m_history.push_back(startingPosition);
}

std::vector<HexCoordinate> MovementComponent::getMovementHistory() const {
    return std::vector<HexCoordinate>(m_history.begin(), m_history.end());
}

bool MovementComponent::isPositionReachable(const HexCoordinate& target) const {
    return hexDistance(m_currentPosition, target) <= m_movementRange;
}

MoveResult MovementComponent::moveTo(const HexCoordinate& target, const PositionSet& occupied,
                                     const PositionSet& obstacles) {
    if (m_hasMovedThisRound) {
        return {false, "Already moved this round", std::nullopt};
    }

    if (!isPositionReachable(target)) {
        return {false,
                "Position too far (distance: " +
                    std::to_string(hexDistance(m_currentPosition, target)) +
                    ", max: " + std::to_string(m_movementRange) + ")",
                std::nullopt};
    }

    if (occupied.count(target) > 0) {
        return {false, "Position is occupied", std::nullopt};
    }

    if (obstacles.count(target) > 0) {
        return {false, "Position is blocked by obstacle", std::nullopt};
    }

    m_totalDistance += hexDistance(m_currentPosition, target);
    ++m_totalMoves;
    m_currentPosition = target;
    m_hasMovedThisRound = true;
    recordPosition(target);

    return {true, "", target};
}

void MovementComponent::setPosition(const HexCoordinate& position) {
    m_currentPosition = position;
    recordPosition(position);
}

void MovementComponent::setStartingPosition(const HexCoordinate& position) {
    m_startingPosition = position;
    m_currentPosition = position;
    m_hasMovedThisRound = false;
    m_history.clear();
    m_history.push_back(position);
    m_totalMoves = 0;
    m_totalDistance = 0;
}

int MovementComponent::getDistanceTo(const HexCoordinate& target) const {
    return hexDistance(m_currentPosition, target);
}

MovementStats MovementComponent::getMovementStats() const {
    MovementStats stats;
    stats.totalMoves = m_totalMoves;
    stats.movedThisRound = m_hasMovedThisRound;
    stats.positionsVisited = static_cast<int>(PositionSet(m_history.begin(), m_history.end()).size());
    stats.averageDistancePerMove =
        m_totalMoves > 0 ? static_cast<double>(m_totalDistance) / m_totalMoves : 0.0;
    return stats;
}

void MovementComponent::recordPosition(const HexCoordinate& position) {
    m_history.push_back(position);
    if (m_history.size() > MAX_HISTORY) {
        m_history.erase(m_history.begin());
    }
}

} // namespace HexCrawl
