/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef MOVEMENT_COMPONENT_HPP
#define MOVEMENT_COMPONENT_HPP

#include "utils/HexCoordinate.hpp"
#include <boost/container/small_vector.hpp>
#include <optional>
#include <string>
#include <vector>

namespace HexCrawl {

struct MoveResult {
    bool success{false};
    std::string reason;
    std::optional<HexCoordinate> newPosition;
};

struct MovementStats {
    int totalMoves{0};
    bool movedThisRound{false};
    int positionsVisited{0};
    double averageDistancePerMove{0.0};
};

/**
 * @brief Position, movement range and once-per-round movement rule
 *
 * Movement legality is by hex distance; path blocking is the caller's
 * concern (see HexPathfinder).
 */
class MovementComponent {
public:
    static constexpr size_t MAX_HISTORY = 32;

    explicit MovementComponent(const HexCoordinate& startingPosition = HexCoordinate{},
                               int movementRange = 3);

    const HexCoordinate& getCurrentPosition() const { return m_currentPosition; }
    const HexCoordinate& getStartingPosition() const { return m_startingPosition; }
    int getMovementRange() const { return m_movementRange; }
    bool hasMovedThisRound() const { return m_hasMovedThisRound; }
    std::vector<HexCoordinate> getMovementHistory() const;

    bool isPositionReachable(const HexCoordinate& target) const;

    /**
     * @brief Checks once-per-round, range, occupancy and obstacles in that order
     */
    MoveResult moveTo(const HexCoordinate& target, const PositionSet& occupied,
                      const PositionSet& obstacles);

    // Teleport without using the round's move
    void setPosition(const HexCoordinate& position);
    void setStartingPosition(const HexCoordinate& position);

    int getDistanceTo(const HexCoordinate& target) const;
    MovementStats getMovementStats() const;

    void resetForNewRound() { m_hasMovedThisRound = false; }

private:
    HexCoordinate m_currentPosition;
    HexCoordinate m_startingPosition;
    int m_movementRange;
    bool m_hasMovedThisRound{false};
    boost::container::small_vector<HexCoordinate, 16> m_history;
    int m_totalMoves{0};
    int m_totalDistance{0};

    void recordPosition(const HexCoordinate& position);
};

} // namespace HexCrawl

#endif // MOVEMENT_COMPONENT_HPP
