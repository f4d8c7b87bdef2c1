/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef HEX_COORDINATE_HPP
#define HEX_COORDINATE_HPP

#include <array>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>
#include <unordered_set>

namespace HexCrawl {

/**
 * @brief Cube coordinate of a hex cell with q + r + s == 0.
 *
 * Immutable value type. Every constructor derives or checks s, so an
 * instance that exists always satisfies the cube-sum invariant.
 */
class HexCoordinate {
public:
  constexpr HexCoordinate() = default;

  /**
   * @brief Builds a coordinate from axial (q, r), deriving s = -q - r
   */
  static constexpr HexCoordinate make(int q, int r) {
    return HexCoordinate(q, r);
  }

  /**
   * @brief Builds a coordinate from all three cube components
   * @throws std::invalid_argument if q + r + s != 0
   *
   * Entry point for coordinates arriving from outside the engine
   * (config files, transport payloads).
   */
  static HexCoordinate fromCube(int q, int r, int s);

  constexpr int q() const { return m_q; }
  constexpr int r() const { return m_r; }
  constexpr int s() const { return -m_q - m_r; }

  constexpr bool operator==(const HexCoordinate &other) const {
    return m_q == other.m_q && m_r == other.m_r;
  }
  constexpr bool operator!=(const HexCoordinate &other) const {
    return !(*this == other);
  }
  // Lexicographic on (q, r); gives containers a stable order
  constexpr bool operator<(const HexCoordinate &other) const {
    return m_q < other.m_q || (m_q == other.m_q && m_r < other.m_r);
  }

  constexpr HexCoordinate operator+(const HexCoordinate &other) const {
    return HexCoordinate(m_q + other.m_q, m_r + other.m_r);
  }
  constexpr HexCoordinate operator-(const HexCoordinate &other) const {
    return HexCoordinate(m_q - other.m_q, m_r - other.m_r);
  }
  constexpr HexCoordinate operator*(int factor) const {
    return HexCoordinate(m_q * factor, m_r * factor);
  }

  /**
   * @brief Canonical "q,r,s" key used by logs and external lookups
   */
  std::string toString() const;

private:
  constexpr HexCoordinate(int q, int r) : m_q(q), m_r(r) {}

  int m_q{0};
  int m_r{0};
};

std::ostream &operator<<(std::ostream &os, const HexCoordinate &hex);

/**
 * @brief Cube coordinate with real components, produced by interpolation
 */
struct FractionalHex {
  double q{0.0};
  double r{0.0};
  double s{0.0};

  bool isValid() const;
};

// Tolerance for |q + r + s| on fractional coordinates
inline constexpr double HEX_EPSILON = 1e-6;

// Directions in table order: NE, E, SE, SW, W, NW
enum class HexDirection { NE = 0, E, SE, SW, W, NW };

inline constexpr std::array<HexCoordinate, 6> HEX_DIRECTIONS = {
    HexCoordinate::make(1, -1), HexCoordinate::make(1, 0),
    HexCoordinate::make(0, 1),  HexCoordinate::make(-1, 1),
    HexCoordinate::make(-1, 0), HexCoordinate::make(0, -1)};

HexCoordinate hexDirection(HexDirection direction);
HexCoordinate hexNeighbor(const HexCoordinate &hex, HexDirection direction);

bool isValid(const HexCoordinate &hex);
bool isValid(const FractionalHex &hex);

/**
 * @brief Hex distance, max(|dq|, |dr|, |ds|)
 */
int hexDistance(const HexCoordinate &a, const HexCoordinate &b);

std::array<HexCoordinate, 6> hexNeighbors(const HexCoordinate &hex);

/**
 * @brief Rounds a fractional coordinate to the nearest cell
 * @throws std::invalid_argument if the input breaks the cube-sum invariant
 *
 * Each component is rounded, then the component with the largest
 * rounding error is recomputed from the other two.
 */
HexCoordinate hexRound(const FractionalHex &hex);

FractionalHex hexLerp(const HexCoordinate &a, const HexCoordinate &b,
                      double t);

std::string positionKey(const HexCoordinate &hex);

} // namespace HexCrawl

template <> struct std::hash<HexCrawl::HexCoordinate> {
  size_t operator()(const HexCrawl::HexCoordinate &hex) const noexcept {
    size_t seed = std::hash<int>{}(hex.q());
    seed ^= std::hash<int>{}(hex.r()) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    return seed;
  }
};

namespace HexCrawl {
// Obstacle and occupied-cell sets
using PositionSet = std::unordered_set<HexCoordinate>;
} // namespace HexCrawl

#endif // HEX_COORDINATE_HPP
