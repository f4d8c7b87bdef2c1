/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/HexCoordinate.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace HexCrawl {

HexCoordinate HexCoordinate::fromCube(int q, int r, int s) {
  if (q + r + s != 0) {
    std::string coords = std::to_string(q) + "," + std::to_string(r) + "," +
                         std::to_string(s);
    HEX_ERROR("Rejected cube coordinate (" + coords + "): q + r + s != 0");
    throw std::invalid_argument("Invalid cube coordinate " + coords +
                                ": q + r + s must equal 0");
  }
  return make(q, r);
}

std::string HexCoordinate::toString() const {
  return std::to_string(m_q) + "," + std::to_string(m_r) + "," +
         std::to_string(s());
}

std::ostream &operator<<(std::ostream &os, const HexCoordinate &hex) {
  return os << "(" << hex.toString() << ")";
}

bool FractionalHex::isValid() const { return std::abs(q + r + s) < HEX_EPSILON; }

HexCoordinate hexDirection(HexDirection direction) {
  return HEX_DIRECTIONS[static_cast<size_t>(direction)];
}

HexCoordinate hexNeighbor(const HexCoordinate &hex, HexDirection direction) {
  return hex + hexDirection(direction);
}

bool isValid(const HexCoordinate &hex) {
  return hex.q() + hex.r() + hex.s() == 0;
}

bool isValid(const FractionalHex &hex) { return hex.isValid(); }

int hexDistance(const HexCoordinate &a, const HexCoordinate &b) {
  const HexCoordinate delta = a - b;
  return std::max({std::abs(delta.q()), std::abs(delta.r()),
                   std::abs(delta.s())});
}

std::array<HexCoordinate, 6> hexNeighbors(const HexCoordinate &hex) {
  std::array<HexCoordinate, 6> result;
  for (size_t i = 0; i < HEX_DIRECTIONS.size(); ++i) {
    result[i] = hex + HEX_DIRECTIONS[i];
  }
  return result;
}

HexCoordinate hexRound(const FractionalHex &hex) {
  if (!hex.isValid()) {
    std::ostringstream oss;
    oss << hex.q << "," << hex.r << "," << hex.s;
    HEX_ERROR("hexRound received invalid fractional coordinate (" + oss.str() +
              ")");
    throw std::invalid_argument("Fractional coordinate (" + oss.str() +
                                ") breaks the cube-sum invariant");
  }

  double rq = std::round(hex.q);
  double rr = std::round(hex.r);
  double rs = std::round(hex.s);

  const double qDiff = std::abs(rq - hex.q);
  const double rDiff = std::abs(rr - hex.r);
  const double sDiff = std::abs(rs - hex.s);

  if (qDiff > rDiff && qDiff > sDiff) {
    rq = -rr - rs;
  } else if (rDiff > sDiff) {
    rr = -rq - rs;
  }
  // Otherwise s carries the largest error and is implied by q and r

  // Integer conversion also folds -0.0 into 0
  return HexCoordinate::make(static_cast<int>(rq), static_cast<int>(rr));
}

FractionalHex hexLerp(const HexCoordinate &a, const HexCoordinate &b,
                      double t) {
  return FractionalHex{a.q() + (b.q() - a.q()) * t,
                       a.r() + (b.r() - a.r()) * t,
                       a.s() + (b.s() - a.s()) * t};
}

std::string positionKey(const HexCoordinate &hex) { return hex.toString(); }

} // namespace HexCrawl
