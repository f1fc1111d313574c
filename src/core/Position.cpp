/* @file Position.cpp
 * @brief euclidean distance between workcell points
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <cmath>

#include "core/Position.hpp"

using namespace labcell::core;

double Position::distanceTo(const Position& other) const {
  const double dx = x_ - other.x_;
  const double dy = y_ - other.y_;
  const double dz = z_ - other.z_;
  return std::sqrt(dx * dx + dy * dy + dz * dz);
}
