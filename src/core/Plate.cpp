/* @file Plate.cpp
 * @brief plate location helpers
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/Plate.hpp"

using namespace labcell::core;

std::string PlateLocation::describe() const {
  switch (kind_) {
  case Kind::AtDevice:
    return device_;
  case Kind::InGripper:
    return "IN_GRIPPER";
  case Kind::None:
  default:
    return "NONE";
  }
}
