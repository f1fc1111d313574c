/* @file Device.cpp
 * @brief occupancy bookkeeping for a single station
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <utility>

#include "core/Device.hpp"
#include "core/TransferErrors.hpp"

using namespace labcell::core;

Device::Device(std::string name, Position position, std::string purpose)
    : name_(std::move(name)), position_(std::move(position)), purpose_(std::move(purpose)) {}

void Device::markOccupied(const std::string& plateId) {
  if (occupant_)
    throw StateError("[Device] " + name_ + " already holds plate " + *occupant_);
  occupant_ = plateId;
}

void Device::markFree() {
  if (!occupant_)
    throw StateError("[Device] " + name_ + " has no plate to release");
  occupant_.reset();
}
