/* @file WorkcellState.cpp
 * @brief roster management and invariant audit for the workcell aggregate
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <utility>

// labcell headers
#include "core/TransferErrors.hpp"
#include "core/WorkcellState.hpp"

using namespace labcell::core;

Device& WorkcellState::addDevice(Device device) {
  if (hasDevice(device.name()))
    throw std::invalid_argument("[WorkcellState] duplicate device: " + device.name());

  deviceIndex_.emplace(device.name(), devices_.size());
  devices_.push_back(std::move(device));
  return devices_.back();
}

Plate& WorkcellState::addPlate(const std::string& plateId) {
  if (plateId.empty())
    throw std::invalid_argument("[WorkcellState] plate id must not be empty");
  if (hasPlate(plateId))
    throw std::invalid_argument("[WorkcellState] duplicate plate: " + plateId);

  plateIndex_.emplace(plateId, plates_.size());
  plates_.emplace_back(plateId);
  return plates_.back();
}

void WorkcellState::loadPlate(const std::string& plateId, const std::string& deviceName) {
  Device& dev = device(deviceName);

  // validate everything before touching either side
  if (hasPlate(plateId) && plate(plateId).location().kind() != PlateLocation::Kind::None)
    throw StateError("[WorkcellState] plate " + plateId + " is already at " +
                     plate(plateId).location().describe());
  if (dev.occupied())
    throw StateError("[WorkcellState] " + deviceName + " already holds plate " + *dev.occupant());

  Plate& p = hasPlate(plateId) ? plate(plateId) : addPlate(plateId);
  dev.markOccupied(plateId);
  p.relocate(PlateLocation::atDevice(deviceName));
}

Device& WorkcellState::device(const std::string& name) {
  auto it = deviceIndex_.find(name);
  if (it == deviceIndex_.end())
    throw std::out_of_range("[WorkcellState] unknown device: " + name);
  return devices_[it->second];
}

const Device& WorkcellState::device(const std::string& name) const {
  auto it = deviceIndex_.find(name);
  if (it == deviceIndex_.end())
    throw std::out_of_range("[WorkcellState] unknown device: " + name);
  return devices_[it->second];
}

Plate& WorkcellState::plate(const std::string& plateId) {
  auto it = plateIndex_.find(plateId);
  if (it == plateIndex_.end())
    throw std::out_of_range("[WorkcellState] unknown plate: " + plateId);
  return plates_[it->second];
}

const Plate& WorkcellState::plate(const std::string& plateId) const {
  auto it = plateIndex_.find(plateId);
  if (it == plateIndex_.end())
    throw std::out_of_range("[WorkcellState] unknown plate: " + plateId);
  return plates_[it->second];
}

std::vector<std::string> labcell::core::auditConsistency(
    const WorkcellState& state, const std::optional<std::string>& grippedPlate) {
  std::vector<std::string> issues;

  // device -> plate direction
  for (const auto& dev : state.devices()) {
    if (!dev.occupied())
      continue;
    const std::string& id = *dev.occupant();
    if (!state.hasPlate(id)) {
      issues.push_back(dev.name() + " holds unregistered plate " + id);
      continue;
    }
    if (!state.plate(id).location().isAt(dev.name()))
      issues.push_back(dev.name() + " holds " + id + " but the plate is at " +
                       state.plate(id).location().describe());
    if (grippedPlate && *grippedPlate == id)
      issues.push_back(id + " is both gripped and inside " + dev.name());
  }

  // plate -> device / gripper direction
  for (const auto& p : state.plates()) {
    const PlateLocation& loc = p.location();
    switch (loc.kind()) {
    case PlateLocation::Kind::AtDevice:
      if (!state.hasDevice(loc.device())) {
        issues.push_back(p.id() + " is at unknown device " + loc.device());
      } else {
        const Device& dev = state.device(loc.device());
        if (!dev.occupied() || *dev.occupant() != p.id())
          issues.push_back(p.id() + " claims " + loc.device() + " but the device disagrees");
      }
      break;
    case PlateLocation::Kind::InGripper:
      if (!grippedPlate || *grippedPlate != p.id())
        issues.push_back(p.id() + " is IN_GRIPPER but the gripper does not hold it");
      break;
    case PlateLocation::Kind::None:
      break;
    }
  }

  if (grippedPlate) {
    if (!state.hasPlate(*grippedPlate))
      issues.push_back("gripper holds unregistered plate " + *grippedPlate);
    else if (state.plate(*grippedPlate).location().kind() != PlateLocation::Kind::InGripper)
      issues.push_back("gripper holds " + *grippedPlate + " but the plate is at " +
                       state.plate(*grippedPlate).location().describe());
  }

  return issues;
}
