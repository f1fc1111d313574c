/* @file RobotArm.cpp
 * @brief legality checks and state transitions for move / pick / place / process
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <utility>

// labcell headers
#include "core/Device.hpp"
#include "core/RobotArm.hpp"
#include "core/TransferErrors.hpp"
#include "core/WorkcellState.hpp"

using namespace labcell::core;

RobotArm::RobotArm(Position home, ArmSettings settings)
    : home_(std::move(home)), position_(home_), settings_(settings) {
  if (settings_.secondsPerMm < 0.0 || settings_.gripperDwell.count() < 0.0)
    throw std::invalid_argument("[RobotArm] motion settings must be non-negative");
}

Seconds RobotArm::travelTime(const Position& target) const {
  return Seconds{ position_.distanceTo(target) * settings_.secondsPerMm };
}

OperationEvent RobotArm::moveTo(const Device& device) {
  return travel(device.position(), OperationKind::Move, device.name());
}

OperationEvent RobotArm::moveTo(const Position& target) {
  return travel(target, OperationKind::Move, target.label());
}

OperationEvent RobotArm::returnHome() {
  return travel(home_, OperationKind::ReturnHome, home_.label());
}

OperationEvent RobotArm::travel(const Position& target, OperationKind kind,
                                const std::string& label) {
  OperationEvent ev;
  ev.kind = kind;
  ev.device = label;
  ev.plateId = gripped_.value_or("");
  ev.distanceMm = position_.distanceTo(target);
  ev.duration = travelTime(target);

  position_ = target;
  ++moves_;
  distanceMm_ += ev.distanceMm;
  return ev;
}

OperationEvent RobotArm::pick(WorkcellState& state, const std::string& deviceName,
                              const std::string& expectedPlate) {
  Device& dev = state.device(deviceName);

  if (gripped_)
    throw GripperOccupiedError("[RobotArm] already holding plate " + *gripped_ +
                               ", cannot pick from " + deviceName);
  if (!dev.occupied())
    throw EmptyLocationError("[RobotArm] " + deviceName + " has no plate to pick");
  if (!expectedPlate.empty() && *dev.occupant() != expectedPlate)
    throw EmptyLocationError("[RobotArm] " + deviceName + " holds " + *dev.occupant() +
                             ", expected " + expectedPlate);

  const std::string plateId = *dev.occupant();
  Plate& plate = state.plate(plateId); // last lookup that can throw

  dev.markFree();
  plate.relocate(PlateLocation::inGripper());
  gripped_ = plateId;

  OperationEvent ev;
  ev.kind = OperationKind::Pick;
  ev.device = deviceName;
  ev.plateId = plateId;
  ev.duration = settings_.gripperDwell;
  return ev;
}

OperationEvent RobotArm::place(WorkcellState& state, const std::string& deviceName) {
  Device& dev = state.device(deviceName);

  if (!gripped_)
    throw GripperEmptyError("[RobotArm] not holding a plate, cannot place into " + deviceName);
  if (dev.occupied())
    throw OccupiedLocationError("[RobotArm] " + deviceName + " already holds plate " +
                                *dev.occupant());

  const std::string plateId = *gripped_;
  Plate& plate = state.plate(plateId);

  dev.markOccupied(plateId);
  plate.relocate(PlateLocation::atDevice(deviceName));
  gripped_.reset();

  OperationEvent ev;
  ev.kind = OperationKind::Place;
  ev.device = deviceName;
  ev.plateId = plateId;
  ev.duration = settings_.gripperDwell;
  return ev;
}

OperationEvent RobotArm::process(WorkcellState& state, const std::string& deviceName,
                                 const std::string& expectedPlate, Seconds duration) {
  Device& dev = state.device(deviceName);

  if (!dev.occupied())
    throw NoPlateError("[RobotArm] " + deviceName + " has no plate to process");
  if (!expectedPlate.empty() && *dev.occupant() != expectedPlate)
    throw NoPlateError("[RobotArm] " + deviceName + " holds " + *dev.occupant() +
                       ", expected " + expectedPlate);
  if (duration.count() < 0.0)
    throw std::invalid_argument("[RobotArm] negative process duration for " + deviceName);

  dev.setState(DeviceState::Busy);

  OperationEvent ev;
  ev.kind = OperationKind::Process;
  ev.device = deviceName;
  ev.plateId = *dev.occupant();
  ev.duration = duration;
  return ev;
}

void RobotArm::completeProcess(WorkcellState& state, const std::string& deviceName) {
  state.device(deviceName).setState(DeviceState::Idle);
}
