/* @file TransferStep.cpp
 * @brief step constructors
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <utility>

#include "protocols/TransferStep.hpp"

using namespace labcell::protocols;

TransferStep TransferStep::transfer(std::string label, std::string plate, std::string from,
                                    std::string to) {
  TransferStep s;
  s.label = std::move(label);
  s.plateId = std::move(plate);
  s.fromDevice = std::move(from);
  s.toDevice = std::move(to);
  s.action = StepAction::Transfer;
  return s;
}

TransferStep TransferStep::process(std::string label, std::string plate, std::string device,
                                   labcell::core::Seconds duration) {
  TransferStep s;
  s.label = std::move(label);
  s.plateId = std::move(plate);
  s.fromDevice = device;
  s.toDevice = std::move(device);
  s.action = StepAction::Process;
  s.processDuration = duration;
  return s;
}

TransferStep TransferStep::returnHome(std::string label) {
  TransferStep s;
  s.label = std::move(label);
  s.action = StepAction::ReturnHome;
  return s;
}
