/* @file ProtocolRunner.cpp
 * @brief fail-fast protocol execution over the workcell state machine
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>
#include <utility>

// labcell headers
#include "core/ErrorMonitor.hpp"
#include "protocols/ProtocolRunner.hpp"

using namespace labcell::protocols;
using labcell::core::OperationEvent;
using labcell::core::OperationKind;

ProtocolRunner::ProtocolRunner(core::WorkcellState state, core::RobotArm arm, Protocol protocol,
                               core::SimulationClock& clock,
                               std::shared_ptr<core::ErrorMonitor> errMonitor)
    : state_(std::move(state)), arm_(std::move(arm)), protocol_(std::move(protocol)),
      clock_(clock), errorMonitor_(std::move(errMonitor)) {
  auto requireDevice = [this](std::size_t index, const std::string& name) {
    if (!state_.hasDevice(name))
      throw std::invalid_argument("[ProtocolRunner] step " + std::to_string(index + 1) +
                                  " references unknown device '" + name + "'");
  };

  for (std::size_t i = 0; i < protocol_.size(); ++i) {
    const TransferStep& step = protocol_[i];
    switch (step.action) {
    case StepAction::Transfer:
      requireDevice(i, step.fromDevice);
      requireDevice(i, step.toDevice);
      break;
    case StepAction::Process:
      requireDevice(i, step.fromDevice);
      break;
    case StepAction::ReturnHome:
      break;
    }
  }
}

void ProtocolRunner::registerListener(Listener cb) { listeners_.push_back(std::move(cb)); }

RunReport ProtocolRunner::run() {
  while (runNext()) {
  }
  return report();
}

bool ProtocolRunner::runNext() {
  if (finished())
    return false;
  if (!startedAt_)
    startedAt_ = clock_.now();

  const TransferStep& step = protocol_[next_];
  const core::TimePoint stepStart = clock_.now();

  try {
    switch (step.action) {
    case StepAction::Transfer:
      executeTransfer(step);
      break;
    case StepAction::Process:
      executeProcess(step);
      break;
    case StepAction::ReturnHome:
      executeReturnHome();
      break;
    }
  } catch (const core::TransferError& err) {
    recordFailure(step, stepStart, currentOp_, err);
    aborted_ = true;
    failedStep_ = next_++;
    return false;
  }

  if (step.action == StepAction::Transfer) {
    TransferRecord rec;
    rec.startedAt = stepStart;
    rec.finishedAt = clock_.now();
    rec.plateId = step.plateId;
    rec.fromDevice = step.fromDevice;
    rec.toDevice = step.toDevice;
    rec.action = step.action;
    rec.success = true;
    log_.push_back(std::move(rec));
  }

  ++next_;
  return !finished();
}

void ProtocolRunner::executeTransfer(const TransferStep& step) {
  const core::Device& from = state_.device(step.fromDevice);
  const core::Device& to = state_.device(step.toDevice);

  currentOp_ = OperationKind::Move;
  if (!arm_.isAt(from.position()))
    apply(arm_.moveTo(from));

  currentOp_ = OperationKind::Pick;
  apply(arm_.pick(state_, step.fromDevice, step.plateId));

  currentOp_ = OperationKind::Move;
  if (!arm_.isAt(to.position()))
    apply(arm_.moveTo(to));

  currentOp_ = OperationKind::Place;
  apply(arm_.place(state_, step.toDevice));
}

void ProtocolRunner::executeProcess(const TransferStep& step) {
  currentOp_ = OperationKind::Process;
  apply(arm_.process(state_, step.fromDevice, step.plateId, step.processDuration));
  arm_.completeProcess(state_, step.fromDevice);
}

void ProtocolRunner::executeReturnHome() {
  currentOp_ = OperationKind::ReturnHome;
  apply(arm_.returnHome());
}

void ProtocolRunner::apply(const OperationEvent& ev) {
  emit(ev);
  clock_.advance(ev.duration);
}

void ProtocolRunner::emit(const OperationEvent& ev) {
  for (const auto& cb : listeners_)
    cb(ev);
}

void ProtocolRunner::recordFailure(const TransferStep& step, core::TimePoint startedAt,
                                   OperationKind failedOp, const core::TransferError& err) {
  OperationEvent ev;
  ev.kind = failedOp;
  ev.device = failedOp == OperationKind::Pick || failedOp == OperationKind::Process
                  ? step.fromDevice
                  : step.toDevice;
  ev.plateId = step.plateId;
  ev.success = false;
  ev.errorKind = err.kind();
  ev.error = err.what();
  emit(ev);

  TransferRecord rec;
  rec.startedAt = startedAt;
  rec.finishedAt = clock_.now();
  rec.plateId = step.plateId;
  rec.fromDevice = step.fromDevice;
  rec.toDevice = step.toDevice;
  rec.action = step.action;
  rec.success = false;
  rec.errorKind = err.kind();
  rec.errorReason = std::string(err.what());
  log_.push_back(std::move(rec));

  if (errorMonitor_)
    errorMonitor_->notifyFailure(std::string(core::toString(err.kind())) + ": " + err.what());
}

RunSummary ProtocolRunner::summary() const {
  RunSummary s;
  for (const auto& rec : log_) {
    if (rec.action != StepAction::Transfer)
      continue;
    ++s.totalTransfers;
    if (rec.success)
      ++s.successfulTransfers;
    else
      ++s.failedTransfers;
  }
  if (s.totalTransfers > 0)
    s.successRate = 100.0 * static_cast<double>(s.successfulTransfers) /
                    static_cast<double>(s.totalTransfers);
  s.robotMoves = arm_.moveCount();
  s.distanceTraveledMm = arm_.distanceTraveledMm();
  if (startedAt_)
    s.elapsed = std::chrono::duration_cast<core::Seconds>(clock_.now() - *startedAt_);
  return s;
}

RunReport ProtocolRunner::report() const {
  RunReport r;
  r.records = log_;
  r.completed = !aborted_ && next_ >= protocol_.size();
  r.stepsExecuted = next_;
  r.failedStep = failedStep_;
  r.summary = summary();
  return r;
}
