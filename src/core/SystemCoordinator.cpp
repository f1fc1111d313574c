/* @file SystemCoordinator.cpp
 * @brief boot sequence and run lifecycle of the simulator
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <stdexcept>
#include <utility>

// labcell headers
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/ProtocolFactory.hpp"
#include "core/SimulationClock.hpp"
#include "core/SystemCoordinator.hpp"
#include "io/ReportFormatter.hpp"

// third-party headers
#include <nlohmann/json.hpp>

using namespace labcell::core;

namespace {
  using State = SystemCoordinator::State;

  bool allowed(State from, State to) {
    if (to == State::ERROR)
      return true;
    switch (from) {
    case State::BOOT:
      return to == State::INIT;
    case State::INIT:
      return to == State::IDLE;
    case State::IDLE:
      return to == State::RUNNING;
    case State::RUNNING:
      return to == State::FINISHED;
    default:
      return false;
    }
  }
} // namespace

const char* labcell::core::toString(SystemCoordinator::State s) {
  switch (s) {
  case State::BOOT:
    return "BOOT";
  case State::INIT:
    return "INIT";
  case State::IDLE:
    return "IDLE";
  case State::RUNNING:
    return "RUNNING";
  case State::FINISHED:
    return "FINISHED";
  case State::ERROR:
    return "ERROR";
  default:
    return "Unknown";
  }
}

SystemCoordinator::SystemCoordinator(Options opts)
    : options_(std::move(opts)), errorMonitor_(std::make_shared<ErrorMonitor>()) {
  logger_ = std::make_unique<Logger>(errorMonitor_);
}

SystemCoordinator::~SystemCoordinator() {
  // close an interrupted run while the escalation target is still whole
  if (logger_)
    logger_->finishRun();
}

void SystemCoordinator::initialize() {
  transitionTo(State::INIT);

  errorMonitor_->registerEscalation([this](const std::string& msg) { handleError(msg); });

  try {
    config_ = loadConfig();
    protocols::Protocol steps = resolveProtocol();

    if (options_.realTime)
      clock_ = std::make_unique<RealTimeClock>(config_.pacing.timeScale,
                                               Seconds{ config_.pacing.maxWaitSeconds });
    else
      clock_ = std::make_unique<VirtualClock>();

    runner_ = std::make_unique<protocols::ProtocolRunner>(
        buildWorkcellState(config_), RobotArm(config_.home, config_.arm), std::move(steps),
        *clock_, errorMonitor_);
  } catch (const std::exception& e) {
    handleError(std::string("[SystemCoordinator] initialization failed: ") + e.what());
    return;
  }

  // every arm operation goes to the run log
  runner_->registerListener([this](const OperationEvent& ev) {
    logger_->log(io::toLogEvent(ev, clock_->now()));
  });

  transitionTo(State::IDLE);
}

labcell::protocols::RunReport SystemCoordinator::handleStart() {
  if (currentState_ != State::IDLE)
    throw std::logic_error(std::string("[SystemCoordinator] cannot start from state ") +
                           toString(currentState_));

  transitionTo(State::RUNNING);
  errorMonitor_->reset();

  // an unopenable log path is not a cell fault: the run goes ahead unlogged
  if (!options_.logPath.empty() && !logger_->startNewRun(options_.logPath))
    std::cerr << "[SystemCoordinator] cannot open run log " << options_.logPath
              << ", continuing without it\n";

  protocols::RunReport report = runner_->run();

  for (const auto& rec : report.records)
    logger_->log(io::toLogEvent(rec));
  logger_->finishRun(); // a lost log line escalates to ERROR

  if (currentState_ != State::RUNNING)
    return report; // escalated while running

  if (report.completed)
    transitionTo(State::FINISHED);
  else
    handleError("[SystemCoordinator] protocol aborted at step " +
                std::to_string(report.failedStep.value_or(report.stepsExecuted) + 1));
  return report;
}

void SystemCoordinator::handleError(const std::string& reason) {
  if (currentState_ == State::ERROR)
    return; // first fault wins
  lastError_ = reason;
  transitionTo(State::ERROR);
}

labcell::protocols::ProtocolRunner& SystemCoordinator::runner() {
  if (!runner_)
    throw std::logic_error("[SystemCoordinator] not initialized");
  return *runner_;
}

void SystemCoordinator::transitionTo(State next) {
  if (!allowed(currentState_, next))
    throw std::logic_error(std::string("[SystemCoordinator] illegal transition ") +
                           toString(currentState_) + " -> " + toString(next));
  currentState_ = next;
}

WorkcellConfig SystemCoordinator::loadConfig() const {
  if (options_.configPath.empty())
    return defaultWorkcellConfig();
  return parseWorkcellConfig(ConfigLoader(options_.configPath).load());
}

labcell::protocols::Protocol SystemCoordinator::resolveProtocol() const {
  if (config_.protocolSteps)
    return *config_.protocolSteps;
  return ProtocolFactory::withBuiltins().create(config_.protocolName, config_.protocolPlate);
}
