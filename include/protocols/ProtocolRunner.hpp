#pragma once
/** @file  ProtocolRunner.hpp
 *  @brief Drives the RobotArm through a protocol and keeps the execution log.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

// labcell headers
#include "core/OperationEvent.hpp"
#include "core/RobotArm.hpp"
#include "core/SimulationClock.hpp"
#include "core/WorkcellState.hpp"
#include "protocols/TransferStep.hpp"

namespace labcell::core {
  class ErrorMonitor;
} // namespace labcell::core

namespace labcell::protocols {

  struct RunSummary {
    std::size_t totalTransfers{ 0 };
    std::size_t successfulTransfers{ 0 };
    std::size_t failedTransfers{ 0 };
    double successRate{ 0.0 }; ///< percent, 0 when nothing was attempted
    std::size_t robotMoves{ 0 };
    double distanceTraveledMm{ 0.0 };
    core::Seconds elapsed{ 0.0 };
  };

  struct RunReport {
    std::vector<TransferRecord> records;
    bool completed{ false };
    std::size_t stepsExecuted{ 0 };
    std::optional<std::size_t> failedStep{}; ///< zero-based index into the protocol
    RunSummary summary{};
  };

  /**
 * @class ProtocolRunner
 * @brief Owns the workcell aggregate and the arm, executes steps in order.
 *
 *  * Runs synchronously on the caller’s thread.
 *  * Fail-fast: the first TransferError is logged and ends the run; no retries.
 *  * Simulated durations are handed to the injected SimulationClock.
 */
  class ProtocolRunner {
  public:
    using Listener = std::function<void(const core::OperationEvent&)>;

    /// Throws std::invalid_argument if a step names a device the workcell lacks.
    ProtocolRunner(core::WorkcellState state, core::RobotArm arm, Protocol protocol,
                   core::SimulationClock& clock,
                   std::shared_ptr<core::ErrorMonitor> errMonitor = nullptr);

    //---public API------------------------------------------------------
    /// Every successful or failed arm operation is forwarded here, in order.
    void registerListener(Listener cb);

    /// Execute the remaining steps (fail-fast) and return the full report.
    RunReport run();

    /// Execute exactly one step. Returns false once the protocol is done or aborted.
    bool runNext();

    bool finished() const { return aborted_ || next_ >= protocol_.size(); }
    bool aborted() const { return aborted_; }
    std::size_t nextStep() const { return next_; }

    const std::vector<TransferRecord>& log() const { return log_; }
    RunSummary summary() const;
    RunReport report() const;

    //---state access (mutable access lets operators stage a scenario)-----
    core::WorkcellState& state() { return state_; }
    const core::WorkcellState& state() const { return state_; }
    core::RobotArm& arm() { return arm_; }
    const core::RobotArm& arm() const { return arm_; }
    const Protocol& protocol() const { return protocol_; }

  private:
    void executeTransfer(const TransferStep& step);
    void executeProcess(const TransferStep& step);
    void executeReturnHome();

    /// Notify listeners, then let the clock consume the duration.
    void apply(const core::OperationEvent& ev);
    void emit(const core::OperationEvent& ev);
    void recordFailure(const TransferStep& step, core::TimePoint startedAt,
                       core::OperationKind failedOp, const core::TransferError& err);

    core::WorkcellState state_;
    core::RobotArm arm_;
    Protocol protocol_;
    core::SimulationClock& clock_;
    std::shared_ptr<core::ErrorMonitor> errorMonitor_;

    std::vector<Listener> listeners_;
    std::vector<TransferRecord> log_;
    std::size_t next_{ 0 };
    bool aborted_{ false };
    std::optional<std::size_t> failedStep_{};
    std::optional<core::TimePoint> startedAt_{};
    core::OperationKind currentOp_{ core::OperationKind::Move };
  };

} // namespace labcell::protocols
