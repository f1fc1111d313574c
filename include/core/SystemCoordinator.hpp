#pragma once

/** @file  SystemCoordinator.hpp
 *  @brief Public API for labcell::core::SystemCoordinator.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <memory>
#include <optional>
#include <string>

#include "core/WorkcellConfig.hpp"
#include "protocols/ProtocolRunner.hpp"

namespace labcell {
  namespace core {

    class ErrorMonitor;
    class Logger;
    class SimulationClock;

    /**
 * @class SystemCoordinator
 * @brief Application-level FSM: loads configuration, wires runner, clock,
 *        logger and error monitor, and runs the protocol once.
 *
 *  BOOT → INIT → IDLE → RUNNING → FINISHED, any stage may drop to ERROR.
 */
    class SystemCoordinator {

    public:
      enum class State { BOOT, INIT, IDLE, RUNNING, FINISHED, ERROR };

      struct Options {
        std::string configPath; ///< empty = built-in cell screening workcell
        std::string logPath;    ///< empty = no CSV run log
        bool realTime{ true };  ///< false = VirtualClock, no sleeping
      };

      explicit SystemCoordinator(Options opts);
      ~SystemCoordinator();

      SystemCoordinator(const SystemCoordinator&) = delete;
      SystemCoordinator& operator=(const SystemCoordinator&) = delete;

      // ---- Public API ----
      void initialize();                  ///< load config, build state, wire subsystems
      protocols::RunReport handleStart(); ///< user confirmed; run the protocol to the end
      void handleError(const std::string& reason);

      State state() const { return currentState_; }
      const std::optional<std::string>& lastError() const { return lastError_; }

      /// Valid from IDLE onwards; throws std::logic_error before.
      protocols::ProtocolRunner& runner();
      const WorkcellConfig& config() const { return config_; }
      const std::shared_ptr<ErrorMonitor>& errorMonitor() const { return errorMonitor_; }

    private:
      void transitionTo(State next);
      WorkcellConfig loadConfig() const;
      protocols::Protocol resolveProtocol() const;

      Options options_;
      WorkcellConfig config_{};
      // escalation writes these; they must outlive logger_ and runner_
      std::optional<std::string> lastError_{};
      State currentState_{ State::BOOT };
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::unique_ptr<Logger> logger_;
      std::unique_ptr<SimulationClock> clock_;
      std::unique_ptr<protocols::ProtocolRunner> runner_;
    };

    const char* toString(SystemCoordinator::State s);

  } // namespace core
} // namespace labcell
