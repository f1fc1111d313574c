#pragma once
/** @file  TransferStep.hpp
 *  @brief One line of a workcell protocol, and the record it leaves behind.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// labcell headers
#include "core/SimulationClock.hpp"
#include "core/TransferErrors.hpp"

namespace labcell {
  namespace protocols {

    enum class StepAction : std::uint8_t {
      Transfer,   ///< move to source, pick, move to destination, place
      Process,    ///< run the device holding the plate for a fixed time
      ReturnHome, ///< park the arm, no plate interaction
    };

    inline const char* toString(StepAction a) {
      switch (a) {
      case StepAction::Transfer:
        return "TRANSFER";
      case StepAction::Process:
        return "PROCESS";
      case StepAction::ReturnHome:
        return "RETURN_HOME";
      default:
        return "Unknown";
      }
    }

    struct TransferStep {
      std::string label;      ///< e.g. "Retrieve plate from cold storage"
      std::string plateId;
      std::string fromDevice; ///< Process: the device doing the work
      std::string toDevice;   ///< unused for Process / ReturnHome
      StepAction action{ StepAction::Transfer };
      core::Seconds processDuration{ 0.0 };

      static TransferStep transfer(std::string label, std::string plate, std::string from,
                                   std::string to);
      static TransferStep process(std::string label, std::string plate, std::string device,
                                  core::Seconds duration);
      static TransferStep returnHome(std::string label);
    };

    using Protocol = std::vector<TransferStep>;

    /// Append-only execution log entry.
    struct TransferRecord {
      core::TimePoint startedAt{};
      core::TimePoint finishedAt{};
      std::string plateId;
      std::string fromDevice;
      std::string toDevice;
      StepAction action{ StepAction::Transfer };
      bool success{ false };
      std::optional<core::TransferErrorKind> errorKind{};
      std::optional<std::string> errorReason{};
    };

  } // namespace protocols
} // namespace labcell
