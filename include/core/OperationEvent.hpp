#pragma once
/** @file  OperationEvent.hpp
 *  @brief Result value of one RobotArm operation, observed by listeners.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <optional>
#include <string>

#include "core/SimulationClock.hpp"
#include "core/TransferErrors.hpp"

namespace labcell {
  namespace core {

    enum class OperationKind : std::uint8_t { Move, Pick, Place, Process, ReturnHome };

    inline const char* toString(OperationKind k) {
      switch (k) {
      case OperationKind::Move:
        return "MOVE";
      case OperationKind::Pick:
        return "PICK";
      case OperationKind::Place:
        return "PLACE";
      case OperationKind::Process:
        return "PROCESS";
      case OperationKind::ReturnHome:
        return "RETURN_HOME";
      default:
        return "Unknown";
      }
    }

    struct OperationEvent {
      OperationKind kind{ OperationKind::Move };
      std::string device;  ///< target device, or the home label
      std::string plateId; ///< empty for plain moves
      double distanceMm{ 0.0 };
      Seconds duration{ 0.0 };
      bool success{ true };
      std::optional<TransferErrorKind> errorKind{};
      std::string error{};
    };

  } // namespace core
} // namespace labcell
