#pragma once
/** @file  RobotArm.hpp
 *  @brief Single-gripper arm: the transfer state machine.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <optional>
#include <string>

#include "core/OperationEvent.hpp"
#include "core/Position.hpp"
#include "core/SimulationClock.hpp"

namespace labcell {
  namespace core {

    class Device;
    class WorkcellState;

    /// Motion tunables. Defaults match a 100 mm/s arm with a half-second grip.
    struct ArmSettings {
      double secondsPerMm{ 0.01 };
      Seconds gripperDwell{ 0.5 };
    };

    /**
 * @class RobotArm
 * @brief Holds the current position and at most one plate.
 *
 *  * Every operation checks all of its preconditions before mutating anything,
 *    so a thrown TransferError leaves arm, devices and plates untouched.
 *  * Operations never sleep; they report a duration in the returned event
 *    and the caller decides what to do with it.
 */
    class RobotArm {
    public:
      explicit RobotArm(Position home = Position(0.0, 0.0, 0.0, "Home"), ArmSettings settings = {});

      //---queries-----------------------------------------------------------
      const Position& currentPosition() const { return position_; }
      const Position& home() const { return home_; }
      const ArmSettings& settings() const { return settings_; }
      const std::optional<std::string>& grippedPlate() const { return gripped_; }
      bool holdingPlate() const { return gripped_.has_value(); }
      bool isAt(const Position& p) const { return position_ == p; }
      std::size_t moveCount() const { return moves_; }
      double distanceTraveledMm() const { return distanceMm_; }

      /// Pure estimate of the travel time from the current position.
      Seconds travelTime(const Position& target) const;

      //---operations--------------------------------------------------------
      /// Always succeeds.
      OperationEvent moveTo(const Device& device);
      OperationEvent moveTo(const Position& target);
      OperationEvent returnHome();

      /**
       * @brief Take \p expectedPlate out of \p deviceName.
       *
       * @throws GripperOccupiedError  already holding a plate.
       * @throws EmptyLocationError    device empty, or holding a different plate
       *                               (an empty \p expectedPlate accepts any).
       */
      OperationEvent pick(WorkcellState& state, const std::string& deviceName,
                          const std::string& expectedPlate);

      /**
       * @brief Put the gripped plate into \p deviceName.
       *
       * @throws GripperEmptyError      nothing gripped.
       * @throws OccupiedLocationError  device already holds a plate.
       */
      OperationEvent place(WorkcellState& state, const std::string& deviceName);

      /**
       * @brief Start processing the plate sitting in \p deviceName (device goes BUSY).
       *
       * @throws NoPlateError  device does not hold \p expectedPlate.
       */
      OperationEvent process(WorkcellState& state, const std::string& deviceName,
                             const std::string& expectedPlate, Seconds duration);

      /// Return a processing device to IDLE once its duration has elapsed.
      void completeProcess(WorkcellState& state, const std::string& deviceName);

    private:
      OperationEvent travel(const Position& target, OperationKind kind, const std::string& label);

      Position home_;
      Position position_;
      ArmSettings settings_;
      std::optional<std::string> gripped_{};
      std::size_t moves_{ 0 };
      double distanceMm_{ 0.0 };
    };

  } // namespace core
} // namespace labcell
