#pragma once
/** @file  TransferErrors.hpp
 *  @brief Exception taxonomy for illegal workcell operations.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <stdexcept>
#include <string>

namespace labcell {
  namespace core {

    /// Thrown by Device / WorkcellState when a caller breaks an occupancy rule directly.
    class StateError : public std::logic_error {
    public:
      using std::logic_error::logic_error;
    };

    enum class TransferErrorKind : std::uint8_t {
      GripperOccupied, ///< pick while already holding a plate
      EmptyLocation,   ///< pick from a device without the expected plate
      GripperEmpty,    ///< place with nothing gripped
      OccupiedLocation, ///< place into an occupied device
      NoPlate,         ///< process on a device without the expected plate
    };

    inline const char* toString(TransferErrorKind k) {
      switch (k) {
      case TransferErrorKind::GripperOccupied:
        return "GripperOccupiedError";
      case TransferErrorKind::EmptyLocation:
        return "EmptyLocationError";
      case TransferErrorKind::GripperEmpty:
        return "GripperEmptyError";
      case TransferErrorKind::OccupiedLocation:
        return "OccupiedLocationError";
      case TransferErrorKind::NoPlate:
        return "NoPlateError";
      default:
        return "Unknown";
      }
    }

    /**
 * @class TransferError
 * @brief Base for every RobotArm precondition failure.
 *
 *  * Recoverable by the caller; the arm is left untouched when one is thrown.
 */
    class TransferError : public std::runtime_error {
    public:
      TransferError(TransferErrorKind kind, const std::string& what)
          : std::runtime_error(what), kind_(kind) {}

      TransferErrorKind kind() const noexcept { return kind_; }

    private:
      TransferErrorKind kind_;
    };

    class GripperOccupiedError : public TransferError {
    public:
      explicit GripperOccupiedError(const std::string& what)
          : TransferError(TransferErrorKind::GripperOccupied, what) {}
    };

    class EmptyLocationError : public TransferError {
    public:
      explicit EmptyLocationError(const std::string& what)
          : TransferError(TransferErrorKind::EmptyLocation, what) {}
    };

    class GripperEmptyError : public TransferError {
    public:
      explicit GripperEmptyError(const std::string& what)
          : TransferError(TransferErrorKind::GripperEmpty, what) {}
    };

    class OccupiedLocationError : public TransferError {
    public:
      explicit OccupiedLocationError(const std::string& what)
          : TransferError(TransferErrorKind::OccupiedLocation, what) {}
    };

    class NoPlateError : public TransferError {
    public:
      explicit NoPlateError(const std::string& what)
          : TransferError(TransferErrorKind::NoPlate, what) {}
    };

  } // namespace core
} // namespace labcell
