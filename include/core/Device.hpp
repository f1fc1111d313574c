#pragma once
/** @file  Device.hpp
 *  @brief One physical station of the workcell (storage, liquid handler, ...).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <optional>
#include <string>

#include "core/Position.hpp"

namespace labcell {
  namespace core {

    enum class DeviceState : std::uint8_t { Idle, Busy, Error };

    inline const char* toString(DeviceState s) {
      switch (s) {
      case DeviceState::Idle:
        return "IDLE";
      case DeviceState::Busy:
        return "BUSY";
      case DeviceState::Error:
        return "ERROR";
      default:
        return "Unknown";
      }
    }

    /**
 * @class Device
 * @brief Named station with a fixed position and a single plate slot.
 *
 *  * The occupant is referenced by plate id, never copied.
 *  * `state_` is informational; it never gates a pick or place.
 */
    class Device {
    public:
      Device(std::string name, Position position, std::string purpose = "");

      const std::string& name() const { return name_; }
      const Position& position() const { return position_; }
      const std::string& purpose() const { return purpose_; }
      DeviceState state() const { return state_; }

      bool occupied() const { return occupant_.has_value(); }
      const std::optional<std::string>& occupant() const { return occupant_; }

      /// Throws StateError if a plate is already present.
      void markOccupied(const std::string& plateId);

      /// Throws StateError if the slot is already empty.
      void markFree();

      void setState(DeviceState s) { state_ = s; }

    private:
      std::string name_;
      Position position_;
      std::string purpose_;
      std::optional<std::string> occupant_{};
      DeviceState state_{ DeviceState::Idle };
    };

  } // namespace core
} // namespace labcell
