#pragma once
/** @file  Plate.hpp
 *  @brief Labware plate identity and its current location.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <string>
#include <utility>

namespace labcell {
  namespace core {

    /**
 * @class PlateLocation
 * @brief Exactly one of: on a named device, in the gripper, or nowhere.
 */
    class PlateLocation {
    public:
      enum class Kind : std::uint8_t { None, InGripper, AtDevice };

      static PlateLocation none() { return PlateLocation{ Kind::None, "" }; }
      static PlateLocation inGripper() { return PlateLocation{ Kind::InGripper, "" }; }
      static PlateLocation atDevice(std::string device) {
        return PlateLocation{ Kind::AtDevice, std::move(device) };
      }

      Kind kind() const { return kind_; }
      bool isAt(const std::string& device) const {
        return kind_ == Kind::AtDevice && device_ == device;
      }
      /// Empty unless kind() == AtDevice.
      const std::string& device() const { return device_; }

      /// "Storage", "IN_GRIPPER" or "NONE".
      std::string describe() const;

      bool operator==(const PlateLocation& other) const {
        return kind_ == other.kind_ && device_ == other.device_;
      }
      bool operator!=(const PlateLocation& other) const { return !(*this == other); }

    private:
      PlateLocation(Kind kind, std::string device) : kind_(kind), device_(std::move(device)) {}

      Kind kind_{ Kind::None };
      std::string device_{};
    };

    /**
 * @class Plate
 * @brief Plain data. Legality checks live in RobotArm and WorkcellState.
 */
    class Plate {
    public:
      explicit Plate(std::string id) : id_(std::move(id)) {}

      const std::string& id() const { return id_; }
      const PlateLocation& location() const { return location_; }

      void relocate(PlateLocation newLocation) { location_ = std::move(newLocation); }

    private:
      std::string id_;
      PlateLocation location_{ PlateLocation::none() };
    };

  } // namespace core
} // namespace labcell
