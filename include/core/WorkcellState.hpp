#pragma once
/** @file  WorkcellState.hpp
 *  @brief Aggregate of every device and plate in one simulated workcell.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/Device.hpp"
#include "core/Plate.hpp"
#include "core/Position.hpp"

namespace labcell {
  namespace core {

    /**
 * @class WorkcellState
 * @brief Owns the device roster and the plates, addressed by name / id.
 *
 *  * Handed by reference to every RobotArm operation; there are no globals.
 *  * Devices keep insertion order so reports list them as configured.
 */
    class WorkcellState {
    public:
      explicit WorkcellState(std::string name = "Workcell") : name_(std::move(name)) {}

      const std::string& name() const { return name_; }

      //---roster-----------------------------------------------------------
      /// Throws std::invalid_argument on a duplicate device name.
      Device& addDevice(Device device);

      /// Registers a plate at NONE. Throws std::invalid_argument on a duplicate id.
      Plate& addPlate(const std::string& plateId);

      /**
       * @brief Initial placement of a plate onto a station.
       *
       * Registers the plate if unknown. Throws StateError if the plate is
       * already somewhere or the device is occupied.
       */
      void loadPlate(const std::string& plateId, const std::string& deviceName);

      //---lookup (std::out_of_range when unknown)----------------------------
      Device& device(const std::string& name);
      const Device& device(const std::string& name) const;
      Plate& plate(const std::string& plateId);
      const Plate& plate(const std::string& plateId) const;

      bool hasDevice(const std::string& name) const { return deviceIndex_.count(name) != 0; }
      bool hasPlate(const std::string& plateId) const { return plateIndex_.count(plateId) != 0; }

      const std::vector<Device>& devices() const { return devices_; }
      const std::vector<Plate>& plates() const { return plates_; }

    private:
      std::string name_;
      std::vector<Device> devices_;
      std::vector<Plate> plates_;
      std::unordered_map<std::string, std::size_t> deviceIndex_;
      std::unordered_map<std::string, std::size_t> plateIndex_;
    };

    /**
     * @brief Lists every broken occupancy / location / gripper invariant.
     *
     * @param grippedPlate  id currently held by the arm, if any.
     * @returns one human-readable line per violation; empty when consistent.
     */
    std::vector<std::string> auditConsistency(const WorkcellState& state,
                                              const std::optional<std::string>& grippedPlate);

  } // namespace core
} // namespace labcell
