#pragma once
/** @file  WorkcellConfig.hpp
 *  @brief Static roster + protocol description, and its JSON schema.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>
#include <vector>

// third-party headers
#include <nlohmann/json_fwd.hpp>

// labcell headers
#include "core/Position.hpp"
#include "core/RobotArm.hpp"
#include "core/SimulationClock.hpp"
#include "core/WorkcellState.hpp"
#include "protocols/TransferStep.hpp"

namespace labcell::core {

  struct DeviceSpec {
    std::string name;
    Position position;
    std::string purpose;
  };

  struct PlateSpec {
    std::string id;
    std::string location; ///< device name, or empty for a plate not yet loaded
  };

  /// Real-time pacing knobs; ignored when the run uses a VirtualClock.
  struct PacingSettings {
    double timeScale{ 1.0 };
    double maxWaitSeconds{ kDefaultMaxWaitSeconds };
  };

  struct WorkcellConfig {
    std::string name;
    Position home;
    ArmSettings arm;
    PacingSettings pacing;
    std::vector<DeviceSpec> devices;
    std::vector<PlateSpec> plates;
    std::string protocolName;                         ///< used when protocolSteps is empty
    std::string protocolPlate;                        ///< plate handed to the named protocol
    std::optional<protocols::Protocol> protocolSteps; ///< inline protocol from JSON
  };

  /// The five-station cell screening workcell with one plate in Storage.
  WorkcellConfig defaultWorkcellConfig();

  /**
   * @brief Validate \p j against the schema; absent keys keep the defaults.
   *
   * @throws std::runtime_error naming the offending key.
   */
  WorkcellConfig parseWorkcellConfig(const nlohmann::json& j);

  /// Inverse of parseWorkcellConfig (used by `--dump-config`).
  nlohmann::json toJson(const WorkcellConfig& cfg);

  /// Instantiate devices and load plates. Throws on duplicates or bad placement.
  WorkcellState buildWorkcellState(const WorkcellConfig& cfg);

} // namespace labcell::core
