/* @file WorkcellConfig.cpp
 * @brief default roster, JSON schema validation and state construction
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <utility>

// third-party headers
#include <nlohmann/json.hpp>

// labcell headers
#include "core/WorkcellConfig.hpp"
#include "protocols/CellScreening.hpp"

using json = nlohmann::json;
using labcell::protocols::Protocol;
using labcell::protocols::StepAction;
using labcell::protocols::TransferStep;

namespace labcell::core {

  namespace {

    [[noreturn]] void schemaError(const std::string& where, const std::string& what) {
      throw std::runtime_error("[WorkcellConfig] " + where + ": " + what);
    }

    Position readPosition(const json& j, const std::string& where, const std::string& label) {
      if (!j.is_array() || j.size() != 3)
        schemaError(where, "expected [x, y, z]");
      for (const auto& v : j)
        if (!v.is_number())
          schemaError(where, "coordinates must be numbers");
      return Position(j[0].get<double>(), j[1].get<double>(), j[2].get<double>(), label);
    }

    std::string readString(const json& obj, const char* key, const std::string& where) {
      auto it = obj.find(key);
      if (it == obj.end() || !it->is_string())
        schemaError(where, std::string("missing string '") + key + "'");
      return it->get<std::string>();
    }

    double readNumber(const json& obj, const char* key, const std::string& where,
                      double fallback) {
      auto it = obj.find(key);
      if (it == obj.end())
        return fallback;
      if (!it->is_number())
        schemaError(where, std::string("'") + key + "' must be a number");
      const double v = it->get<double>();
      if (v < 0.0)
        schemaError(where, std::string("'") + key + "' must be >= 0");
      return v;
    }

    TransferStep readStep(const json& j, std::size_t index, const std::string& defaultPlate) {
      const std::string where = "protocol[" + std::to_string(index) + "]";
      if (!j.is_object())
        schemaError(where, "expected an object");

      const std::string action = readString(j, "action", where);
      const std::string label = j.value("label", "");
      const std::string plate = j.value("plate", defaultPlate);

      if (action == "transfer")
        return TransferStep::transfer(label, plate, readString(j, "from", where),
                                      readString(j, "to", where));
      if (action == "process")
        return TransferStep::process(label, plate, readString(j, "device", where),
                                     Seconds{ readNumber(j, "seconds", where, 0.0) });
      if (action == "return_home")
        return TransferStep::returnHome(label);

      schemaError(where, "unknown action '" + action + "'");
    }

    const char* actionKey(StepAction a) {
      switch (a) {
      case StepAction::Transfer:
        return "transfer";
      case StepAction::Process:
        return "process";
      case StepAction::ReturnHome:
      default:
        return "return_home";
      }
    }

    json positionJson(const Position& p) { return json::array({ p.x(), p.y(), p.z() }); }

  } // namespace

  WorkcellConfig defaultWorkcellConfig() {
    WorkcellConfig cfg;
    cfg.name = "Cell Line Screening Workcell";
    cfg.home = Position(0.0, 0.0, 0.0, "Home");
    cfg.devices = {
      { "Storage", Position(100.0, 200.0, 50.0, "Storage"), "Cold plate storage" },
      { "LiquidHandler", Position(400.0, 200.0, 100.0, "LiquidHandler"),
        "Media and reagent dispensing" },
      { "ThermalCycler", Position(700.0, 200.0, 80.0, "ThermalCycler"), "Incubation" },
      { "PlateReader", Position(1000.0, 200.0, 90.0, "PlateReader"), "Absorbance readout" },
      { "Centrifuge", Position(550.0, 400.0, 75.0, "Centrifuge"), "Cell pelleting" },
    };
    cfg.plates = { { protocols::kCellScreeningPlate, "Storage" } };
    cfg.protocolName = protocols::kCellScreeningProtocol;
    cfg.protocolPlate = protocols::kCellScreeningPlate;
    return cfg;
  }

  WorkcellConfig parseWorkcellConfig(const json& j) {
    if (!j.is_object())
      schemaError("<root>", "expected an object");

    WorkcellConfig cfg = defaultWorkcellConfig();

    if (j.contains("workcell")) {
      if (!j["workcell"].is_string())
        schemaError("workcell", "expected a string");
      cfg.name = j["workcell"].get<std::string>();
    }

    if (auto it = j.find("robot"); it != j.end()) {
      if (!it->is_object())
        schemaError("robot", "expected an object");
      cfg.arm.secondsPerMm = readNumber(*it, "seconds_per_mm", "robot", cfg.arm.secondsPerMm);
      cfg.arm.gripperDwell =
          Seconds{ readNumber(*it, "gripper_seconds", "robot", cfg.arm.gripperDwell.count()) };
      if (it->contains("home"))
        cfg.home = readPosition((*it)["home"], "robot.home", "Home");
    }

    if (auto it = j.find("pacing"); it != j.end()) {
      if (!it->is_object())
        schemaError("pacing", "expected an object");
      cfg.pacing.timeScale = readNumber(*it, "time_scale", "pacing", cfg.pacing.timeScale);
      cfg.pacing.maxWaitSeconds =
          readNumber(*it, "max_wait_seconds", "pacing", cfg.pacing.maxWaitSeconds);
    }

    if (auto it = j.find("devices"); it != j.end()) {
      if (!it->is_array() || it->empty())
        schemaError("devices", "expected a non-empty array");
      cfg.devices.clear();
      for (std::size_t i = 0; i < it->size(); ++i) {
        const json& d = (*it)[i];
        const std::string where = "devices[" + std::to_string(i) + "]";
        if (!d.is_object())
          schemaError(where, "expected an object");
        DeviceSpec spec;
        spec.name = readString(d, "name", where);
        if (!d.contains("position"))
          schemaError(where, "missing 'position'");
        spec.position = readPosition(d["position"], where + ".position", spec.name);
        spec.purpose = d.value("purpose", "");
        cfg.devices.push_back(std::move(spec));
      }
    }

    if (auto it = j.find("plates"); it != j.end()) {
      if (!it->is_array())
        schemaError("plates", "expected an array");
      cfg.plates.clear();
      for (std::size_t i = 0; i < it->size(); ++i) {
        const json& p = (*it)[i];
        const std::string where = "plates[" + std::to_string(i) + "]";
        if (!p.is_object())
          schemaError(where, "expected an object");
        cfg.plates.push_back({ readString(p, "id", where), p.value("location", "") });
      }
      cfg.protocolPlate = cfg.plates.empty() ? "" : cfg.plates.front().id;
    }

    if (j.contains("protocol_plate")) {
      if (!j["protocol_plate"].is_string())
        schemaError("protocol_plate", "expected a string");
      cfg.protocolPlate = j["protocol_plate"].get<std::string>();
    }

    if (auto it = j.find("protocol"); it != j.end()) {
      if (it->is_string()) {
        cfg.protocolName = it->get<std::string>();
      } else if (it->is_array()) {
        Protocol steps;
        for (std::size_t i = 0; i < it->size(); ++i)
          steps.push_back(readStep((*it)[i], i, cfg.protocolPlate));
        cfg.protocolSteps = std::move(steps);
        cfg.protocolName.clear();
      } else {
        schemaError("protocol", "expected a protocol name or an array of steps");
      }
    }

    return cfg;
  }

  json toJson(const WorkcellConfig& cfg) {
    json j;
    j["workcell"] = cfg.name;
    j["robot"] = { { "seconds_per_mm", cfg.arm.secondsPerMm },
                   { "gripper_seconds", cfg.arm.gripperDwell.count() },
                   { "home", positionJson(cfg.home) } };
    j["pacing"] = { { "time_scale", cfg.pacing.timeScale },
                    { "max_wait_seconds", cfg.pacing.maxWaitSeconds } };

    j["devices"] = json::array();
    for (const auto& d : cfg.devices)
      j["devices"].push_back(
          { { "name", d.name }, { "position", positionJson(d.position) }, { "purpose", d.purpose } });

    j["plates"] = json::array();
    for (const auto& p : cfg.plates)
      j["plates"].push_back({ { "id", p.id }, { "location", p.location } });
    j["protocol_plate"] = cfg.protocolPlate;

    if (cfg.protocolSteps) {
      j["protocol"] = json::array();
      for (const auto& s : *cfg.protocolSteps) {
        json step = { { "action", actionKey(s.action) }, { "label", s.label } };
        if (s.action != StepAction::ReturnHome)
          step["plate"] = s.plateId;
        if (s.action == StepAction::Transfer) {
          step["from"] = s.fromDevice;
          step["to"] = s.toDevice;
        } else if (s.action == StepAction::Process) {
          step["device"] = s.fromDevice;
          step["seconds"] = s.processDuration.count();
        }
        j["protocol"].push_back(std::move(step));
      }
    } else {
      j["protocol"] = cfg.protocolName;
    }
    return j;
  }

  WorkcellState buildWorkcellState(const WorkcellConfig& cfg) {
    WorkcellState state(cfg.name);
    for (const auto& d : cfg.devices)
      state.addDevice(Device(d.name, d.position, d.purpose));
    for (const auto& p : cfg.plates) {
      if (p.location.empty())
        state.addPlate(p.id);
      else
        state.loadPlate(p.id, p.location);
    }
    return state;
  }

} // namespace labcell::core
