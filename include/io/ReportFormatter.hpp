#pragma once
/** @file  ReportFormatter.hpp
 *  @brief Text / CSV rendering of run results. No decisions are made here.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>
#include <vector>

#include "core/Logger.hpp"
#include "core/OperationEvent.hpp"
#include "core/SimulationClock.hpp"
#include "protocols/ProtocolRunner.hpp"
#include "protocols/TransferStep.hpp"

namespace labcell {
  namespace core {
    class RobotArm;
    class WorkcellState;
  } // namespace core

  namespace io {

    //---CSV--------------------------------------------------------------
    std::string csvHeader(); ///< "timestamp,category,message\n"
    std::string csvEscape(const std::string& field);
    std::string toCsvLine(const core::LogEvent& ev);

    /// "HH:MM:SS" (local time); with millis "HH:MM:SS.mmm".
    std::string formatTimestamp(core::TimePoint tp, bool withMillis = false);

    //---log events-------------------------------------------------------
    core::LogEvent toLogEvent(const core::OperationEvent& ev, core::TimePoint at);
    core::LogEvent toLogEvent(const protocols::TransferRecord& rec);

    //---console----------------------------------------------------------
    /// One line per arm operation, e.g. "  MOVE -> Storage (223.6 mm, 2.24 s)".
    std::string formatEvent(const core::OperationEvent& ev);

    std::string formatRoster(const core::WorkcellState& state, const core::RobotArm& arm);
    std::string formatLogTable(const std::vector<protocols::TransferRecord>& records);
    std::string formatSummary(const protocols::RunSummary& summary);
    std::string formatDeviceStatus(const core::WorkcellState& state);

  } // namespace io
} // namespace labcell
