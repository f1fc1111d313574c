/* @file ReportFormatter.cpp
 * @brief console tables and CSV lines for protocol runs
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <ctime>
#include <iomanip>
#include <sstream>

// labcell headers
#include "core/RobotArm.hpp"
#include "core/WorkcellState.hpp"
#include "io/ReportFormatter.hpp"

namespace labcell {
  namespace io {

    namespace {
      const std::string kRule(78, '=');
      const std::string kThinRule(78, '-');

      std::string fixed(double v, int precision) {
        std::ostringstream os;
        os << std::fixed << std::setprecision(precision) << v;
        return os.str();
      }

      std::string describePosition(const core::Position& p) {
        return "(" + fixed(p.x(), 1) + ", " + fixed(p.y(), 1) + ", " + fixed(p.z(), 1) + ")";
      }
    } // namespace

    std::string csvHeader() { return "timestamp,category,message\n"; }

    std::string csvEscape(const std::string& field) {
      if (field.find_first_of(",\"\n\r") == std::string::npos)
        return field;
      std::string out = "\"";
      for (char c : field) {
        if (c == '"')
          out += '"';
        out += c;
      }
      out += '"';
      return out;
    }

    std::string toCsvLine(const core::LogEvent& ev) {
      return formatTimestamp(ev.timestamp, true) + "," + csvEscape(ev.category) + "," +
             csvEscape(ev.message) + "\n";
    }

    std::string formatTimestamp(core::TimePoint tp, bool withMillis) {
      const std::time_t t = std::chrono::system_clock::to_time_t(tp);
      std::tm tm{};
      localtime_r(&t, &tm);

      std::ostringstream os;
      os << std::put_time(&tm, "%H:%M:%S");
      if (withMillis) {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            tp.time_since_epoch()) %
                        1000;
        os << '.' << std::setw(3) << std::setfill('0') << ms.count();
      }
      return os.str();
    }

    core::LogEvent toLogEvent(const core::OperationEvent& ev, core::TimePoint at) {
      core::LogEvent out;
      out.timestamp = at;
      out.category = ev.success ? core::toString(ev.kind) : "ERROR";
      out.message = formatEvent(ev);
      // drop the console indent
      out.message.erase(0, out.message.find_first_not_of(' '));
      return out;
    }

    core::LogEvent toLogEvent(const protocols::TransferRecord& rec) {
      core::LogEvent out;
      out.timestamp = rec.finishedAt;
      out.category = rec.success ? "TRANSFER" : "TRANSFER_FAILED";
      std::ostringstream os;
      os << protocols::toString(rec.action) << ' ' << rec.plateId << ' ' << rec.fromDevice
         << " -> " << rec.toDevice;
      if (!rec.success && rec.errorKind)
        os << " [" << core::toString(*rec.errorKind) << "] " << rec.errorReason.value_or("");
      out.message = os.str();
      return out;
    }

    std::string formatEvent(const core::OperationEvent& ev) {
      std::ostringstream os;
      os << "  " << core::toString(ev.kind);
      if (!ev.success) {
        os << " FAILED at " << ev.device << ": " << ev.error;
        return os.str();
      }

      switch (ev.kind) {
      case core::OperationKind::Move:
      case core::OperationKind::ReturnHome:
        os << " -> " << ev.device << " (" << fixed(ev.distanceMm, 1) << " mm, "
           << fixed(ev.duration.count(), 2) << " s)";
        break;
      case core::OperationKind::Pick:
        os << ' ' << ev.plateId << " from " << ev.device;
        break;
      case core::OperationKind::Place:
        os << ' ' << ev.plateId << " into " << ev.device;
        break;
      case core::OperationKind::Process:
        os << ' ' << ev.plateId << " in " << ev.device << " (" << fixed(ev.duration.count(), 1)
           << " s)";
        break;
      }
      return os.str();
    }

    std::string formatRoster(const core::WorkcellState& state, const core::RobotArm& arm) {
      std::ostringstream os;
      os << kRule << '\n' << state.name() << '\n' << kThinRule << '\n';
      for (const auto& d : state.devices()) {
        os << "  " << std::left << std::setw(16) << d.name() << std::setw(26)
           << describePosition(d.position()) << d.purpose() << '\n';
      }
      os << kThinRule << '\n';
      for (const auto& p : state.plates())
        os << "  Plate " << p.id() << " at " << p.location().describe() << '\n';
      os << "  Robot at " << arm.currentPosition().label() << ' '
         << describePosition(arm.currentPosition()) << '\n'
         << kRule << '\n';
      return os.str();
    }

    std::string formatLogTable(const std::vector<protocols::TransferRecord>& records) {
      std::ostringstream os;
      os << kRule << "\nPROTOCOL EXECUTION LOG\n" << kRule << '\n';
      os << std::left << std::setw(10) << "Time" << std::setw(25) << "Plate ID" << std::setw(15)
         << "From" << std::setw(15) << "To" << "Status\n";
      os << kThinRule << '\n';
      for (const auto& rec : records) {
        os << std::left << std::setw(10) << formatTimestamp(rec.startedAt) << std::setw(25)
           << rec.plateId << std::setw(15) << rec.fromDevice << std::setw(15) << rec.toDevice
           << (rec.success ? "OK" : "FAILED");
        if (!rec.success && rec.errorKind)
          os << " (" << core::toString(*rec.errorKind) << ")";
        os << '\n';
      }
      os << kRule << '\n';
      return os.str();
    }

    std::string formatSummary(const protocols::RunSummary& s) {
      std::ostringstream os;
      os << "  Duration: " << fixed(s.elapsed.count(), 1) << " seconds\n"
         << "  Robot Movements: " << s.robotMoves << '\n'
         << "  Total Transfers: " << s.totalTransfers << '\n'
         << "  Successful: " << s.successfulTransfers << '\n'
         << "  Failed: " << s.failedTransfers << '\n'
         << "  Success Rate: " << fixed(s.successRate, 1) << "%\n"
         << "  Distance Traveled: " << fixed(s.distanceTraveledMm, 0) << " mm\n";
      return os.str();
    }

    std::string formatDeviceStatus(const core::WorkcellState& state) {
      std::ostringstream os;
      os << kRule << "\nFINAL DEVICE STATUS\n" << kRule << '\n';
      os << std::left << std::setw(20) << "Device" << std::setw(15) << "Status" << "Plate\n";
      os << kThinRule << '\n';
      for (const auto& d : state.devices()) {
        os << std::left << std::setw(20) << d.name() << std::setw(15) << core::toString(d.state())
           << (d.occupied() ? *d.occupant() : std::string("Empty")) << '\n';
      }
      os << kRule << '\n';
      return os.str();
    }

  } // namespace io
} // namespace labcell
