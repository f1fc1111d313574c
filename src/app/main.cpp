/* @file main.cpp
 * @brief labcell_sim entry point: load the workcell, wait for the operator, run once
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <string>

// third-party headers
#include <nlohmann/json.hpp>

// labcell headers
#include "core/SystemCoordinator.hpp"
#include "io/ReportFormatter.hpp"

using labcell::core::SystemCoordinator;

namespace {

  constexpr int kExitOk = 0;
  constexpr int kExitRunFailed = 1;
  constexpr int kExitUsage = 2;

  void printUsage(const char* argv0) {
    std::cout << "usage: " << argv0
              << " [--config FILE] [--log FILE] [--fast] [--yes] [--dump-config]\n"
                 "  --config FILE   workcell JSON (default: built-in cell screening workcell)\n"
                 "  --log FILE      write a CSV run log\n"
                 "  --fast          do not wait on simulated travel / process time\n"
                 "  --yes           start without waiting for Enter\n"
                 "  --dump-config   print the effective configuration as JSON and exit\n";
  }

} // namespace

int main(int argc, char** argv) {
  SystemCoordinator::Options opts;
  bool confirm = true;
  bool dumpConfig = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if ((arg == "--config" || arg == "--log") && i + 1 < argc) {
      (arg == "--config" ? opts.configPath : opts.logPath) = argv[++i];
    } else if (arg == "--fast") {
      opts.realTime = false;
    } else if (arg == "--yes") {
      confirm = false;
    } else if (arg == "--dump-config") {
      dumpConfig = true;
    } else if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      return kExitOk;
    } else {
      std::cerr << "unknown or incomplete argument: " << arg << "\n";
      printUsage(argv[0]);
      return kExitUsage;
    }
  }

  SystemCoordinator coordinator(opts);
  coordinator.initialize();
  if (coordinator.state() == SystemCoordinator::State::ERROR) {
    std::cerr << coordinator.lastError().value_or("initialization failed") << "\n";
    return kExitUsage;
  }

  if (dumpConfig) {
    std::cout << labcell::core::toJson(coordinator.config()).dump(2) << "\n";
    return kExitOk;
  }

  auto& runner = coordinator.runner();
  std::cout << labcell::io::formatRoster(runner.state(), runner.arm());

  runner.registerListener([](const labcell::core::OperationEvent& ev) {
    std::cout << labcell::io::formatEvent(ev) << "\n";
  });

  if (confirm) {
    std::cout << "\nPress Enter to start automated protocol...";
    std::string ignored;
    std::getline(std::cin, ignored);
  }

  const auto report = coordinator.handleStart();

  std::cout << "\n" << (report.completed ? "PROTOCOL COMPLETE" : "PROTOCOL ABORTED") << "\n";
  std::cout << labcell::io::formatSummary(report.summary);
  std::cout << labcell::io::formatLogTable(report.records);
  std::cout << labcell::io::formatDeviceStatus(runner.state());

  if (!report.completed) {
    std::cerr << coordinator.lastError().value_or("protocol failed") << "\n";
    return kExitRunFailed;
  }
  return kExitOk;
}
