#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/WorkcellConfig.hpp"
#include "io/FileLogger.hpp"
#include "io/ReportFormatter.hpp"

#include "MockErrorMonitor.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace labcell;
using ::testing::HasSubstr;

namespace {

  std::vector<std::string> readLines(const std::string& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);)
      lines.push_back(line);
    return lines;
  }

} // namespace

TEST(file_logger, buffers_until_flush) {
  const std::string path = ::testing::TempDir() + "labcell_filelogger.csv";
  io::FileLogger logger;
  ASSERT_TRUE(logger.open(path));

  ASSERT_TRUE(logger.write("a,b\n"));
  EXPECT_TRUE(readLines(path).empty()); // still in the buffer

  ASSERT_TRUE(logger.flush());
  EXPECT_EQ(readLines(path), std::vector<std::string>{ "a,b" });

  io::FileLogger moved(std::move(logger));
  EXPECT_FALSE(logger.isOpen());
  ASSERT_TRUE(moved.write("c,d\n"));
  EXPECT_TRUE(moved.close());
  EXPECT_EQ(readLines(path).size(), 2u);
  EXPECT_FALSE(moved.write("e\n"));

  std::remove(path.c_str());
}

TEST(file_logger, open_fails_for_missing_directory) {
  io::FileLogger logger;
  EXPECT_FALSE(logger.open(::testing::TempDir() + "no/such/dir/log.csv"));
  EXPECT_FALSE(logger.flush());
}

TEST(report_formatter, csv_escapes_delimiters) {
  EXPECT_EQ(io::csvEscape("plain"), "plain");
  EXPECT_EQ(io::csvEscape("a,b"), "\"a,b\"");
  EXPECT_EQ(io::csvEscape("say \"hi\""), "\"say \"\"hi\"\"\"");
}

TEST(report_formatter, failed_record_shows_error_kind) {
  protocols::TransferRecord rec;
  rec.plateId = "P1";
  rec.fromDevice = "PlateReader";
  rec.toDevice = "Storage";
  rec.success = false;
  rec.errorKind = core::TransferErrorKind::OccupiedLocation;
  rec.errorReason = "[RobotArm] Storage already holds plate P2";

  const auto table = io::formatLogTable({ rec });
  EXPECT_THAT(table, HasSubstr("FAILED (OccupiedLocationError)"));

  const auto ev = io::toLogEvent(rec);
  EXPECT_EQ(ev.category, "TRANSFER_FAILED");
  EXPECT_THAT(ev.message, HasSubstr("PlateReader -> Storage"));
}

TEST(report_formatter, device_status_lists_every_device) {
  auto state = core::buildWorkcellState(core::defaultWorkcellConfig());
  const auto text = io::formatDeviceStatus(state);
  for (const auto& dev : state.devices())
    EXPECT_THAT(text, HasSubstr(dev.name()));
  EXPECT_THAT(text, HasSubstr("CELL_CULTURE_PLATE_001"));
  EXPECT_THAT(text, HasSubstr("Empty"));
}

TEST(report_formatter, move_event_line) {
  core::OperationEvent ev;
  ev.kind = core::OperationKind::Move;
  ev.device = "Storage";
  ev.distanceMm = 229.1;
  ev.duration = core::Seconds{ 2.291 };
  EXPECT_EQ(io::formatEvent(ev), "  MOVE -> Storage (229.1 mm, 2.29 s)");
}

TEST(logger, worker_writes_every_event_before_finish_returns) {
  const std::string path = ::testing::TempDir() + "labcell_runlog.csv";
  auto monitor = std::make_shared<testing::StrictMock<test::MockErrorMonitor>>();
  core::Logger logger(monitor);

  ASSERT_TRUE(logger.startNewRun(path));
  EXPECT_TRUE(logger.running());
  for (int i = 0; i < 100; ++i)
    logger.log({ core::TimePoint{}, "MOVE", "step " + std::to_string(i) });
  EXPECT_TRUE(logger.finishRun());
  EXPECT_FALSE(logger.running());
  EXPECT_EQ(logger.written(), 100u);

  const auto lines = readLines(path);
  ASSERT_EQ(lines.size(), 101u);
  EXPECT_EQ(lines.front(), "timestamp,category,message");
  EXPECT_THAT(lines[1], HasSubstr(",MOVE,step 0"));
  EXPECT_THAT(lines.back(), HasSubstr(",MOVE,step 99"));

  logger.log({ core::TimePoint{}, "MOVE", "dropped" }); // no active run
  EXPECT_EQ(readLines(path).size(), 101u);

  std::remove(path.c_str());
}

TEST(file_logger, close_reports_a_lost_final_write) {
  io::FileLogger logger;
  if (!logger.open("/dev/full"))
    GTEST_SKIP() << "/dev/full not available";

  ASSERT_TRUE(logger.write("buffered,line\n")); // below kChunkSize: nothing hits the device yet
  EXPECT_FALSE(logger.close());
  EXPECT_FALSE(logger.isOpen());
  EXPECT_TRUE(logger.close()); // already closed
}

TEST(logger, unopenable_path_is_not_escalated) {
  // StrictMock: a missing run log must not reach the ErrorMonitor
  auto monitor = std::make_shared<testing::StrictMock<test::MockErrorMonitor>>();

  core::Logger logger(monitor);
  EXPECT_FALSE(logger.startNewRun(::testing::TempDir() + "no/such/dir/run.csv"));
  EXPECT_FALSE(logger.running());
  EXPECT_TRUE(logger.finishRun()); // nothing to close
}

TEST(logger, failed_writes_are_reported_by_finish_on_the_calling_thread) {
  {
    io::FileLogger full;
    if (!full.open("/dev/full"))
      GTEST_SKIP() << "/dev/full not available";
  }

  auto monitor = std::make_shared<testing::StrictMock<test::MockErrorMonitor>>();
  std::thread::id reportedOn;
  EXPECT_CALL(*monitor, notifyFailure(HasSubstr("write to run log failed")))
      .WillOnce(::testing::Invoke(
          [&](const std::string&) { reportedOn = std::this_thread::get_id(); }));

  core::Logger logger(monitor);
  ASSERT_TRUE(logger.startNewRun("/dev/full"));
  for (int i = 0; i < 20; ++i)
    logger.log({ core::TimePoint{}, "MOVE", "step " + std::to_string(i) });

  EXPECT_FALSE(logger.finishRun());
  EXPECT_EQ(reportedOn, std::this_thread::get_id());
  EXPECT_EQ(logger.written(), 0u);
}
