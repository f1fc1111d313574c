#include "core/Device.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Plate.hpp"
#include "core/Position.hpp"
#include "core/SimulationClock.hpp"
#include "core/TransferErrors.hpp"
#include "core/WorkcellConfig.hpp"
#include "core/WorkcellState.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

using namespace labcell::core;

TEST(position, distance_is_euclidean) {
  Position a(0.0, 0.0, 0.0);
  Position b(3.0, 4.0, 12.0);
  EXPECT_DOUBLE_EQ(a.distanceTo(b), 13.0);
}

TEST(position, distance_is_symmetric_and_zero_only_for_equal_points) {
  Position storage(100, 200, 50, "Storage");
  Position reader(1000, 200, 90, "PlateReader");

  EXPECT_DOUBLE_EQ(storage.distanceTo(reader), reader.distanceTo(storage));
  EXPECT_GT(storage.distanceTo(reader), 0.0);
  EXPECT_DOUBLE_EQ(storage.distanceTo(Position(100, 200, 50, "other label")), 0.0);
  EXPECT_EQ(storage, Position(100, 200, 50)); // label is cosmetic
  EXPECT_NE(storage, reader);
}

TEST(device, occupancy_transitions_are_checked) {
  Device dev("Centrifuge", Position(550, 400, 75));
  EXPECT_FALSE(dev.occupied());
  EXPECT_THROW(dev.markFree(), StateError);

  dev.markOccupied("P1");
  EXPECT_TRUE(dev.occupied());
  EXPECT_EQ(dev.occupant().value(), "P1");
  EXPECT_THROW(dev.markOccupied("P2"), StateError);
  EXPECT_EQ(dev.occupant().value(), "P1");

  dev.markFree();
  EXPECT_FALSE(dev.occupied());
}

TEST(device, state_is_informational) {
  Device dev("PlateReader", Position(1000, 200, 90));
  EXPECT_EQ(dev.state(), DeviceState::Idle);
  dev.setState(DeviceState::Error);
  EXPECT_EQ(dev.state(), DeviceState::Error);
  dev.markOccupied("P1"); // ERROR does not gate occupancy
  EXPECT_TRUE(dev.occupied());
  EXPECT_STREQ(toString(DeviceState::Busy), "BUSY");
}

TEST(plate, relocate_is_a_plain_update) {
  Plate p("P1");
  EXPECT_EQ(p.location(), PlateLocation::none());
  p.relocate(PlateLocation::inGripper());
  EXPECT_EQ(p.location().describe(), "IN_GRIPPER");
  p.relocate(PlateLocation::atDevice("Storage"));
  EXPECT_TRUE(p.location().isAt("Storage"));
  EXPECT_EQ(p.location().describe(), "Storage");
}

class WorkcellStateTest : public ::testing::Test {
protected:
  void SetUp() override {
    state.addDevice(Device("Storage", Position(100, 200, 50)));
    state.addDevice(Device("LiquidHandler", Position(400, 200, 100)));
  }

  WorkcellState state{ "test cell" };
};

TEST_F(WorkcellStateTest, rejects_duplicate_names) {
  EXPECT_THROW(state.addDevice(Device("Storage", Position())), std::invalid_argument);
  state.addPlate("P1");
  EXPECT_THROW(state.addPlate("P1"), std::invalid_argument);
  EXPECT_THROW(state.addPlate(""), std::invalid_argument);
}

TEST_F(WorkcellStateTest, unknown_lookups_throw_out_of_range) {
  EXPECT_THROW(state.device("Freezer"), std::out_of_range);
  EXPECT_THROW(state.plate("nope"), std::out_of_range);
}

TEST_F(WorkcellStateTest, devices_keep_insertion_order) {
  ASSERT_EQ(state.devices().size(), 2u);
  EXPECT_EQ(state.devices()[0].name(), "Storage");
  EXPECT_EQ(state.devices()[1].name(), "LiquidHandler");
}

TEST_F(WorkcellStateTest, load_plate_sets_both_sides) {
  state.loadPlate("P1", "Storage");
  EXPECT_TRUE(state.device("Storage").occupied());
  EXPECT_TRUE(state.plate("P1").location().isAt("Storage"));
  EXPECT_TRUE(auditConsistency(state, std::nullopt).empty());
}

TEST_F(WorkcellStateTest, load_plate_into_occupied_device_changes_nothing) {
  state.loadPlate("P1", "Storage");
  EXPECT_THROW(state.loadPlate("P2", "Storage"), StateError);
  EXPECT_FALSE(state.hasPlate("P2"));
  EXPECT_EQ(state.device("Storage").occupant().value(), "P1");
}

TEST_F(WorkcellStateTest, load_plate_twice_is_rejected) {
  state.loadPlate("P1", "Storage");
  EXPECT_THROW(state.loadPlate("P1", "LiquidHandler"), StateError);
  EXPECT_FALSE(state.device("LiquidHandler").occupied());
}

TEST_F(WorkcellStateTest, audit_reports_broken_invariants) {
  state.loadPlate("P1", "Storage");
  // plate claims the gripper but nothing is gripped
  state.plate("P1").relocate(PlateLocation::inGripper());

  const auto issues = auditConsistency(state, std::nullopt);
  EXPECT_FALSE(issues.empty());

  // both gripped and inside a device
  const auto both = auditConsistency(state, std::string("P1"));
  EXPECT_FALSE(both.empty());
}

TEST_F(WorkcellStateTest, queries_do_not_mutate) {
  state.loadPlate("P1", "Storage");
  for (int i = 0; i < 3; ++i) {
    (void)state.device("Storage").occupied();
    (void)state.plate("P1").location();
    (void)auditConsistency(state, std::nullopt);
  }
  EXPECT_EQ(state.device("Storage").occupant().value(), "P1");
  EXPECT_TRUE(state.plate("P1").location().isAt("Storage"));
  EXPECT_FALSE(state.device("LiquidHandler").occupied());
}

TEST(virtual_clock, advances_without_blocking) {
  VirtualClock clock(TimePoint{});
  clock.advance(Seconds{ 1.5 });
  clock.advance(Seconds{ 0.5 });
  EXPECT_DOUBLE_EQ(clock.elapsed().count(), 2.0);
  EXPECT_EQ(clock.now() - TimePoint{}, std::chrono::seconds(2));
  EXPECT_THROW(clock.advance(Seconds{ -1.0 }), std::invalid_argument);
}

TEST(real_time_clock, default_cap_matches_configured_pacing) {
  const RealTimeClock clock;
  EXPECT_DOUBLE_EQ(clock.maxWait().count(), PacingSettings{}.maxWaitSeconds);
  EXPECT_DOUBLE_EQ(clock.maxWait().count(), 1.0);
}

TEST(real_time_clock, sleeps_scaled_and_capped) {
  RealTimeClock paused(0.0);
  const auto t0 = std::chrono::steady_clock::now();
  paused.advance(Seconds{ 30.0 });
  EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::milliseconds(500));

  RealTimeClock capped(1.0, Seconds{ 0.05 });
  const auto t1 = std::chrono::steady_clock::now();
  capped.advance(Seconds{ 30.0 });
  const auto slept = std::chrono::steady_clock::now() - t1;
  EXPECT_GE(slept, std::chrono::milliseconds(45));
  EXPECT_LT(slept, std::chrono::seconds(5));

  EXPECT_THROW(RealTimeClock(-1.0), std::invalid_argument);
}

TEST(error_monitor, escalates_each_distinct_failure_once) {
  ErrorMonitor monitor;
  std::vector<std::string> escalated;
  monitor.registerEscalation([&](const std::string& msg) { escalated.push_back(msg); });

  monitor.notifyFailure("gripper jam");
  monitor.notifyFailure("gripper jam");
  monitor.notifyFailure("door open");

  ASSERT_EQ(escalated.size(), 2u);
  EXPECT_EQ(escalated[0], "gripper jam");
  EXPECT_EQ(monitor.failureCount(), 2u);

  monitor.reset();
  monitor.notifyFailure("gripper jam");
  EXPECT_EQ(escalated.size(), 3u);
}
