// labcell headers
#include "core/WorkcellConfig.hpp"
#include "protocols/CellScreening.hpp"
#include "protocols/ProtocolRunner.hpp"

// labcell fakes
#include "FakeSimulationClock.hpp"
#include "MockErrorMonitor.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace labcell::test {

  using namespace labcell::core;
  using labcell::protocols::Protocol;
  using labcell::protocols::ProtocolRunner;
  using labcell::protocols::StepAction;
  using labcell::protocols::TransferStep;
  using ::testing::HasSubstr;

  class ProtocolRunnerTest : public ::testing::Test {
  protected:
    void SetUp() override {
      errorMonitor = std::make_shared<testing::StrictMock<MockErrorMonitor>>();
      const WorkcellConfig cfg = defaultWorkcellConfig();
      runner = std::make_unique<ProtocolRunner>(
          buildWorkcellState(cfg), RobotArm(cfg.home, cfg.arm),
          protocols::cellScreeningProtocol(protocols::kCellScreeningPlate), clock,
          std::static_pointer_cast<ErrorMonitor>(errorMonitor));

      runner->registerListener([this](const OperationEvent& ev) {
        events.push_back(ev);
        const auto issues = auditConsistency(runner->state(), runner->arm().grippedPlate());
        EXPECT_TRUE(issues.empty()) << "after " << toString(ev.kind) << ": " << issues.front();
      });
    }

    FakeSimulationClock clock;
    std::shared_ptr<testing::StrictMock<MockErrorMonitor>> errorMonitor;
    std::unique_ptr<ProtocolRunner> runner;
    std::vector<OperationEvent> events;
  };

  TEST_F(ProtocolRunnerTest, cell_screening_completes_with_five_transfers) {
    const auto report = runner->run();

    EXPECT_TRUE(report.completed);
    EXPECT_FALSE(report.failedStep.has_value());
    ASSERT_EQ(report.records.size(), 5u);

    const std::vector<std::pair<std::string, std::string>> expected{
      { "Storage", "LiquidHandler" },   { "LiquidHandler", "Centrifuge" },
      { "Centrifuge", "ThermalCycler" }, { "ThermalCycler", "PlateReader" },
      { "PlateReader", "Storage" },
    };
    for (std::size_t i = 0; i < expected.size(); ++i) {
      const auto& rec = report.records[i];
      EXPECT_TRUE(rec.success);
      EXPECT_EQ(rec.plateId, protocols::kCellScreeningPlate);
      EXPECT_EQ(rec.fromDevice, expected[i].first);
      EXPECT_EQ(rec.toDevice, expected[i].second);
      EXPECT_LE(rec.startedAt, rec.finishedAt);
      EXPECT_FALSE(rec.errorReason.has_value());
    }

    const auto& state = runner->state();
    EXPECT_TRUE(state.plate(protocols::kCellScreeningPlate).location().isAt("Storage"));
    EXPECT_EQ(state.device("Storage").occupant().value(), protocols::kCellScreeningPlate);
    EXPECT_TRUE(runner->arm().isAt(Position(0, 0, 0)));
    EXPECT_FALSE(runner->arm().holdingPlate());
    for (const auto& dev : state.devices())
      EXPECT_EQ(dev.state(), DeviceState::Idle) << dev.name();
  }

  TEST_F(ProtocolRunnerTest, skips_moves_when_already_at_source) {
    const auto report = runner->run();
    // home->Storage, then one move per transfer destination, then home
    EXPECT_EQ(report.summary.robotMoves, 7u);
    EXPECT_EQ(report.summary.totalTransfers, 5u);
    EXPECT_EQ(report.summary.successfulTransfers, 5u);
    EXPECT_DOUBLE_EQ(report.summary.successRate, 100.0);
  }

  TEST_F(ProtocolRunnerTest, elapsed_time_is_the_sum_of_operation_durations) {
    const auto report = runner->run();

    double sum = 0.0;
    for (const auto& d : clock.advances)
      sum += d.count();
    const double travel = report.summary.distanceTraveledMm * 0.01;
    const double gripper = 10 * 0.5;
    const double processing = 3.0 + 2.0 + 4.0 + 2.0;

    EXPECT_NEAR(sum, travel + gripper + processing, 1e-9);
    EXPECT_NEAR(report.summary.elapsed.count(), sum, 1e-6);
  }

  TEST_F(ProtocolRunnerTest, events_follow_move_pick_move_place_order) {
    ASSERT_TRUE(runner->runNext());
    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[0].kind, OperationKind::Move);
    EXPECT_EQ(events[0].device, "Storage");
    EXPECT_EQ(events[1].kind, OperationKind::Pick);
    EXPECT_EQ(events[2].kind, OperationKind::Move);
    EXPECT_EQ(events[2].device, "LiquidHandler");
    EXPECT_EQ(events[3].kind, OperationKind::Place);

    ASSERT_TRUE(runner->runNext()); // process at the liquid handler, no arm motion
    ASSERT_EQ(events.size(), 5u);
    EXPECT_EQ(events[4].kind, OperationKind::Process);
    EXPECT_DOUBLE_EQ(events[4].duration.count(), 3.0);
    EXPECT_EQ(runner->log().size(), 1u);
  }

  TEST_F(ProtocolRunnerTest, occupied_storage_aborts_the_return_transfer) {
    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("OccupiedLocationError"))).Times(1);

    ASSERT_TRUE(runner->runNext()); // plate leaves Storage
    runner->state().loadPlate("INTERLOPER_PLATE", "Storage");

    const auto report = runner->run();

    EXPECT_FALSE(report.completed);
    ASSERT_EQ(report.records.size(), 5u);
    for (std::size_t i = 0; i < 4; ++i)
      EXPECT_TRUE(report.records[i].success);

    const auto& failed = report.records.back();
    EXPECT_FALSE(failed.success);
    EXPECT_EQ(failed.fromDevice, "PlateReader");
    EXPECT_EQ(failed.toDevice, "Storage");
    ASSERT_TRUE(failed.errorKind.has_value());
    EXPECT_EQ(*failed.errorKind, TransferErrorKind::OccupiedLocation);
    ASSERT_TRUE(failed.errorReason.has_value());
    EXPECT_THAT(*failed.errorReason, HasSubstr("Storage"));

    ASSERT_TRUE(report.failedStep.has_value());
    EXPECT_EQ(*report.failedStep, 8u);
    EXPECT_EQ(report.stepsExecuted, 9u); // return-home never ran
    EXPECT_EQ(report.summary.failedTransfers, 1u);
    EXPECT_DOUBLE_EQ(report.summary.successRate, 80.0);

    // arm is parked over Storage with the plate still gripped; nothing ran afterwards
    EXPECT_EQ(runner->arm().grippedPlate().value(), protocols::kCellScreeningPlate);
    EXPECT_FALSE(runner->arm().isAt(runner->arm().home()));
    EXPECT_EQ(runner->state().device("Storage").occupant().value(), "INTERLOPER_PLATE");
    EXPECT_FALSE(events.back().success);

    const std::size_t eventsAfterAbort = events.size();
    EXPECT_FALSE(runner->runNext());
    EXPECT_EQ(events.size(), eventsAfterAbort);
    EXPECT_EQ(runner->log().size(), 5u);
  }

  TEST(protocol_runner, process_on_empty_device_is_recorded_and_aborts) {
    WorkcellState state;
    state.addDevice(Device("Storage", Position(100, 200, 50)));
    state.addDevice(Device("PlateReader", Position(1000, 200, 90)));
    state.loadPlate("P1", "Storage");

    Protocol steps{
      TransferStep::process("read", "P1", "PlateReader", Seconds{ 2.0 }),
      TransferStep::transfer("never", "P1", "Storage", "PlateReader"),
    };
    FakeSimulationClock clock;
    auto monitor = std::make_shared<testing::NiceMock<MockErrorMonitor>>();
    EXPECT_CALL(*monitor, notifyFailure(HasSubstr("NoPlateError")));

    ProtocolRunner runner(std::move(state), RobotArm(), std::move(steps), clock, monitor);
    const auto report = runner.run();

    ASSERT_EQ(report.records.size(), 1u);
    EXPECT_EQ(report.records[0].action, StepAction::Process);
    EXPECT_EQ(report.records[0].errorKind.value(), TransferErrorKind::NoPlate);
    EXPECT_EQ(report.summary.totalTransfers, 0u);
    EXPECT_DOUBLE_EQ(report.summary.successRate, 0.0);
    EXPECT_TRUE(runner.state().device("Storage").occupied());
    EXPECT_EQ(runner.state().device("PlateReader").state(), DeviceState::Idle);
    EXPECT_TRUE(clock.advances.empty());
  }

  TEST(protocol_runner, pick_failure_leaves_plate_in_place) {
    WorkcellState state;
    state.addDevice(Device("Storage", Position(100, 200, 50)));
    state.addDevice(Device("Centrifuge", Position(550, 400, 75)));
    state.loadPlate("P1", "Storage");

    FakeSimulationClock clock;
    ProtocolRunner runner(std::move(state), RobotArm(),
                          { TransferStep::transfer("wrong source", "P1", "Centrifuge", "Storage") },
                          clock);
    const auto report = runner.run();

    ASSERT_EQ(report.records.size(), 1u);
    EXPECT_EQ(report.records[0].errorKind.value(), TransferErrorKind::EmptyLocation);
    EXPECT_TRUE(runner.state().plate("P1").location().isAt("Storage"));
    EXPECT_FALSE(runner.arm().holdingPlate());
    EXPECT_TRUE(runner.arm().isAt(runner.state().device("Centrifuge").position()));
  }

  TEST(protocol_runner, rejects_steps_naming_unknown_devices) {
    FakeSimulationClock clock;
    WorkcellState state;
    state.addDevice(Device("Storage", Position()));
    EXPECT_THROW(ProtocolRunner(std::move(state), RobotArm(),
                                { TransferStep::transfer("", "P1", "Storage", "Freezer") }, clock),
                 std::invalid_argument);
  }

  TEST(protocol_runner, empty_protocol_is_trivially_complete) {
    FakeSimulationClock clock;
    ProtocolRunner runner(WorkcellState(), RobotArm(), {}, clock);
    EXPECT_TRUE(runner.finished());
    const auto report = runner.run();
    EXPECT_TRUE(report.completed);
    EXPECT_TRUE(report.records.empty());
    EXPECT_EQ(report.stepsExecuted, 0u);
  }

} // namespace labcell::test
