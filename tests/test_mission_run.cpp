#include "mission_run.h"
#include "test_support.h"

class MissionRunTest : public ::testing::Test {
protected:
  void SetUp() override { console_attach(nullptr); }
  void TearDown() override { console_attach(&std::cout); }

  static AmbientSchedule bench() { return AmbientSchedule::constant(ambient_at(0.0f)); }

  DomeController alpha;
  DomeController beta;
  DomeSet domes;
  DomeCoordinator coordinator;
};

TEST_F(MissionRunTest, RefusesToStartWithoutUsableInput) {
  MissionRun mission(bench());

  RunSummary s = mission.run(domes, coordinator, 60.0, 1.0f);
  EXPECT_EQ(s.status, RUN_FAILED);
  EXPECT_EQ(s.error, "no domes to run");

  domes.push_back(&alpha);
  s = mission.run(domes, coordinator, 60.0, 1.0f);
  EXPECT_EQ(s.status, RUN_FAILED);
  EXPECT_EQ(s.error, "dome 0 is not initialized");

  ASSERT_TRUE(alpha.init(dome_config_default("alpha")));
  EXPECT_EQ(mission.run(domes, coordinator, 0.0, 1.0f).status, RUN_FAILED);
  EXPECT_EQ(mission.run(domes, coordinator, 60.0, 0.0f).status, RUN_FAILED);
  EXPECT_DOUBLE_EQ(alpha.timeS(), 0.0);
}

TEST_F(MissionRunTest, AdvancesEveryDomeInLockstep) {
  ASSERT_TRUE(alpha.init(dome_config_default("alpha")));
  ASSERT_TRUE(beta.init(dome_config_default("beta")));
  domes.push_back(&alpha);
  domes.push_back(&beta);

  MissionRun mission(bench());
  RunSummary s = mission.run(domes, coordinator, 1800.0, 1.0f);
  EXPECT_EQ(s.status, RUN_OK);
  EXPECT_FALSE(s.stopped);
  EXPECT_EQ(s.ticks, 1800u);
  EXPECT_DOUBLE_EQ(s.simulated_s, 1800.0);
  EXPECT_EQ(s.coordinator_passes, 30u);
  EXPECT_EQ(s.transfers, 0u);
  EXPECT_DOUBLE_EQ(alpha.timeS(), beta.timeS());

  ASSERT_EQ(s.domes.size(), 2u);
  EXPECT_EQ(s.domes[0].id, "alpha");
  EXPECT_EQ(s.domes[0].final_mode, MODE_IDLE);
  EXPECT_TRUE(s.domes[0].operational);
  EXPECT_GT(s.domes[0].ledger.total(), 0.0);
  EXPECT_EQ(s.shutdownCount(), 0u);
}

TEST_F(MissionRunTest, LastStepIsShortened) {
  ASSERT_TRUE(alpha.init(dome_config_default("alpha")));
  domes.push_back(&alpha);

  MissionRun mission(bench());
  RunSummary s = mission.run(domes, coordinator, 10.5, 1.0f);
  EXPECT_EQ(s.ticks, 11u);
  EXPECT_NEAR(alpha.timeS(), 10.5, 1e-6);
}

TEST_F(MissionRunTest, StopRequestEndsRunBetweenTicks) {
  ASSERT_TRUE(alpha.init(dome_config_default("alpha")));
  domes.push_back(&alpha);

  MissionRun mission(bench());
  mission.setStepHook([&mission](double timeS, DomeSet &) {
    if (timeS >= 50.0) mission.requestStop();
  });
  RunSummary s = mission.run(domes, coordinator, 600.0, 1.0f);
  EXPECT_EQ(s.status, RUN_OK);
  EXPECT_TRUE(s.stopped);
  EXPECT_EQ(s.ticks, 51u);
  EXPECT_DOUBLE_EQ(alpha.timeS(), 51.0);

  // A later run starts with the request cleared
  mission.setStepHook(MissionRun::StepHook());
  s = mission.run(domes, coordinator, 10.0, 1.0f);
  EXPECT_FALSE(s.stopped);
  EXPECT_FALSE(mission.stopRequested());
  EXPECT_EQ(s.ticks, 10u);
  EXPECT_DOUBLE_EQ(alpha.timeS(), 61.0);
}

// Valid configuration whose pressure model overflows on the first tick
static DomeConfig overflowingPlant(const std::string &id) {
  DomeConfig cfg = dome_config_default(id);
  cfg.physics.nominal_pressure_kpa = 3e38f;
  cfg.physics.reference_temp_c = -273.0f;
  return cfg;
}

TEST_F(MissionRunTest, RejectedTickStallsTheDome) {
  ASSERT_TRUE(alpha.init(dome_config_default("alpha")));
  ASSERT_TRUE(beta.init(overflowingPlant("beta")));
  domes.push_back(&alpha);
  domes.push_back(&beta);

  ConsoleCapture console;
  MissionRun mission(bench());
  RunSummary s = mission.run(domes, coordinator, 600.0, 1.0f);
  EXPECT_EQ(s.status, RUN_OK);
  EXPECT_EQ(s.ticks, 600u);
  EXPECT_TRUE(console.contains("[beta] tick rejected at t=0 s, dome stalled"));

  ASSERT_EQ(s.domes.size(), 2u);
  EXPECT_TRUE(s.domes[0].operational);
  EXPECT_FALSE(s.domes[0].stalled);
  EXPECT_DOUBLE_EQ(s.domes[0].time_s, 600.0);

  EXPECT_TRUE(s.domes[1].stalled);
  EXPECT_FALSE(s.domes[1].operational);
  EXPECT_EQ(s.domes[1].rejected_ticks, 1u);
  EXPECT_DOUBLE_EQ(s.domes[1].time_s, 0.0);
  EXPECT_EQ(s.stalledCount(), 1u);
  EXPECT_EQ(s.failedCount(), 1u);
  EXPECT_EQ(s.shutdownCount(), 0u);
}

TEST_F(MissionRunTest, RunFailsWhenEveryDomeStalls) {
  ASSERT_TRUE(alpha.init(overflowingPlant("alpha")));
  domes.push_back(&alpha);

  MissionRun mission(bench());
  RunSummary s = mission.run(domes, coordinator, 600.0, 1.0f);
  EXPECT_EQ(s.status, RUN_FAILED);
  EXPECT_EQ(s.error, "every dome stalled");
  EXPECT_EQ(s.ticks, 1u);
  ASSERT_EQ(s.domes.size(), 1u);
  EXPECT_TRUE(s.domes[0].stalled);
}

TEST_F(MissionRunTest, CoordinatorRelievesO2Loss) {
  ASSERT_TRUE(alpha.init(dome_config_default("alpha")));
  ASSERT_TRUE(beta.init(dome_config_default("beta")));
  domes.push_back(&alpha);
  domes.push_back(&beta);

  MissionRun mission(bench());
  mission.setStepHook([this](double timeS, DomeSet &) {
    if (timeS > 0.5) return;
    SensorReading r = alpha.reading();
    r.o2_pct = 24.0f;
    ASSERT_TRUE(alpha.setSensorReading(r));
    r = beta.reading();
    r.o2_pct = 17.5f;
    ASSERT_TRUE(beta.setSensorReading(r));
  });
  RunSummary s = mission.run(domes, coordinator, 120.0, 1.0f);
  EXPECT_EQ(s.status, RUN_OK);
  EXPECT_GE(s.transfers, 1u);
  EXPECT_EQ(s.declined, 0u);
  EXPECT_GT(beta.reading().o2_pct, 19.0f);
  EXPECT_EQ(s.domes[1].emergency_entries, 1u);
}

TEST_F(MissionRunTest, ShutdownIsADomeLevelFailure) {
  DomeConfig fragile = dome_config_default("alpha");
  fragile.mode_policy.escalation_count = 1;
  ASSERT_TRUE(alpha.init(fragile));
  ASSERT_TRUE(beta.init(dome_config_default("beta")));
  domes.push_back(&alpha);
  domes.push_back(&beta);

  MissionRun mission(bench());
  mission.setStepHook([this](double timeS, DomeSet &) {
    if (timeS < 900.0 || timeS > 900.5) return;
    SensorReading r = alpha.reading();
    r.co2_ppm = 5000.0f;
    ASSERT_TRUE(alpha.setSensorReading(r));
  });
  RunSummary s = mission.run(domes, coordinator, 1800.0, 1.0f);
  EXPECT_EQ(s.status, RUN_OK);
  EXPECT_DOUBLE_EQ(s.simulated_s, 1800.0);
  EXPECT_EQ(s.shutdownCount(), 1u);
  EXPECT_FALSE(s.domes[0].operational);
  EXPECT_EQ(s.domes[0].final_mode, MODE_SHUTDOWN);
  EXPECT_TRUE(s.domes[1].operational);
}

TEST(RunSummaryPrint, ReportsPerDomeEnergy) {
  ConsoleCapture console;
  RunSummary s;
  s.status = RUN_OK;
  s.stopped = false;
  s.simulated_s = 3600.0;
  s.ticks = 3600;
  s.coordinator_passes = 60;
  s.transfers = 2;
  s.declined = 0;
  DomeOutcome d;
  d.id = "alpha";
  d.operational = true;
  d.stalled = false;
  d.rejected_ticks = 0;
  d.time_s = 3600.0;
  d.final_mode = MODE_GROWING;
  d.final_reading = nominal_reading();
  d.ledger = energy_ledger_zero();
  d.ledger.kwh[ENERGY_HEATING] = 1.25;
  d.emergency_events = 0;
  d.emergency_entries = 0;
  d.faults = 0;
  s.domes.push_back(d);

  run_summary_print(s);
  EXPECT_TRUE(console.contains("Summary: status OK"));
  EXPECT_TRUE(console.contains("heating"));
  EXPECT_TRUE(console.contains("1.250 kWh"));
}
