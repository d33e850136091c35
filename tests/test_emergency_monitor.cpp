#include "emergency_monitor.h"
#include "test_support.h"

// Mid-range regulation output touching every channel
static ActuatorCommand pidCommand() {
  ActuatorCommand c;
  c.heater = 0.4f;
  c.vent = 0.3f;
  c.mister = 0.2f;
  c.lighting = 0.5f;
  c.co2_rate = 0.1f;
  c.fan = 0.25f;
  c.nutrient_dosing = false;
  return c;
}

TEST(EmergencyMonitor, NominalReadingOpensNothing) {
  EmergencyMonitor monitor;
  EXPECT_EQ(monitor.evaluate(nominal_reading(), 0.0), 0);
  EXPECT_FALSE(monitor.anyOpen());
  EXPECT_TRUE(monitor.log().empty());
}

TEST(EmergencyMonitor, Co2ExcessOpensEventAndScrubs) {
  ConsoleCapture console;
  EmergencyMonitor monitor;
  SensorReading r = nominal_reading();
  r.co2_ppm = 5000.0f;

  EXPECT_EQ(monitor.evaluate(r, 42.0), 1);
  EXPECT_TRUE(monitor.isOpen(HAZARD_CO2_EXCESS));
  ASSERT_EQ(monitor.log().size(), 1u);
  const EmergencyEvent &ev = monitor.log()[0];
  EXPECT_EQ(ev.kind, HAZARD_CO2_EXCESS);
  EXPECT_DOUBLE_EQ(ev.time_s, 42.0);
  EXPECT_FLOAT_EQ(ev.trigger.co2_ppm, 5000.0f);
  EXPECT_FALSE(ev.resolved);
  EXPECT_TRUE(console.contains("CO2_EXCESS"));

  ActuatorCommand cmd = monitor.applyCorrectiveActions(pidCommand());
  EXPECT_FLOAT_EQ(cmd.co2_rate, -1.0f);
  EXPECT_FLOAT_EQ(cmd.vent, 1.0f);
  // Channels the hazard does not name keep the regulation output
  EXPECT_FLOAT_EQ(cmd.heater, 0.4f);
  EXPECT_FLOAT_EQ(cmd.mister, 0.2f);
  EXPECT_FLOAT_EQ(cmd.lighting, 0.5f);
}

TEST(EmergencyMonitor, EventOpensOnceAndRecordsResolution) {
  ConsoleCapture console;
  EmergencyMonitor monitor;
  SensorReading r = nominal_reading();
  r.co2_ppm = 5000.0f;

  monitor.evaluate(r, 10.0);
  EXPECT_EQ(monitor.evaluate(r, 11.0), 0);
  ASSERT_EQ(monitor.log().size(), 1u);

  monitor.evaluate(nominal_reading(), 250.0);
  EXPECT_FALSE(monitor.anyOpen());
  EXPECT_TRUE(monitor.log()[0].resolved);
  EXPECT_DOUBLE_EQ(monitor.log()[0].resolved_at_s, 250.0);

  // A later occurrence is a new entry; the first one is untouched
  monitor.evaluate(r, 300.0);
  ASSERT_EQ(monitor.log().size(), 2u);
  EXPECT_DOUBLE_EQ(monitor.log()[0].resolved_at_s, 250.0);
  EXPECT_FALSE(monitor.log()[1].resolved);
}

TEST(EmergencyMonitor, O2DeficitOutranksHumidityVent) {
  ConsoleCapture console;
  EmergencyMonitor monitor;
  SensorReading r = nominal_reading();
  r.o2_pct = 17.0f;
  r.humidity_pct = 98.0f;

  EXPECT_EQ(monitor.evaluate(r, 0.0), 2);
  ActuatorCommand cmd = monitor.applyCorrectiveActions(pidCommand());
  EXPECT_FLOAT_EQ(cmd.vent, 0.0f);
  EXPECT_FLOAT_EQ(cmd.lighting, 1.0f);
  EXPECT_FLOAT_EQ(cmd.mister, 0.0f);
}

TEST(EmergencyMonitor, OverpressureOutranksO2Deficit) {
  ConsoleCapture console;
  EmergencyMonitor monitor;
  SensorReading r = nominal_reading();
  r.o2_pct = 17.0f;
  r.pressure_kpa = 115.0f;

  monitor.evaluate(r, 0.0);
  ActuatorCommand cmd = monitor.applyCorrectiveActions(pidCommand());
  EXPECT_FLOAT_EQ(cmd.vent, 1.0f);
  EXPECT_FLOAT_EQ(cmd.heater, 0.0f);
  EXPECT_FLOAT_EQ(cmd.co2_rate, 0.0f);
  EXPECT_FLOAT_EQ(cmd.lighting, 1.0f);
}

TEST(EmergencyMonitor, TemperatureActionFollowsDirection) {
  ConsoleCapture console;
  HazardThresholds t = hazard_thresholds_default();
  SensorReading cold = nominal_reading();
  cold.temperature_c = 2.0f;
  SensorReading hot = nominal_reading();
  hot.temperature_c = 40.0f;

  int dir = 0;
  EXPECT_TRUE(hazard_predicate(HAZARD_TEMPERATURE_EXCURSION, cold, t, &dir));
  EXPECT_EQ(dir, -1);
  EXPECT_TRUE(hazard_predicate(HAZARD_TEMPERATURE_EXCURSION, hot, t, &dir));
  EXPECT_EQ(dir, 1);
  EXPECT_FALSE(hazard_predicate(HAZARD_TEMPERATURE_EXCURSION, nominal_reading(), t, &dir));
  EXPECT_EQ(dir, 0);

  EmergencyMonitor coldMonitor;
  coldMonitor.evaluate(cold, 0.0);
  EXPECT_FLOAT_EQ(coldMonitor.applyCorrectiveActions(pidCommand()).heater, 1.0f);
  EXPECT_EQ(coldMonitor.log()[0].action, "heater=max");

  EmergencyMonitor hotMonitor;
  hotMonitor.evaluate(hot, 0.0);
  ActuatorCommand cmd = hotMonitor.applyCorrectiveActions(pidCommand());
  EXPECT_FLOAT_EQ(cmd.heater, 0.0f);
  EXPECT_FLOAT_EQ(cmd.lighting, 0.0f);
}

TEST(EmergencyMonitor, ReversedExcursionUpdatesOpenEvent) {
  ConsoleCapture console;
  EmergencyMonitor monitor;
  SensorReading r = nominal_reading();
  r.temperature_c = 2.0f;
  EXPECT_EQ(monitor.evaluate(r, 10.0), 1);
  monitor.evaluate(r, 11.0);
  EXPECT_FALSE(console.contains("reversed"));

  r.temperature_c = 40.0f;
  EXPECT_EQ(monitor.evaluate(r, 12.0), 0);
  ASSERT_EQ(monitor.log().size(), 1u);
  EXPECT_FALSE(monitor.log()[0].resolved);
  EXPECT_EQ(monitor.log()[0].action, "heater=0 lighting=0");
  EXPECT_TRUE(console.contains("TEMPERATURE_EXCURSION reversed at t=12 s"));
  EXPECT_FLOAT_EQ(monitor.applyCorrectiveActions(pidCommand()).heater, 0.0f);
}

TEST(EmergencyMonitor, DryAirMistsAndSeals) {
  ConsoleCapture console;
  EmergencyMonitor monitor;
  SensorReading r = nominal_reading();
  r.humidity_pct = 10.0f;
  monitor.evaluate(r, 0.0);

  ActuatorCommand cmd = monitor.applyCorrectiveActions(pidCommand());
  EXPECT_FLOAT_EQ(cmd.mister, 1.0f);
  EXPECT_FLOAT_EQ(cmd.vent, 0.0f);
}

TEST(EmergencyMonitor, AlertsAreAdvisory) {
  EmergencyMonitor monitor;
  Setpoint sp = setpoint_profiles_default().by_mode[MODE_IDLE];
  SetpointTolerance tol = setpoint_tolerance_default();

  SensorReading r = nominal_reading();
  r.temperature_c = sp.temperature_c;
  std::vector<std::string> messages;
  EXPECT_EQ(monitor.gradeAlerts(r, sp, tol, &messages), ALERT_NORMAL);
  EXPECT_TRUE(messages.empty());

  r.temperature_c = sp.temperature_c + 5.0f;
  EXPECT_EQ(monitor.gradeAlerts(r, sp, tol, &messages), ALERT_WARNING);

  r.temperature_c = sp.temperature_c;
  r.o2_pct = 24.0f;
  messages.clear();
  EXPECT_EQ(monitor.gradeAlerts(r, sp, tol, &messages), ALERT_CRITICAL);
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_NE(messages[0].find("fire"), std::string::npos);

  r.o2_pct = 20.9f;
  r.co2_ppm = 150.0f;
  EXPECT_EQ(monitor.gradeAlerts(r, sp, tol, nullptr), ALERT_WARNING);

  EXPECT_FALSE(monitor.anyOpen());
}
