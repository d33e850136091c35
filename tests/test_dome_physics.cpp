#include "dome_physics.h"
#include "test_support.h"

#include <cmath>

static SensorReading coldStart() {
  SensorReading r = nominal_reading();
  r.temperature_c = 0.0f;
  return r;
}

static ActuatorCommand heaterOnly(float heater) {
  ActuatorCommand c = actuator_command_off();
  c.heater = heater;
  return c;
}

TEST(DomePhysics, LagFraction) {
  EXPECT_NEAR(lag_fraction(120.0f, 120.0f), 1.0f - std::exp(-1.0f), 1e-6f);
  EXPECT_FLOAT_EQ(lag_fraction(1.0f, 0.0f), 1.0f);
  EXPECT_FLOAT_EQ(lag_fraction(0.0f, 60.0f), 0.0f);
}

TEST(DomePhysics, HeaterClosesGapWithFirstOrderLag) {
  PhysicsParams p = physics_params_default();
  p.heater_rise_c = 25.0f;
  p.tau_temperature_s = 120.0f;
  DomePhysics physics(p, coldStart());

  for (int k = 0; k < 300; k++) {
    ASSERT_TRUE(physics.step(heaterOnly(1.0f), ambient_at(0.0f), 1.0f));
  }
  // 25 * (1 - e^-2.5)
  EXPECT_GE(physics.reading().temperature_c, 22.5f);
  EXPECT_LT(physics.reading().temperature_c, 25.0f);
}

TEST(DomePhysics, TemperatureRelaxesTowardShieldedExterior) {
  DomePhysics physics(physics_params_default(), nominal_reading());
  for (int k = 0; k < 3600; k++) {
    ASSERT_TRUE(physics.step(actuator_command_off(), ambient_at(-173.0f), 1.0f));
  }
  // Boundary is exterior * shielding (0.1)
  EXPECT_NEAR(physics.reading().temperature_c, -17.3f, 0.5f);
}

TEST(DomePhysics, NonPositiveDtLeavesStateUntouched) {
  DomePhysics physics(physics_params_default(), nominal_reading());
  SensorReading before = physics.reading();

  EXPECT_FALSE(physics.step(heaterOnly(1.0f), ambient_at(0.0f), 0.0f));
  EXPECT_FALSE(physics.step(heaterOnly(1.0f), ambient_at(0.0f), -1.0f));
  EXPECT_FLOAT_EQ(physics.reading().temperature_c, before.temperature_c);
  EXPECT_FLOAT_EQ(physics.reading().co2_ppm, before.co2_ppm);
  EXPECT_FLOAT_EQ(physics.mistLag(), 0.0f);
}

TEST(DomePhysics, VentBlendsGasesTowardVacuum) {
  DomePhysics closed(physics_params_default(), nominal_reading());
  DomePhysics vented(physics_params_default(), nominal_reading());
  ActuatorCommand vent = actuator_command_off();
  vent.vent = 1.0f;

  for (int k = 0; k < 600; k++) {
    ASSERT_TRUE(closed.step(actuator_command_off(), ambient_at(0.0f), 1.0f));
    ASSERT_TRUE(vented.step(vent, ambient_at(0.0f), 1.0f));
  }
  EXPECT_LT(vented.reading().co2_ppm, closed.reading().co2_ppm);
  EXPECT_LT(vented.reading().humidity_pct, closed.reading().humidity_pct);
  EXPECT_LT(vented.reading().o2_pct, closed.reading().o2_pct);
  EXPECT_LT(vented.reading().pressure_kpa, closed.reading().pressure_kpa);
}

TEST(DomePhysics, MisterActsThroughLag) {
  DomePhysics physics(physics_params_default(), nominal_reading());
  ActuatorCommand mist = actuator_command_off();
  mist.mister = 1.0f;

  ASSERT_TRUE(physics.step(mist, ambient_at(0.0f), 1.0f));
  float early = physics.mistLag();
  EXPECT_GT(early, 0.0f);
  EXPECT_LT(early, 0.05f);

  for (int k = 0; k < 900; k++) {
    ASSERT_TRUE(physics.step(mist, ambient_at(0.0f), 1.0f));
  }
  EXPECT_GT(physics.mistLag(), 0.99f);
  EXPECT_GT(physics.reading().humidity_pct, nominal_reading().humidity_pct);
  EXPECT_GT(physics.reading().substrate_moisture, nominal_reading().substrate_moisture);
}

TEST(DomePhysics, LightDrivesPhotosynthesis) {
  DomePhysics dark(physics_params_default(), nominal_reading());
  DomePhysics lit(physics_params_default(), nominal_reading());
  ActuatorCommand lamps = actuator_command_off();
  lamps.lighting = 1.0f;

  for (int k = 0; k < 3600; k++) {
    ASSERT_TRUE(dark.step(actuator_command_off(), ambient_at(0.0f), 1.0f));
    ASSERT_TRUE(lit.step(lamps, ambient_at(0.0f), 1.0f));
  }
  EXPECT_NEAR(lit.reading().light, 1.0f, 1e-3f);
  EXPECT_GT(lit.photoLag(), 0.9f);
  EXPECT_GT(lit.reading().o2_pct, dark.reading().o2_pct);
  EXPECT_LT(lit.reading().co2_ppm, dark.reading().co2_ppm);
}

TEST(DomePhysics, ScrubberAndInjectorMoveCo2) {
  DomePhysics scrubbed(physics_params_default(), nominal_reading());
  DomePhysics injected(physics_params_default(), nominal_reading());
  ActuatorCommand scrub = actuator_command_off();
  scrub.co2_rate = -1.0f;
  ActuatorCommand inject = actuator_command_off();
  inject.co2_rate = 1.0f;

  for (int k = 0; k < 600; k++) {
    ASSERT_TRUE(scrubbed.step(scrub, ambient_at(0.0f), 1.0f));
    ASSERT_TRUE(injected.step(inject, ambient_at(0.0f), 1.0f));
  }
  EXPECT_LT(scrubbed.reading().co2_ppm, 800.0f);
  EXPECT_GE(scrubbed.reading().co2_ppm, 0.0f);
  EXPECT_GT(injected.reading().co2_ppm, 800.0f);
  EXPECT_GT(injected.reading().pressure_kpa, scrubbed.reading().pressure_kpa);
}

TEST(DomePhysics, O2DeltaIsClamped) {
  DomePhysics physics(physics_params_default(), nominal_reading());
  physics.applyO2Delta(1.5f);
  EXPECT_NEAR(physics.reading().o2_pct, 22.4f, 1e-4f);
  physics.applyO2Delta(-500.0f);
  EXPECT_FLOAT_EQ(physics.reading().o2_pct, 0.0f);
  physics.applyO2Delta(500.0f);
  EXPECT_FLOAT_EQ(physics.reading().o2_pct, 100.0f);
}
