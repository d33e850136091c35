#include "pid_controller.h"
#include "test_support.h"

#include <cmath>
#include <vector>

static PidGains gains(float kp, float ki, float kd, float lo, float hi, float limit) {
  PidGains g;
  g.kp = kp;
  g.ki = ki;
  g.kd = kd;
  g.out_min = lo;
  g.out_max = hi;
  g.integral_limit = limit;
  return g;
}

TEST(PidController, NonPositiveDtReturnsNeutralAndCountsFault) {
  ConsoleCapture console;
  PidController pid("test", gains(1.0f, 0.1f, 0.0f, -1.0f, 1.0f, 10.0f));

  EXPECT_FLOAT_EQ(pid.update(10.0f, 0.0f, 0.0f), 0.0f);
  EXPECT_FLOAT_EQ(pid.update(10.0f, 0.0f, -1.0f), 0.0f);
  EXPECT_EQ(pid.faultCount(), 2u);
  EXPECT_FLOAT_EQ(pid.state().integral, 0.0f);
  EXPECT_TRUE(console.contains("fault"));
}

TEST(PidController, NeutralOutputIsZeroClampedIntoRange) {
  PidController heater("heater", gains(1.0f, 0.0f, 0.0f, 0.2f, 1.0f, 1.0f));
  EXPECT_FLOAT_EQ(heater.neutralOutput(), 0.2f);

  ConsoleCapture console;
  EXPECT_FLOAT_EQ(heater.update(5.0f, 0.0f, 0.0f), 0.2f);
}

TEST(PidController, NonFiniteMeasurementIsAFault) {
  ConsoleCapture console;
  PidController pid("test", gains(1.0f, 0.0f, 0.0f, -1.0f, 1.0f, 1.0f));
  EXPECT_FLOAT_EQ(pid.update(1.0f, NAN, 1.0f), 0.0f);
  EXPECT_EQ(pid.faultCount(), 1u);
}

TEST(PidController, ProportionalIntegralDerivativeTerms) {
  PidController pid("test", gains(2.0f, 0.5f, 1.0f, -100.0f, 100.0f, 100.0f));

  // error 4 over 2 s: P = 8, I = 0.5 * 8, D = 1 * (4 - 0) / 2
  float out = pid.update(5.0f, 1.0f, 2.0f);
  float p, i, d;
  pid.getTerms(p, i, d);
  EXPECT_FLOAT_EQ(p, 8.0f);
  EXPECT_FLOAT_EQ(i, 4.0f);
  EXPECT_FLOAT_EQ(d, 2.0f);
  EXPECT_FLOAT_EQ(out, 14.0f);
  EXPECT_FLOAT_EQ(pid.state().previous_error, 4.0f);
}

TEST(PidController, IntegralIsClampedAndFlagsWindup) {
  PidController pid("test", gains(0.0f, 1.0f, 0.0f, -100.0f, 100.0f, 5.0f));

  pid.update(10.0f, 0.0f, 1.0f);
  EXPECT_FLOAT_EQ(pid.state().integral, 5.0f);
  EXPECT_TRUE(pid.state().windup);

  pid.update(-20.0f, 0.0f, 1.0f);
  EXPECT_FLOAT_EQ(pid.state().integral, -5.0f);
  EXPECT_TRUE(pid.state().windup);

  pid.update(0.0f, 0.0f, 1.0f);
  EXPECT_FALSE(pid.state().windup);
}

TEST(PidController, OutputIsClamped) {
  PidController pid("test", gains(100.0f, 0.0f, 0.0f, 0.0f, 1.0f, 1.0f));
  EXPECT_FLOAT_EQ(pid.update(10.0f, 0.0f, 1.0f), 1.0f);
  EXPECT_FLOAT_EQ(pid.update(-10.0f, 0.0f, 1.0f), 0.0f);
}

TEST(PidController, ResetClearsMemoryButKeepsFaults) {
  ConsoleCapture console;
  PidController pid("test", gains(1.0f, 1.0f, 0.0f, -10.0f, 10.0f, 10.0f));
  pid.update(3.0f, 0.0f, 1.0f);
  pid.update(3.0f, 0.0f, 0.0f);

  pid.reset();
  EXPECT_FLOAT_EQ(pid.state().integral, 0.0f);
  EXPECT_FLOAT_EQ(pid.state().previous_error, 0.0f);
  EXPECT_EQ(pid.faultCount(), 1u);
}

// First-order plant x' = (10 u - x) / 20 regulated to 2.0
TEST(PidController, ConvergesOnFirstOrderPlantWithoutOscillation) {
  PidController pid("plant", gains(0.3f, 0.01f, 0.0f, 0.0f, 1.0f, 100.0f));
  const float dt = 0.5f;
  const float alpha = 1.0f - std::exp(-dt / 20.0f);
  float x = 0.0f;

  std::vector<float> errors;
  for (int k = 0; k < 4000; k++) {
    float u = pid.update(2.0f, x, dt);
    x += (10.0f * u - x) * alpha;
    if (k % 40 == 0) errors.push_back(std::fabs(2.0f - x));
  }

  for (size_t n = 1; n < errors.size() && errors[n - 1] > 1e-3f; n++) {
    EXPECT_LT(errors[n], errors[n - 1]) << "sample " << n;
  }
  EXPECT_NEAR(x, 2.0f, 1e-3f);
  EXPECT_FALSE(pid.state().windup);
}
