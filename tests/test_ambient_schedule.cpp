#include "ambient_schedule.h"
#include "test_support.h"

TEST(AmbientSchedule, LunarDayFollowsHalfSine) {
  AmbientSchedule schedule;
  const AmbientProfile &p = schedule.profile();
  double dayS = p.day_h * 3600.0;

  AmbientConditions sunrise = schedule.at(0.0);
  EXPECT_NEAR(sunrise.exterior_c, p.exterior_min_c, 1e-3f);
  EXPECT_NEAR(sunrise.daylight, 0.0f, 1e-6f);

  AmbientConditions noon = schedule.at(dayS / 2.0);
  EXPECT_NEAR(noon.exterior_c, p.exterior_max_c, 1e-2f);
  EXPECT_NEAR(noon.daylight, 1.0f, 1e-6f);

  AmbientConditions night = schedule.at(dayS + 3600.0);
  EXPECT_FLOAT_EQ(night.exterior_c, p.exterior_min_c);
  EXPECT_FLOAT_EQ(night.daylight, 0.0f);
}

TEST(AmbientSchedule, RepeatsEveryCycle) {
  AmbientSchedule schedule;
  double cycleS = (schedule.profile().day_h + schedule.profile().night_h) * 3600.0;
  AmbientConditions a = schedule.at(100000.0);
  AmbientConditions b = schedule.at(100000.0 + cycleS);
  EXPECT_NEAR(a.exterior_c, b.exterior_c, 1e-3f);
  EXPECT_NEAR(a.daylight, b.daylight, 1e-5f);
}

TEST(AmbientSchedule, VacuumGasBoundary) {
  AmbientConditions c = AmbientSchedule().at(5000.0);
  EXPECT_FLOAT_EQ(c.o2_pct, 0.0f);
  EXPECT_FLOAT_EQ(c.co2_ppm, 0.0f);
  EXPECT_FLOAT_EQ(c.humidity_pct, 0.0f);
  EXPECT_FLOAT_EQ(c.pressure_kpa, 0.0f);
}

TEST(AmbientSchedule, ConstantConditions) {
  AmbientConditions fixed = ambient_at(-40.0f);
  fixed.daylight = 0.3f;
  AmbientSchedule schedule = AmbientSchedule::constant(fixed);

  EXPECT_FLOAT_EQ(schedule.at(0.0).exterior_c, -40.0f);
  EXPECT_FLOAT_EQ(schedule.at(1e6).exterior_c, -40.0f);
  EXPECT_FLOAT_EQ(schedule.at(1e6).daylight, 0.3f);
}
