/*
 * *****************************************************************************
 * AMBIENT SCHEDULE - IMPLEMENTATION
 * *****************************************************************************
 */

#include "ambient_schedule.h"
#include "config.h"

#include <cmath>

static const double PI = 3.14159265358979323846;

AmbientProfile ambient_profile_default() {
  AmbientProfile p;
  p.exterior_max_c = Config::Ambient::EXTERIOR_MAX_C;
  p.exterior_min_c = Config::Ambient::EXTERIOR_MIN_C;
  p.day_h = Config::Ambient::LUNAR_DAY_H;
  p.night_h = Config::Ambient::LUNAR_NIGHT_H;
  p.o2_pct = Config::Ambient::O2_PCT;
  p.co2_ppm = Config::Ambient::CO2_PPM;
  p.humidity_pct = Config::Ambient::HUMIDITY_PCT;
  p.pressure_kpa = Config::Ambient::PRESSURE_KPA;
  return p;
}

AmbientSchedule::AmbientSchedule()
    : profile_(ambient_profile_default()), fixed_(false) {
  fixedConditions_ = at(0.0);
}

AmbientSchedule::AmbientSchedule(const AmbientProfile &profile)
    : profile_(profile), fixed_(false) {
  fixedConditions_ = at(0.0);
}

AmbientSchedule AmbientSchedule::constant(const AmbientConditions &conditions) {
  AmbientSchedule s;
  s.fixed_ = true;
  s.fixedConditions_ = conditions;
  s.profile_.exterior_max_c = conditions.exterior_c;
  s.profile_.exterior_min_c = conditions.exterior_c;
  s.profile_.o2_pct = conditions.o2_pct;
  s.profile_.co2_ppm = conditions.co2_ppm;
  s.profile_.humidity_pct = conditions.humidity_pct;
  s.profile_.pressure_kpa = conditions.pressure_kpa;
  return s;
}

AmbientConditions AmbientSchedule::at(double timeS) const {
  if (fixed_) {
    return fixedConditions_;
  }

  AmbientConditions c;
  c.o2_pct = profile_.o2_pct;
  c.co2_ppm = profile_.co2_ppm;
  c.humidity_pct = profile_.humidity_pct;
  c.pressure_kpa = profile_.pressure_kpa;

  double dayS = profile_.day_h * 3600.0;
  double cycleS = dayS + profile_.night_h * 3600.0;
  if (cycleS <= 0.0 || dayS <= 0.0) {
    c.exterior_c = profile_.exterior_min_c;
    c.daylight = 0.0f;
    return c;
  }

  double phase = std::fmod(timeS, cycleS);
  if (phase < 0.0) phase += cycleS;

  if (phase < dayS) {
    float sun = static_cast<float>(std::sin(PI * phase / dayS));
    c.exterior_c = profile_.exterior_min_c +
                   (profile_.exterior_max_c - profile_.exterior_min_c) * sun;
    c.daylight = sun;
  } else {
    c.exterior_c = profile_.exterior_min_c;
    c.daylight = 0.0f;
  }
  return c;
}
