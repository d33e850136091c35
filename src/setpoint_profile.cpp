/*
 * *****************************************************************************
 * SETPOINT PROFILES - IMPLEMENTATION
 * *****************************************************************************
 */

#include "setpoint_profile.h"
#include "config.h"

#include <cmath>
#include <stdio.h>

static Setpoint makeSetpoint(float t, float rh, float co2, float o2, float photo) {
  Setpoint sp;
  sp.temperature_c = t;
  sp.humidity_pct = rh;
  sp.co2_ppm = co2;
  sp.o2_pct = o2;
  sp.photoperiod_h = photo;
  return sp;
}

SetpointProfiles setpoint_profiles_default() {
  using namespace Config::Setpoints;
  SetpointProfiles p;
  p.by_mode[MODE_STARTUP] = makeSetpoint(STARTUP_TEMP_C, STARTUP_RH_PCT,
                                         STARTUP_CO2_PPM, STARTUP_O2_PCT,
                                         STARTUP_PHOTOPERIOD_H);
  p.by_mode[MODE_IDLE] = makeSetpoint(IDLE_TEMP_C, IDLE_RH_PCT, IDLE_CO2_PPM,
                                      IDLE_O2_PCT, IDLE_PHOTOPERIOD_H);
  p.by_mode[MODE_GROWING] = makeSetpoint(GROWING_TEMP_C, GROWING_RH_PCT,
                                         GROWING_CO2_PPM, GROWING_O2_PCT,
                                         GROWING_PHOTOPERIOD_H);
  p.by_mode[MODE_MAINTENANCE] = makeSetpoint(
      MAINTENANCE_TEMP_C, MAINTENANCE_RH_PCT, MAINTENANCE_CO2_PPM,
      MAINTENANCE_O2_PCT, MAINTENANCE_PHOTOPERIOD_H);
  p.by_mode[MODE_EMERGENCY] = makeSetpoint(SAFE_HOLD_TEMP_C, SAFE_HOLD_RH_PCT,
                                           SAFE_HOLD_CO2_PPM, SAFE_HOLD_O2_PCT,
                                           SAFE_HOLD_PHOTOPERIOD_H);
  p.by_mode[MODE_SHUTDOWN] = p.by_mode[MODE_EMERGENCY];
  return p;
}

SetpointEnvelope setpoint_envelope_default() {
  using namespace Config::Setpoints;
  SetpointEnvelope env;
  env.temp_min_c = ENVELOPE_TEMP_MIN_C;
  env.temp_max_c = ENVELOPE_TEMP_MAX_C;
  env.humidity_min_pct = ENVELOPE_RH_MIN_PCT;
  env.humidity_max_pct = ENVELOPE_RH_MAX_PCT;
  env.co2_min_ppm = ENVELOPE_CO2_MIN_PPM;
  env.co2_max_ppm = ENVELOPE_CO2_MAX_PPM;
  env.o2_min_pct = ENVELOPE_O2_MIN_PCT;
  env.o2_max_pct = ENVELOPE_O2_MAX_PCT;
  env.photoperiod_max_h = ENVELOPE_PHOTOPERIOD_MAX_H;
  return env;
}

SetpointTolerance setpoint_tolerance_default() {
  using namespace Config::Setpoints;
  SetpointTolerance tol;
  tol.temperature_c = TEMP_TOLERANCE_C;
  tol.humidity_pct = RH_TOLERANCE_PCT;
  tol.co2_ppm = CO2_TOLERANCE_PPM;
  tol.o2_pct = O2_TOLERANCE_PCT;
  return tol;
}

const Setpoint &setpoint_profile_for(const SetpointProfiles &profiles, Mode mode) {
  if (mode == MODE_SHUTDOWN || mode < 0 || mode >= MODE_COUNT) {
    return profiles.by_mode[MODE_EMERGENCY];
  }
  return profiles.by_mode[mode];
}

// Report the first bound a value violates
static bool inRange(const char *name, float v, float lo, float hi,
                    std::string *why) {
  if (std::isfinite(v) && v >= lo && v <= hi) {
    return true;
  }
  if (why != nullptr) {
    char msg[128];
    snprintf(msg, sizeof(msg), "%s=%.2f outside [%.2f, %.2f]", name, v, lo, hi);
    *why = msg;
  }
  return false;
}

bool setpoint_within_envelope(const Setpoint &sp, const SetpointEnvelope &env,
                              std::string *why) {
  return inRange("temperature_c", sp.temperature_c, env.temp_min_c,
                 env.temp_max_c, why) &&
         inRange("humidity_pct", sp.humidity_pct, env.humidity_min_pct,
                 env.humidity_max_pct, why) &&
         inRange("co2_ppm", sp.co2_ppm, env.co2_min_ppm, env.co2_max_ppm, why) &&
         inRange("o2_pct", sp.o2_pct, env.o2_min_pct, env.o2_max_pct, why) &&
         inRange("photoperiod_h", sp.photoperiod_h, 0.0f, env.photoperiod_max_h,
                 why);
}

bool setpoint_reached(const Setpoint &sp, const SensorReading &r,
                      const SetpointTolerance &tol) {
  return std::fabs(r.temperature_c - sp.temperature_c) <= tol.temperature_c &&
         std::fabs(r.humidity_pct - sp.humidity_pct) <= tol.humidity_pct &&
         std::fabs(r.co2_ppm - sp.co2_ppm) <= tol.co2_ppm &&
         std::fabs(r.o2_pct - sp.o2_pct) <= tol.o2_pct;
}
