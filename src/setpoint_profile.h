/*
 * *****************************************************************************
 * SETPOINT PROFILES
 * *****************************************************************************
 * One Setpoint per operating mode. EMERGENCY selects the safe-hold profile;
 * SHUTDOWN has no control targets and reuses safe-hold for reporting.
 * *****************************************************************************
 */

#pragma once

#include "dome_types.h"

#include <string>

/**
 * @brief Physiologically survivable range for the configured crop
 */
struct SetpointEnvelope {
  float temp_min_c;
  float temp_max_c;
  float humidity_min_pct;
  float humidity_max_pct;
  float co2_min_ppm;
  float co2_max_ppm;
  float o2_min_pct;
  float o2_max_pct;
  float photoperiod_max_h;
};

/**
 * @brief Accepted deviation from a setpoint (alert grading, stabilization)
 */
struct SetpointTolerance {
  float temperature_c;
  float humidity_pct;
  float co2_ppm;
  float o2_pct;
};

struct SetpointProfiles {
  Setpoint by_mode[MODE_COUNT];
};

SetpointProfiles setpoint_profiles_default();
SetpointEnvelope setpoint_envelope_default();
SetpointTolerance setpoint_tolerance_default();

/**
 * @brief Profile active in a mode (SHUTDOWN maps to the safe-hold profile)
 */
const Setpoint &setpoint_profile_for(const SetpointProfiles &profiles, Mode mode);

/**
 * @brief Check a setpoint against the survivable envelope
 * @param why Optional, receives the first violated bound
 * @return true when every target lies inside the envelope
 */
bool setpoint_within_envelope(const Setpoint &sp, const SetpointEnvelope &env,
                              std::string *why);

/**
 * @brief True when every gas/climate reading is within tolerance of sp
 */
bool setpoint_reached(const Setpoint &sp, const SensorReading &r,
                      const SetpointTolerance &tol);
