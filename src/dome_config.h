/*
 * *****************************************************************************
 * DOME CONFIGURATION
 * *****************************************************************************
 * Everything one dome needs, built from the Config defaults:
 * - PID gains per loop, setpoint profiles, envelope and tolerances
 * - Mode policy, hazard thresholds, physics and power parameters
 * - Nutrient dosing policy and the interior state at creation
 *
 * Every numeric field is reachable under a dotted option key
 * (e.g. "pid.temperature.kp", "setpoint.growing.co2_ppm"). Values set
 * through the option table are checked for finiteness only; range checks
 * happen in dome_config_validate() when the dome is initialized.
 * *****************************************************************************
 */

#pragma once

#include "dome_physics.h"
#include "dome_types.h"
#include "emergency_monitor.h"
#include "energy_accountant.h"
#include "mode_state_machine.h"
#include "pid_controller.h"
#include "setpoint_profile.h"

#include <stdint.h>
#include <string>
#include <vector>

struct NutrientPolicy {
  float dosing_threshold_ppm;   ///< Dose when concentration falls below
  float ph_min;
  float ph_max;
};

struct DomeConfig {
  std::string dome_id;
  float tick_interval_s;
  uint32_t telemetry_capacity;

  PidGains pid_temperature;     ///< -> heater [0,1]
  PidGains pid_humidity;        ///< -> mister (+) / vent (-) [-1,1]
  PidGains pid_co2;             ///< -> co2 rate [-1,1]
  PidGains pid_o2;              ///< -> lighting boost [0,1]

  SetpointProfiles profiles;
  SetpointEnvelope envelope;
  SetpointTolerance tolerance;
  ModePolicy mode_policy;
  HazardThresholds hazards;
  PhysicsParams physics;
  PowerConfig power;
  NutrientPolicy nutrient;
  SensorReading initial_reading;
};

struct CoordinatorConfig {
  float interval_s;
  float o2_viability_pct;
  float o2_surplus_pct;
  float recovery_margin_pct;    ///< Recipients are lifted to viability + margin
};

DomeConfig dome_config_default(const std::string &domeId);
CoordinatorConfig coordinator_config_default();

/**
 * @brief Check a configuration before a dome is initialized
 * @param error Optional, receives the first problem found
 * @return true when the configuration may be used
 */
bool dome_config_validate(const DomeConfig &cfg, std::string *error);
bool coordinator_config_validate(const CoordinatorConfig &cfg, std::string *error);

// =============================================================================
// NAMED OPTIONS
// =============================================================================

bool dome_config_set_option(DomeConfig &cfg, const std::string &key,
                            double value, std::string *error);
bool dome_config_get_option(const DomeConfig &cfg, const std::string &key,
                            double *value);
std::vector<std::string> dome_config_option_keys();

bool coordinator_config_set_option(CoordinatorConfig &cfg, const std::string &key,
                                   double value, std::string *error);
bool coordinator_config_get_option(const CoordinatorConfig &cfg,
                                   const std::string &key, double *value);
