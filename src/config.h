/*
 * *****************************************************************************
 * CONFIGURATION
 * *****************************************************************************
 * Central configuration file for all dome control constants
 * Organizes magic numbers and default values in one location; DomeConfig
 * (dome_config.h) is built from these defaults and may be overridden per dome
 * *****************************************************************************
 */

#pragma once

#include <stdint.h>

// =============================================================================
// SYSTEM CONFIGURATION
// =============================================================================

namespace Config {

// --- Simulation ---
constexpr float TICK_INTERVAL_S = 1.0f;             // Default control tick
constexpr float COORDINATOR_INTERVAL_S = 60.0f;     // Rebalance every minute
constexpr uint32_t TELEMETRY_CAPACITY = 4096;       // Samples kept per dome
constexpr float SECONDS_PER_DAY = 86400.0f;

// =============================================================================
// PHYSICAL RESPONSE MODEL
// =============================================================================

namespace Physics {
  // Time constants (s) of the first-order lags
  constexpr float TAU_TEMPERATURE_S = 120.0f;
  constexpr float TAU_HUMIDITY_S = 300.0f;
  constexpr float TAU_CO2_S = 240.0f;
  constexpr float TAU_O2_S = 600.0f;
  constexpr float TAU_LIGHT_S = 5.0f;
  constexpr float TAU_SUBSTRATE_S = 3600.0f;
  constexpr float TAU_PRESSURE_S = 60.0f;
  constexpr float TAU_MIST_LAG_S = 90.0f;           // Mister -> vapour lag
  constexpr float TAU_PHOTO_LAG_S = 900.0f;         // Light -> photosynthesis lag

  // Thermal
  constexpr float HEATER_RISE_C = 50.0f;            // Full heater above boundary
  constexpr float SHIELDING_FACTOR = 0.1f;          // Regolith berm coupling

  // Gas exchange
  constexpr float VENT_EXCHANGE_MAX = 0.2f;         // Weight of ambient at vent=1
  constexpr float HUMIDITY_BASE_PCT = 45.0f;        // Transpiration equilibrium
  constexpr float MISTER_RISE_PCT = 45.0f;
  constexpr float CO2_BASE_PPM = 900.0f;            // Respiration equilibrium
  constexpr float CO2_ACTUATOR_PPM = 1500.0f;       // Scrub/inject authority
  constexpr float PHOTO_CO2_UPTAKE_PPM = 400.0f;
  constexpr float O2_BASE_PCT = 20.9f;
  constexpr float PHOTO_O2_GAIN_PCT = 1.2f;
  constexpr float NATURAL_LIGHT_TRANSMISSION = 0.3f;
  constexpr float SUBSTRATE_FLOOR = 0.2f;

  // Pressure proxy
  constexpr float NOMINAL_PRESSURE_KPA = 101.3f;
  constexpr float REFERENCE_TEMP_C = 22.0f;
  constexpr float INJECT_PRESSURE_KPA = 4.0f;
}

// --- Interior state at dome creation ---
namespace Initial {
  constexpr float TEMP_C = 15.0f;
  constexpr float RH_PCT = 50.0f;
  constexpr float CO2_PPM = 850.0f;
  constexpr float O2_PCT = 20.9f;
  constexpr float LIGHT = 0.0f;
  constexpr float SUBSTRATE_MOISTURE = 0.3f;
  constexpr float PRESSURE_KPA = 101.3f;
}

// =============================================================================
// AMBIENT (ASTRONOMICAL) INPUT
// =============================================================================

namespace Ambient {
  constexpr float EXTERIOR_MAX_C = 127.0f;          // Equatorial lunar noon
  constexpr float EXTERIOR_MIN_C = -173.0f;         // Polar lunar night
  constexpr float LUNAR_DAY_H = 708.0f;
  constexpr float LUNAR_NIGHT_H = 708.0f;
  // Vacuum boundary
  constexpr float O2_PCT = 0.0f;
  constexpr float CO2_PPM = 0.0f;
  constexpr float HUMIDITY_PCT = 0.0f;
  constexpr float PRESSURE_KPA = 0.0f;
}

// =============================================================================
// CONTROL PARAMETERS
// =============================================================================

// --- PID Gains ---
namespace Pid {
  constexpr float TEMP_KP = 0.25f;
  constexpr float TEMP_KI = 0.002f;
  constexpr float TEMP_KD = 1.0f;
  constexpr float TEMP_INTEGRAL_LIMIT = 500.0f;

  constexpr float HUMIDITY_KP = 0.05f;
  constexpr float HUMIDITY_KI = 0.0005f;
  constexpr float HUMIDITY_KD = 0.2f;
  constexpr float HUMIDITY_INTEGRAL_LIMIT = 2000.0f;

  constexpr float CO2_KP = 0.002f;
  constexpr float CO2_KI = 0.00001f;
  constexpr float CO2_KD = 0.0f;
  constexpr float CO2_INTEGRAL_LIMIT = 50000.0f;

  constexpr float O2_KP = 0.5f;
  constexpr float O2_KI = 0.001f;
  constexpr float O2_KD = 0.0f;
  constexpr float O2_INTEGRAL_LIMIT = 500.0f;
}

// --- Setpoint Profiles (per mode) ---
namespace Setpoints {
  // Startup: benign hold used to judge stabilization
  constexpr float STARTUP_TEMP_C = 20.0f;
  constexpr float STARTUP_RH_PCT = 55.0f;
  constexpr float STARTUP_CO2_PPM = 800.0f;
  constexpr float STARTUP_O2_PCT = 20.9f;
  constexpr float STARTUP_PHOTOPERIOD_H = 0.0f;

  constexpr float IDLE_TEMP_C = 18.0f;
  constexpr float IDLE_RH_PCT = 55.0f;
  constexpr float IDLE_CO2_PPM = 800.0f;
  constexpr float IDLE_O2_PCT = 20.9f;
  constexpr float IDLE_PHOTOPERIOD_H = 0.0f;

  constexpr float GROWING_TEMP_C = 22.0f;
  constexpr float GROWING_RH_PCT = 65.0f;
  constexpr float GROWING_CO2_PPM = 800.0f;
  constexpr float GROWING_O2_PCT = 20.9f;
  constexpr float GROWING_PHOTOPERIOD_H = 16.0f;

  constexpr float MAINTENANCE_TEMP_C = 18.0f;
  constexpr float MAINTENANCE_RH_PCT = 50.0f;
  constexpr float MAINTENANCE_CO2_PPM = 600.0f;
  constexpr float MAINTENANCE_O2_PCT = 20.9f;
  constexpr float MAINTENANCE_PHOTOPERIOD_H = 12.0f;

  // Safe-hold during an emergency
  constexpr float SAFE_HOLD_TEMP_C = 20.0f;
  constexpr float SAFE_HOLD_RH_PCT = 55.0f;
  constexpr float SAFE_HOLD_CO2_PPM = 600.0f;
  constexpr float SAFE_HOLD_O2_PCT = 20.9f;
  constexpr float SAFE_HOLD_PHOTOPERIOD_H = 0.0f;

  // Tolerances (alert grading, startup stabilization)
  constexpr float TEMP_TOLERANCE_C = 2.0f;
  constexpr float RH_TOLERANCE_PCT = 10.0f;
  constexpr float CO2_TOLERANCE_PPM = 200.0f;
  constexpr float O2_TOLERANCE_PCT = 1.0f;

  // Survivable envelope for the configured crop
  constexpr float ENVELOPE_TEMP_MIN_C = 10.0f;
  constexpr float ENVELOPE_TEMP_MAX_C = 32.0f;
  constexpr float ENVELOPE_RH_MIN_PCT = 30.0f;
  constexpr float ENVELOPE_RH_MAX_PCT = 90.0f;
  constexpr float ENVELOPE_CO2_MIN_PPM = 300.0f;
  constexpr float ENVELOPE_CO2_MAX_PPM = 1500.0f;
  constexpr float ENVELOPE_O2_MIN_PCT = 19.5f;
  constexpr float ENVELOPE_O2_MAX_PCT = 23.0f;
  constexpr float ENVELOPE_PHOTOPERIOD_MAX_H = 24.0f;
}

// --- Startup Stabilization ---
constexpr float STARTUP_DWELL_S = 600.0f;           // 10 min inside tolerance

// =============================================================================
// SAFETY
// =============================================================================

namespace Hazard {
  constexpr float TEMP_MIN_C = 5.0f;
  constexpr float TEMP_MAX_C = 35.0f;
  constexpr float RH_MIN_PCT = 20.0f;
  constexpr float RH_MAX_PCT = 95.0f;
  constexpr float CO2_TOXIC_PPM = 2000.0f;
  constexpr float O2_VIABILITY_PCT = 19.0f;
  constexpr float PRESSURE_MAX_KPA = 110.0f;        // Structural limit

  constexpr float COOLDOWN_S = 300.0f;              // Clear time before IDLE
  constexpr uint8_t ESCALATION_COUNT = 3;           // Triggers -> SHUTDOWN
  constexpr float ESCALATION_WINDOW_S = 3600.0f;
  constexpr float EMERGENCY_MAX_DURATION_S = 1800.0f;

  // Advisory alerts
  constexpr float CO2_LOW_PPM = 200.0f;
  constexpr float O2_FIRE_PCT = 23.5f;
}

// =============================================================================
// ACTUATOR POWER DRAW
// =============================================================================

namespace Power {
  constexpr float HEATER_IDLE_KW = 0.0f;
  constexpr float HEATER_MAX_KW = 2.0f;
  constexpr float HEATER_EXPONENT = 2.0f;           // Draw ~ power^2

  constexpr float LIGHTING_IDLE_KW = 0.0f;
  constexpr float LIGHTING_MAX_KW = 1.0f;

  constexpr float VENT_IDLE_KW = 0.0f;
  constexpr float VENT_MAX_KW = 0.4f;

  constexpr float MISTER_IDLE_KW = 0.0f;
  constexpr float MISTER_MAX_KW = 0.15f;

  constexpr float SCRUBBER_IDLE_KW = 0.0f;
  constexpr float SCRUBBER_MAX_KW = 0.3f;

  constexpr float FAN_IDLE_KW = 0.0f;
  constexpr float FAN_MAX_KW = 0.04f;

  constexpr float CONTROLLER_BASELINE_KW = 0.02f;   // Always drawn
}

// --- Supplemental Lighting ---
namespace Lighting {
  constexpr float RAMP_H = 1.0f;                    // Sunrise / sunset ramp
  constexpr float CYCLE_H = 24.0f;
}

// --- Circulation Fan ---
namespace Fan {
  constexpr float BASE_SPEED = 0.25f;
  constexpr float ERROR_SPAN_C = 15.0f;             // Error for full boost
  constexpr float BOOST_RANGE = 0.75f;
}

// =============================================================================
// NUTRIENT DOSING
// =============================================================================

namespace Nutrient {
  constexpr float DOSING_THRESHOLD_PPM = 150.0f;
  constexpr float PH_MIN = 5.5f;
  constexpr float PH_MAX = 7.0f;
}

// =============================================================================
// MULTI-DOME COORDINATION
// =============================================================================

namespace Coordinator {
  constexpr float O2_VIABILITY_PCT = 19.0f;
  constexpr float O2_SURPLUS_PCT = 22.0f;
  constexpr float RECOVERY_MARGIN_PCT = 0.5f;
}

} // namespace Config
