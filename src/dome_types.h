/*
 * *****************************************************************************
 * DOME TYPES
 * *****************************************************************************
 * Plain data exchanged between the control components of one dome:
 * - SensorReading: instantaneous physical state (read-only to controllers)
 * - Setpoint: targets of the active operating mode
 * - ActuatorCommand: last commands issued to the actuators
 * - Mode / HazardKind / AlertLevel: closed enumerations
 * - EmergencyEvent / EnergyLedger: records kept for reporting
 * *****************************************************************************
 */

#pragma once

#include <stdint.h>
#include <string>

// =============================================================================
// ENUMERATIONS
// =============================================================================

/**
 * @brief Operating mode of one dome
 *
 * STARTUP -> IDLE <-> GROWING <-> MAINTENANCE, any -> EMERGENCY,
 * EMERGENCY -> IDLE | SHUTDOWN. SHUTDOWN is terminal.
 */
enum Mode {
  MODE_STARTUP,
  MODE_IDLE,
  MODE_GROWING,
  MODE_MAINTENANCE,
  MODE_EMERGENCY,
  MODE_SHUTDOWN,
  MODE_COUNT
};

/**
 * @brief Hazard predicates evaluated every tick
 *
 * Listed from highest to lowest corrective-action priority.
 */
enum HazardKind {
  HAZARD_OVERPRESSURE,
  HAZARD_O2_DEFICIT,
  HAZARD_CO2_EXCESS,
  HAZARD_TEMPERATURE_EXCURSION,
  HAZARD_HUMIDITY_EXCURSION,
  HAZARD_KIND_COUNT
};

enum AlertLevel {
  ALERT_NORMAL,
  ALERT_WARNING,
  ALERT_CRITICAL
};

enum EnergyChannel {
  ENERGY_HEATING,
  ENERGY_LIGHTING,
  ENERGY_VENTILATION,
  ENERGY_MISTING,
  ENERGY_OTHER,
  ENERGY_CHANNEL_COUNT
};

const char *mode_name(Mode mode);
const char *hazard_name(HazardKind kind);
const char *alert_level_name(AlertLevel level);
const char *energy_channel_name(EnergyChannel channel);

// =============================================================================
// DATA STRUCTURES
// =============================================================================

struct SensorReading {
  float temperature_c;      ///< Interior air temperature (°C)
  float humidity_pct;       ///< Relative humidity (%)
  float co2_ppm;            ///< CO2 concentration (ppm)
  float o2_pct;             ///< O2 fraction (%)
  float light;              ///< Light intensity, fraction of full (0-1)
  float substrate_moisture; ///< Substrate moisture (0-1)
  float pressure_kpa;       ///< Interior pressure proxy (kPa)
};

struct Setpoint {
  float temperature_c;
  float humidity_pct;
  float co2_ppm;
  float o2_pct;
  float photoperiod_h;      ///< Hours of supplemental light per day
};

/**
 * @brief Commands issued to the actuators
 *
 * Fractions live in [0,1]; co2_rate lives in [-1,1] (negative = scrub,
 * positive = inject). actuator_command_clamp() enforces both.
 */
struct ActuatorCommand {
  float heater;
  float vent;
  float mister;
  float lighting;
  float co2_rate;
  float fan;                ///< Circulation fan speed fraction
  bool nutrient_dosing;     ///< Mister carries nutrient solution
};

struct EnergyLedger {
  double kwh[ENERGY_CHANNEL_COUNT];

  double total() const;
};

/**
 * @brief One hazard occurrence
 *
 * Opened by the emergency monitor the first tick the predicate holds and
 * closed (resolved_at_s set) the first tick it no longer holds.
 */
struct EmergencyEvent {
  double time_s;
  HazardKind kind;
  SensorReading trigger;
  std::string action;
  bool resolved;
  double resolved_at_s;
};

/**
 * @brief Exterior conditions used as the forcing boundary
 */
struct AmbientConditions {
  float exterior_c;
  float daylight;           ///< Natural light fraction (0-1)
  float o2_pct;
  float co2_ppm;
  float humidity_pct;
  float pressure_kpa;
};

/**
 * @brief Daily output of the nutrient-release model (read-only input)
 */
struct NutrientInput {
  bool valid;
  float concentration_ppm;
  float ph;
};

// =============================================================================
// HELPERS
// =============================================================================

SensorReading sensor_reading_zero();
ActuatorCommand actuator_command_off();
EnergyLedger energy_ledger_zero();

/**
 * @brief Force every channel into its physically admissible range
 *
 * Non-finite values are replaced by the channel's off value.
 */
ActuatorCommand actuator_command_clamp(const ActuatorCommand &cmd);

bool sensor_reading_finite(const SensorReading &r);
