/*
 * *****************************************************************************
 * DOME TYPES - IMPLEMENTATION
 * *****************************************************************************
 */

#include "dome_types.h"

#include <cmath>

const char *mode_name(Mode mode) {
  switch (mode) {
  case MODE_STARTUP:
    return "STARTUP";
  case MODE_IDLE:
    return "IDLE";
  case MODE_GROWING:
    return "GROWING";
  case MODE_MAINTENANCE:
    return "MAINTENANCE";
  case MODE_EMERGENCY:
    return "EMERGENCY";
  case MODE_SHUTDOWN:
    return "SHUTDOWN";
  default:
    return "UNKNOWN";
  }
}

const char *hazard_name(HazardKind kind) {
  switch (kind) {
  case HAZARD_OVERPRESSURE:
    return "OVERPRESSURE";
  case HAZARD_O2_DEFICIT:
    return "O2_DEFICIT";
  case HAZARD_CO2_EXCESS:
    return "CO2_EXCESS";
  case HAZARD_TEMPERATURE_EXCURSION:
    return "TEMPERATURE_EXCURSION";
  case HAZARD_HUMIDITY_EXCURSION:
    return "HUMIDITY_EXCURSION";
  default:
    return "UNKNOWN";
  }
}

const char *alert_level_name(AlertLevel level) {
  switch (level) {
  case ALERT_NORMAL:
    return "NORMAL";
  case ALERT_WARNING:
    return "WARNING";
  case ALERT_CRITICAL:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

const char *energy_channel_name(EnergyChannel channel) {
  switch (channel) {
  case ENERGY_HEATING:
    return "heating";
  case ENERGY_LIGHTING:
    return "lighting";
  case ENERGY_VENTILATION:
    return "ventilation";
  case ENERGY_MISTING:
    return "misting";
  case ENERGY_OTHER:
    return "other";
  default:
    return "unknown";
  }
}

double EnergyLedger::total() const {
  double sum = 0.0;
  for (int i = 0; i < ENERGY_CHANNEL_COUNT; i++) {
    sum += kwh[i];
  }
  return sum;
}

SensorReading sensor_reading_zero() {
  SensorReading r;
  r.temperature_c = 0.0f;
  r.humidity_pct = 0.0f;
  r.co2_ppm = 0.0f;
  r.o2_pct = 0.0f;
  r.light = 0.0f;
  r.substrate_moisture = 0.0f;
  r.pressure_kpa = 0.0f;
  return r;
}

ActuatorCommand actuator_command_off() {
  ActuatorCommand cmd;
  cmd.heater = 0.0f;
  cmd.vent = 0.0f;
  cmd.mister = 0.0f;
  cmd.lighting = 0.0f;
  cmd.co2_rate = 0.0f;
  cmd.fan = 0.0f;
  cmd.nutrient_dosing = false;
  return cmd;
}

EnergyLedger energy_ledger_zero() {
  EnergyLedger ledger;
  for (int i = 0; i < ENERGY_CHANNEL_COUNT; i++) {
    ledger.kwh[i] = 0.0;
  }
  return ledger;
}

// Clamp with NaN mapped to the fallback
static float admissible(float v, float lo, float hi, float fallback) {
  if (!std::isfinite(v)) return fallback;
  if (v < lo) return lo;
  if (v > hi) return hi;
  return v;
}

ActuatorCommand actuator_command_clamp(const ActuatorCommand &cmd) {
  ActuatorCommand out;
  out.heater = admissible(cmd.heater, 0.0f, 1.0f, 0.0f);
  out.vent = admissible(cmd.vent, 0.0f, 1.0f, 0.0f);
  out.mister = admissible(cmd.mister, 0.0f, 1.0f, 0.0f);
  out.lighting = admissible(cmd.lighting, 0.0f, 1.0f, 0.0f);
  out.co2_rate = admissible(cmd.co2_rate, -1.0f, 1.0f, 0.0f);
  out.fan = admissible(cmd.fan, 0.0f, 1.0f, 0.0f);
  out.nutrient_dosing = cmd.nutrient_dosing && out.mister > 0.0f;
  return out;
}

bool sensor_reading_finite(const SensorReading &r) {
  return std::isfinite(r.temperature_c) && std::isfinite(r.humidity_pct) &&
         std::isfinite(r.co2_ppm) && std::isfinite(r.o2_pct) &&
         std::isfinite(r.light) &&
         std::isfinite(r.substrate_moisture) &&
         std::isfinite(r.pressure_kpa);
}
