/*
 * *****************************************************************************
 * DOME PHYSICS - IMPLEMENTATION
 * *****************************************************************************
 */

#include "dome_physics.h"
#include "config.h"

#include <cmath>

static constexpr float KELVIN_OFFSET = 273.15f;

PhysicsParams physics_params_default() {
  using namespace Config::Physics;
  PhysicsParams p;
  p.tau_temperature_s = TAU_TEMPERATURE_S;
  p.tau_humidity_s = TAU_HUMIDITY_S;
  p.tau_co2_s = TAU_CO2_S;
  p.tau_o2_s = TAU_O2_S;
  p.tau_light_s = TAU_LIGHT_S;
  p.tau_substrate_s = TAU_SUBSTRATE_S;
  p.tau_pressure_s = TAU_PRESSURE_S;
  p.tau_mist_lag_s = TAU_MIST_LAG_S;
  p.tau_photo_lag_s = TAU_PHOTO_LAG_S;
  p.heater_rise_c = HEATER_RISE_C;
  p.shielding_factor = SHIELDING_FACTOR;
  p.vent_exchange_max = VENT_EXCHANGE_MAX;
  p.humidity_base_pct = HUMIDITY_BASE_PCT;
  p.mister_rise_pct = MISTER_RISE_PCT;
  p.co2_base_ppm = CO2_BASE_PPM;
  p.co2_actuator_ppm = CO2_ACTUATOR_PPM;
  p.photo_co2_uptake_ppm = PHOTO_CO2_UPTAKE_PPM;
  p.o2_base_pct = O2_BASE_PCT;
  p.photo_o2_gain_pct = PHOTO_O2_GAIN_PCT;
  p.natural_light_transmission = NATURAL_LIGHT_TRANSMISSION;
  p.substrate_floor = SUBSTRATE_FLOOR;
  p.nominal_pressure_kpa = NOMINAL_PRESSURE_KPA;
  p.reference_temp_c = REFERENCE_TEMP_C;
  p.inject_pressure_kpa = INJECT_PRESSURE_KPA;
  return p;
}

float lag_fraction(float dtS, float tauS) {
  if (tauS <= 0.0f) return 1.0f;
  return 1.0f - std::exp(-dtS / tauS);
}

static float approach(float current, float target, float dtS, float tauS) {
  return current + (target - current) * lag_fraction(dtS, tauS);
}

static float clampf(float v, float lo, float hi) {
  if (v < lo) return lo;
  if (v > hi) return hi;
  return v;
}

// Blend toward the ambient value by the vent exchange weight
static float ventBlend(float target, float ambient, float weight) {
  return (1.0f - weight) * target + weight * ambient;
}

DomePhysics::DomePhysics()
    : params_(physics_params_default()), reading_(sensor_reading_zero()),
      mistLag_(0.0f), photoLag_(0.0f) {}

DomePhysics::DomePhysics(const PhysicsParams &params, const SensorReading &initial)
    : params_(params), reading_(initial), mistLag_(0.0f),
      photoLag_(clampf(initial.light, 0.0f, 1.0f)) {}

bool DomePhysics::step(const ActuatorCommand &cmd,
                       const AmbientConditions &ambient, float dtS) {
  if (!(dtS > 0.0f)) {
    return false;
  }

  const PhysicsParams &p = params_;
  SensorReading next = reading_;
  float v = clampf(cmd.vent, 0.0f, 1.0f) * p.vent_exchange_max;

  // --- Lagged actuator effects ---
  mistLag_ = approach(mistLag_, clampf(cmd.mister, 0.0f, 1.0f), dtS,
                      p.tau_mist_lag_s);
  photoLag_ = approach(photoLag_, clampf(reading_.light, 0.0f, 1.0f), dtS,
                       p.tau_photo_lag_s);

  // --- Temperature: heater above the shielded exterior ---
  float boundary = ambient.exterior_c * p.shielding_factor;
  float tempTarget = boundary + clampf(cmd.heater, 0.0f, 1.0f) * p.heater_rise_c;
  next.temperature_c = approach(reading_.temperature_c, tempTarget, dtS,
                                p.tau_temperature_s);

  // --- Humidity ---
  float rhTarget = p.humidity_base_pct + mistLag_ * p.mister_rise_pct;
  rhTarget = ventBlend(rhTarget, ambient.humidity_pct, v);
  next.humidity_pct = clampf(
      approach(reading_.humidity_pct, rhTarget, dtS, p.tau_humidity_s), 0.0f,
      100.0f);

  // --- CO2: respiration baseline, actuator, photosynthetic uptake ---
  float co2Target = p.co2_base_ppm +
                    clampf(cmd.co2_rate, -1.0f, 1.0f) * p.co2_actuator_ppm -
                    photoLag_ * p.photo_co2_uptake_ppm;
  if (co2Target < 0.0f) co2Target = 0.0f;
  co2Target = ventBlend(co2Target, ambient.co2_ppm, v);
  next.co2_ppm = approach(reading_.co2_ppm, co2Target, dtS, p.tau_co2_s);
  if (next.co2_ppm < 0.0f) next.co2_ppm = 0.0f;

  // --- O2: photosynthetic production ---
  float o2Target = p.o2_base_pct + photoLag_ * p.photo_o2_gain_pct;
  o2Target = ventBlend(o2Target, ambient.o2_pct, v);
  next.o2_pct = clampf(approach(reading_.o2_pct, o2Target, dtS, p.tau_o2_s),
                       0.0f, 100.0f);

  // --- Light: lamps plus transmitted daylight ---
  float lightTarget = clampf(cmd.lighting + clampf(ambient.daylight, 0.0f, 1.0f) *
                                                p.natural_light_transmission,
                             0.0f, 1.0f);
  next.light = approach(reading_.light, lightTarget, dtS, p.tau_light_s);

  // --- Substrate moisture ---
  float soilTarget = p.substrate_floor + mistLag_ * (1.0f - p.substrate_floor);
  next.substrate_moisture = clampf(
      approach(reading_.substrate_moisture, soilTarget, dtS, p.tau_substrate_s),
      0.0f, 1.0f);

  // --- Pressure proxy: ideal gas on temperature, injection, vent loss ---
  float tK = next.temperature_c + KELVIN_OFFSET;
  float refK = p.reference_temp_c + KELVIN_OFFSET;
  float injection = cmd.co2_rate > 0.0f ? cmd.co2_rate : 0.0f;
  float pTarget = p.nominal_pressure_kpa * (tK / refK) +
                  injection * p.inject_pressure_kpa;
  pTarget = ventBlend(pTarget, ambient.pressure_kpa, v);
  next.pressure_kpa = approach(reading_.pressure_kpa, pTarget, dtS,
                               p.tau_pressure_s);
  if (next.pressure_kpa < 0.0f) next.pressure_kpa = 0.0f;

  reading_ = next;
  return true;
}

void DomePhysics::setReading(const SensorReading &reading) {
  reading_ = reading;
}

void DomePhysics::applyO2Delta(float deltaPct) {
  reading_.o2_pct = clampf(reading_.o2_pct + deltaPct, 0.0f, 100.0f);
}
