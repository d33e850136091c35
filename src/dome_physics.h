/*
 * *****************************************************************************
 * DOME PHYSICS - SIMULATED SENSOR RESPONSE
 * *****************************************************************************
 * First-order lag model of the enclosure. Every variable approaches a
 * forcing value with its own time constant:
 *
 *   x += (target - x) * (1 - exp(-dt / tau))
 *
 * - Heater raises the temperature target above the shielded exterior
 * - Vent blends gas targets toward the ambient (lethal) composition
 * - Mister drives humidity and substrate moisture through a lagged state
 * - Light drives a lagged photosynthesis proxy (O2 up, CO2 down)
 * - Pressure proxy follows temperature (ideal gas) and CO2 injection
 *
 * This is not a heat/mass transfer solver.
 * *****************************************************************************
 */

#pragma once

#include "dome_types.h"

struct PhysicsParams {
  float tau_temperature_s;
  float tau_humidity_s;
  float tau_co2_s;
  float tau_o2_s;
  float tau_light_s;
  float tau_substrate_s;
  float tau_pressure_s;
  float tau_mist_lag_s;
  float tau_photo_lag_s;

  float heater_rise_c;
  float shielding_factor;

  float vent_exchange_max;
  float humidity_base_pct;
  float mister_rise_pct;
  float co2_base_ppm;
  float co2_actuator_ppm;
  float photo_co2_uptake_ppm;
  float o2_base_pct;
  float photo_o2_gain_pct;
  float natural_light_transmission;
  float substrate_floor;

  float nominal_pressure_kpa;
  float reference_temp_c;
  float inject_pressure_kpa;
};

PhysicsParams physics_params_default();

/**
 * @brief Fraction of the gap closed by a first-order lag over dt
 */
float lag_fraction(float dtS, float tauS);

class DomePhysics {
public:
  DomePhysics();
  DomePhysics(const PhysicsParams &params, const SensorReading &initial);

  /**
   * @brief Advance the enclosure by dt under the given commands
   * @param cmd Commands held constant over the step (already clamped)
   * @param ambient Exterior boundary for the step
   * @param dtS Step length in seconds
   * @return false (state untouched) when dt <= 0
   */
  bool step(const ActuatorCommand &cmd, const AmbientConditions &ambient,
            float dtS);

  const SensorReading &reading() const { return reading_; }

  /**
   * @brief Overwrite the physical state (disturbance injection)
   */
  void setReading(const SensorReading &reading);

  /**
   * @brief Add a redistribution delta (percentage points) to O2
   */
  void applyO2Delta(float deltaPct);

  float mistLag() const { return mistLag_; }
  float photoLag() const { return photoLag_; }
  const PhysicsParams &params() const { return params_; }

private:
  PhysicsParams params_;
  SensorReading reading_;
  float mistLag_;
  float photoLag_;
};
