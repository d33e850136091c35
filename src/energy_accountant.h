/*
 * *****************************************************************************
 * ENERGY ACCOUNTANT
 * *****************************************************************************
 * Integrates actuator power draw into cumulative kWh per subsystem.
 * Every channel draws idle_kw + (max_kw - idle_kw) * fraction^exponent.
 * Accounting runs every tick in every mode; the ledger only grows.
 * *****************************************************************************
 */

#pragma once

#include "dome_types.h"

struct PowerCurve {
  float idle_kw;
  float max_kw;
  float exponent;
};

struct PowerConfig {
  PowerCurve heater;
  PowerCurve lighting;
  PowerCurve vent;
  PowerCurve mister;
  PowerCurve scrubber;      ///< CO2 scrub/inject, driven by |co2_rate|
  PowerCurve fan;
  float controller_baseline_kw;
};

PowerConfig power_config_default();

/**
 * @brief Draw of one curve at a commanded fraction (clamped to [0,1])
 */
float power_curve_draw_kw(const PowerCurve &curve, float fraction);

class EnergyAccountant {
public:
  EnergyAccountant();
  explicit EnergyAccountant(const PowerConfig &config);

  /**
   * @brief Instantaneous draw per ledger channel for a command
   */
  void drawKw(const ActuatorCommand &cmd, float out[ENERGY_CHANNEL_COUNT]) const;

  /**
   * @brief Add draw x dt to the ledger
   * @param dtS Step length in seconds; non-positive steps add nothing
   */
  void integrate(const ActuatorCommand &cmd, float dtS);

  const EnergyLedger &ledger() const { return ledger_; }

  /**
   * @brief Zero the ledger (dome re-initialization only)
   */
  void clear();

private:
  PowerConfig config_;
  EnergyLedger ledger_;
};
