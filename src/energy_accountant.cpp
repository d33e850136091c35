/*
 * *****************************************************************************
 * ENERGY ACCOUNTANT - IMPLEMENTATION
 * *****************************************************************************
 */

#include "energy_accountant.h"
#include "config.h"

#include <cmath>

static PowerCurve makeCurve(float idleKw, float maxKw, float exponent) {
  PowerCurve c;
  c.idle_kw = idleKw;
  c.max_kw = maxKw;
  c.exponent = exponent;
  return c;
}

PowerConfig power_config_default() {
  using namespace Config::Power;
  PowerConfig p;
  p.heater = makeCurve(HEATER_IDLE_KW, HEATER_MAX_KW, HEATER_EXPONENT);
  p.lighting = makeCurve(LIGHTING_IDLE_KW, LIGHTING_MAX_KW, 1.0f);
  p.vent = makeCurve(VENT_IDLE_KW, VENT_MAX_KW, 1.0f);
  p.mister = makeCurve(MISTER_IDLE_KW, MISTER_MAX_KW, 1.0f);
  p.scrubber = makeCurve(SCRUBBER_IDLE_KW, SCRUBBER_MAX_KW, 1.0f);
  p.fan = makeCurve(FAN_IDLE_KW, FAN_MAX_KW, 1.0f);
  p.controller_baseline_kw = CONTROLLER_BASELINE_KW;
  return p;
}

float power_curve_draw_kw(const PowerCurve &curve, float fraction) {
  float f = fraction;
  if (!std::isfinite(f) || f < 0.0f) f = 0.0f;
  if (f > 1.0f) f = 1.0f;
  float draw = curve.idle_kw + (curve.max_kw - curve.idle_kw) * std::pow(f, curve.exponent);
  return draw > 0.0f ? draw : 0.0f;
}

EnergyAccountant::EnergyAccountant()
    : config_(power_config_default()), ledger_(energy_ledger_zero()) {}

EnergyAccountant::EnergyAccountant(const PowerConfig &config)
    : config_(config), ledger_(energy_ledger_zero()) {}

void EnergyAccountant::drawKw(const ActuatorCommand &cmd,
                              float out[ENERGY_CHANNEL_COUNT]) const {
  out[ENERGY_HEATING] = power_curve_draw_kw(config_.heater, cmd.heater);
  out[ENERGY_LIGHTING] = power_curve_draw_kw(config_.lighting, cmd.lighting);
  out[ENERGY_VENTILATION] = power_curve_draw_kw(config_.vent, cmd.vent);
  out[ENERGY_MISTING] = power_curve_draw_kw(config_.mister, cmd.mister);
  out[ENERGY_OTHER] = power_curve_draw_kw(config_.scrubber, std::fabs(cmd.co2_rate)) +
                      power_curve_draw_kw(config_.fan, cmd.fan) +
                      (config_.controller_baseline_kw > 0.0f
                           ? config_.controller_baseline_kw
                           : 0.0f);
}

void EnergyAccountant::integrate(const ActuatorCommand &cmd, float dtS) {
  if (!(dtS > 0.0f)) {
    return;
  }
  float draw[ENERGY_CHANNEL_COUNT];
  drawKw(cmd, draw);
  // Long runs add tiny increments to large totals, so accumulate in double
  double hours = static_cast<double>(dtS) / 3600.0;
  for (int i = 0; i < ENERGY_CHANNEL_COUNT; i++) {
    ledger_.kwh[i] += static_cast<double>(draw[i]) * hours;
  }
}

void EnergyAccountant::clear() {
  ledger_ = energy_ledger_zero();
}
