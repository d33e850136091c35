/*
 * *****************************************************************************
 * DOME CONFIGURATION - IMPLEMENTATION
 * *****************************************************************************
 */

#include "dome_config.h"
#include "config.h"
#include "console.h"

#include <cfloat>
#include <cmath>
#include <stdio.h>

// --- Defaults ---

static PidGains makeGains(float kp, float ki, float kd, float outMin,
                          float outMax, float integralLimit) {
  PidGains g;
  g.kp = kp;
  g.ki = ki;
  g.kd = kd;
  g.out_min = outMin;
  g.out_max = outMax;
  g.integral_limit = integralLimit;
  return g;
}

DomeConfig dome_config_default(const std::string &domeId) {
  using namespace Config::Pid;
  DomeConfig cfg;
  cfg.dome_id = domeId;
  cfg.tick_interval_s = Config::TICK_INTERVAL_S;
  cfg.telemetry_capacity = Config::TELEMETRY_CAPACITY;

  cfg.pid_temperature = makeGains(TEMP_KP, TEMP_KI, TEMP_KD, 0.0f, 1.0f,
                                  TEMP_INTEGRAL_LIMIT);
  cfg.pid_humidity = makeGains(HUMIDITY_KP, HUMIDITY_KI, HUMIDITY_KD, -1.0f,
                               1.0f, HUMIDITY_INTEGRAL_LIMIT);
  cfg.pid_co2 = makeGains(CO2_KP, CO2_KI, CO2_KD, -1.0f, 1.0f,
                          CO2_INTEGRAL_LIMIT);
  cfg.pid_o2 = makeGains(O2_KP, O2_KI, O2_KD, 0.0f, 1.0f, O2_INTEGRAL_LIMIT);

  cfg.profiles = setpoint_profiles_default();
  cfg.envelope = setpoint_envelope_default();
  cfg.tolerance = setpoint_tolerance_default();
  cfg.mode_policy = mode_policy_default();
  cfg.hazards = hazard_thresholds_default();
  cfg.physics = physics_params_default();
  cfg.power = power_config_default();

  cfg.nutrient.dosing_threshold_ppm = Config::Nutrient::DOSING_THRESHOLD_PPM;
  cfg.nutrient.ph_min = Config::Nutrient::PH_MIN;
  cfg.nutrient.ph_max = Config::Nutrient::PH_MAX;

  cfg.initial_reading.temperature_c = Config::Initial::TEMP_C;
  cfg.initial_reading.humidity_pct = Config::Initial::RH_PCT;
  cfg.initial_reading.co2_ppm = Config::Initial::CO2_PPM;
  cfg.initial_reading.o2_pct = Config::Initial::O2_PCT;
  cfg.initial_reading.light = Config::Initial::LIGHT;
  cfg.initial_reading.substrate_moisture = Config::Initial::SUBSTRATE_MOISTURE;
  cfg.initial_reading.pressure_kpa = Config::Initial::PRESSURE_KPA;
  return cfg;
}

CoordinatorConfig coordinator_config_default() {
  CoordinatorConfig cfg;
  cfg.interval_s = Config::COORDINATOR_INTERVAL_S;
  cfg.o2_viability_pct = Config::Coordinator::O2_VIABILITY_PCT;
  cfg.o2_surplus_pct = Config::Coordinator::O2_SURPLUS_PCT;
  cfg.recovery_margin_pct = Config::Coordinator::RECOVERY_MARGIN_PCT;
  return cfg;
}

// =============================================================================
// VALIDATION
// =============================================================================

static bool fail(std::string *error, const std::string &msg) {
  if (error != nullptr) *error = msg;
  return false;
}

static bool finite(float v) { return std::isfinite(v); }

static bool checkPid(const char *loop, const PidGains &g, std::string *error) {
  std::string prefix = std::string("pid.") + loop + ": ";
  if (!finite(g.kp) || !finite(g.ki) || !finite(g.kd) ||
      !finite(g.out_min) || !finite(g.out_max) || !finite(g.integral_limit)) {
    return fail(error, prefix + "non-finite gain");
  }
  if (g.kp < 0.0f || g.ki < 0.0f || g.kd < 0.0f) {
    return fail(error, prefix + "gains must be >= 0");
  }
  if (!(g.out_min < g.out_max)) {
    return fail(error, prefix + "out_min must be below out_max");
  }
  if (!(g.integral_limit > 0.0f)) {
    return fail(error, prefix + "integral_limit must be > 0");
  }
  return true;
}

static bool checkCurve(const char *channel, const PowerCurve &c,
                       std::string *error) {
  std::string prefix = std::string("power.") + channel + ": ";
  if (!finite(c.idle_kw) || !finite(c.max_kw) || !finite(c.exponent)) {
    return fail(error, prefix + "non-finite value");
  }
  if (c.idle_kw < 0.0f || c.idle_kw > c.max_kw) {
    return fail(error, prefix + "requires 0 <= idle_kw <= max_kw");
  }
  if (!(c.exponent > 0.0f)) {
    return fail(error, prefix + "exponent must be > 0");
  }
  return true;
}

static bool checkPositive(const char *name, float v, std::string *error) {
  if (!finite(v) || !(v > 0.0f)) {
    return fail(error, std::string(name) + " must be > 0");
  }
  return true;
}

static bool checkFraction(const char *name, float v, std::string *error) {
  if (!finite(v) || v < 0.0f || v > 1.0f) {
    return fail(error, std::string(name) + " must lie in [0,1]");
  }
  return true;
}

bool dome_config_validate(const DomeConfig &cfg, std::string *error) {
  if (cfg.dome_id.empty()) {
    return fail(error, "dome_id must not be empty");
  }
  if (!checkPositive("tick_interval_s", cfg.tick_interval_s, error)) return false;
  if (cfg.telemetry_capacity == 0) {
    return fail(error, "telemetry_capacity must be >= 1");
  }

  // --- Regulation loops ---
  if (!checkPid("temperature", cfg.pid_temperature, error)) return false;
  if (!checkPid("humidity", cfg.pid_humidity, error)) return false;
  if (!checkPid("co2", cfg.pid_co2, error)) return false;
  if (!checkPid("o2", cfg.pid_o2, error)) return false;

  // --- Setpoints ---
  const SetpointEnvelope &env = cfg.envelope;
  if (!(env.temp_min_c < env.temp_max_c) ||
      !(env.humidity_min_pct < env.humidity_max_pct) ||
      !(env.co2_min_ppm < env.co2_max_ppm) || !(env.o2_min_pct < env.o2_max_pct) ||
      !(env.photoperiod_max_h >= 0.0f)) {
    return fail(error, "envelope bounds must be ordered (min < max)");
  }
  for (int m = MODE_STARTUP; m <= MODE_EMERGENCY; m++) {
    std::string why;
    if (!setpoint_within_envelope(cfg.profiles.by_mode[m], env, &why)) {
      return fail(error, std::string("setpoint.") + mode_name(static_cast<Mode>(m)) +
                             " outside survivable envelope: " + why);
    }
  }
  const SetpointTolerance &tol = cfg.tolerance;
  if (!checkPositive("tolerance.temperature_c", tol.temperature_c, error) ||
      !checkPositive("tolerance.humidity_pct", tol.humidity_pct, error) ||
      !checkPositive("tolerance.co2_ppm", tol.co2_ppm, error) ||
      !checkPositive("tolerance.o2_pct", tol.o2_pct, error)) {
    return false;
  }

  // --- Mode policy ---
  const ModePolicy &mp = cfg.mode_policy;
  if (!finite(mp.startup_dwell_s) || mp.startup_dwell_s < 0.0f ||
      !finite(mp.cooldown_s) || mp.cooldown_s < 0.0f) {
    return fail(error, "mode: dwell and cooldown must be >= 0");
  }
  if (mp.escalation_count < 1) {
    return fail(error, "mode.escalation_count must be >= 1");
  }
  if (!checkPositive("mode.escalation_window_s", mp.escalation_window_s, error) ||
      !checkPositive("mode.emergency_max_duration_s",
                     mp.emergency_max_duration_s, error)) {
    return false;
  }

  // --- Hazards ---
  const HazardThresholds &h = cfg.hazards;
  if (!finite(h.temp_min_c) || !finite(h.temp_max_c) ||
      !(h.temp_min_c < h.temp_max_c)) {
    return fail(error, "hazard: temperature band must be ordered");
  }
  if (!finite(h.humidity_min_pct) || !finite(h.humidity_max_pct) ||
      !(h.humidity_min_pct < h.humidity_max_pct)) {
    return fail(error, "hazard: humidity band must be ordered");
  }
  if (!checkPositive("hazard.co2_toxic_ppm", h.co2_toxic_ppm, error) ||
      !checkPositive("hazard.o2_viability_pct", h.o2_viability_pct, error) ||
      !checkPositive("hazard.pressure_max_kpa", h.pressure_max_kpa, error)) {
    return false;
  }
  if (!finite(h.co2_low_ppm) || !finite(h.o2_fire_pct)) {
    return fail(error, "hazard: non-finite advisory threshold");
  }

  // --- Physics ---
  const PhysicsParams &p = cfg.physics;
  if (!checkPositive("physics.tau_temperature_s", p.tau_temperature_s, error) ||
      !checkPositive("physics.tau_humidity_s", p.tau_humidity_s, error) ||
      !checkPositive("physics.tau_co2_s", p.tau_co2_s, error) ||
      !checkPositive("physics.tau_o2_s", p.tau_o2_s, error) ||
      !checkPositive("physics.tau_light_s", p.tau_light_s, error) ||
      !checkPositive("physics.tau_substrate_s", p.tau_substrate_s, error) ||
      !checkPositive("physics.tau_pressure_s", p.tau_pressure_s, error) ||
      !checkPositive("physics.tau_mist_lag_s", p.tau_mist_lag_s, error) ||
      !checkPositive("physics.tau_photo_lag_s", p.tau_photo_lag_s, error)) {
    return false;
  }
  if (!checkFraction("physics.vent_exchange_max", p.vent_exchange_max, error) ||
      !checkFraction("physics.natural_light_transmission",
                     p.natural_light_transmission, error) ||
      !checkFraction("physics.substrate_floor", p.substrate_floor, error)) {
    return false;
  }
  if (!finite(p.heater_rise_c) || !finite(p.shielding_factor) ||
      !finite(p.humidity_base_pct) || !finite(p.mister_rise_pct) ||
      !finite(p.co2_base_ppm) || !finite(p.co2_actuator_ppm) ||
      !finite(p.photo_co2_uptake_ppm) || !finite(p.o2_base_pct) ||
      !finite(p.photo_o2_gain_pct) || !finite(p.nominal_pressure_kpa) ||
      !finite(p.inject_pressure_kpa)) {
    return fail(error, "physics: non-finite plant parameter");
  }
  if (!finite(p.reference_temp_c) || p.reference_temp_c <= -273.15f) {
    return fail(error, "physics.reference_temp_c must be above absolute zero");
  }

  // --- Power ---
  const PowerConfig &pw = cfg.power;
  if (!checkCurve("heating", pw.heater, error) ||
      !checkCurve("lighting", pw.lighting, error) ||
      !checkCurve("ventilation", pw.vent, error) ||
      !checkCurve("misting", pw.mister, error) ||
      !checkCurve("scrubber", pw.scrubber, error) ||
      !checkCurve("fan", pw.fan, error)) {
    return false;
  }
  if (!finite(pw.controller_baseline_kw) || pw.controller_baseline_kw < 0.0f) {
    return fail(error, "power.controller_baseline_kw must be >= 0");
  }

  // --- Nutrient dosing ---
  if (!finite(cfg.nutrient.dosing_threshold_ppm) ||
      cfg.nutrient.dosing_threshold_ppm < 0.0f ||
      !(cfg.nutrient.ph_min < cfg.nutrient.ph_max)) {
    return fail(error, "nutrient: threshold must be >= 0 and ph_min < ph_max");
  }

  if (!sensor_reading_finite(cfg.initial_reading)) {
    return fail(error, "initial reading must be finite");
  }
  return true;
}

bool coordinator_config_validate(const CoordinatorConfig &cfg, std::string *error) {
  if (!checkPositive("coordinator.interval_s", cfg.interval_s, error)) return false;
  if (!finite(cfg.o2_viability_pct) || !finite(cfg.o2_surplus_pct) ||
      !(cfg.o2_viability_pct < cfg.o2_surplus_pct)) {
    return fail(error, "coordinator: viability must be below surplus");
  }
  if (!finite(cfg.recovery_margin_pct) || cfg.recovery_margin_pct < 0.0f) {
    return fail(error, "coordinator.recovery_margin_pct must be >= 0");
  }
  return true;
}

// =============================================================================
// NAMED OPTIONS
// =============================================================================

namespace {

struct OptionSlot {
  std::string key;
  float *f;
  uint32_t *u;
};

void addFloat(std::vector<OptionSlot> &slots, const std::string &key, float *f) {
  OptionSlot s;
  s.key = key;
  s.f = f;
  s.u = nullptr;
  slots.push_back(s);
}

void addUint(std::vector<OptionSlot> &slots, const std::string &key, uint32_t *u) {
  OptionSlot s;
  s.key = key;
  s.f = nullptr;
  s.u = u;
  slots.push_back(s);
}

void addPid(std::vector<OptionSlot> &slots, const std::string &loop, PidGains &g) {
  std::string p = "pid." + loop + ".";
  addFloat(slots, p + "kp", &g.kp);
  addFloat(slots, p + "ki", &g.ki);
  addFloat(slots, p + "kd", &g.kd);
  addFloat(slots, p + "out_min", &g.out_min);
  addFloat(slots, p + "out_max", &g.out_max);
  addFloat(slots, p + "integral_limit", &g.integral_limit);
}

void addCurve(std::vector<OptionSlot> &slots, const std::string &channel,
              PowerCurve &c) {
  std::string p = "power." + channel + ".";
  addFloat(slots, p + "idle_kw", &c.idle_kw);
  addFloat(slots, p + "max_kw", &c.max_kw);
  addFloat(slots, p + "exponent", &c.exponent);
}

// Lower-case names used in option keys; SHUTDOWN has no profile of its own
const char *const PROFILE_KEYS[] = {"startup", "idle", "growing", "maintenance",
                                    "emergency"};

std::vector<OptionSlot> domeSlots(DomeConfig &cfg) {
  std::vector<OptionSlot> slots;
  addFloat(slots, "tick_interval_s", &cfg.tick_interval_s);
  addUint(slots, "telemetry_capacity", &cfg.telemetry_capacity);

  addPid(slots, "temperature", cfg.pid_temperature);
  addPid(slots, "humidity", cfg.pid_humidity);
  addPid(slots, "co2", cfg.pid_co2);
  addPid(slots, "o2", cfg.pid_o2);

  for (int m = MODE_STARTUP; m <= MODE_EMERGENCY; m++) {
    std::string p = std::string("setpoint.") + PROFILE_KEYS[m] + ".";
    Setpoint &sp = cfg.profiles.by_mode[m];
    addFloat(slots, p + "temperature_c", &sp.temperature_c);
    addFloat(slots, p + "humidity_pct", &sp.humidity_pct);
    addFloat(slots, p + "co2_ppm", &sp.co2_ppm);
    addFloat(slots, p + "o2_pct", &sp.o2_pct);
    addFloat(slots, p + "photoperiod_h", &sp.photoperiod_h);
  }

  SetpointEnvelope &env = cfg.envelope;
  addFloat(slots, "envelope.temp_min_c", &env.temp_min_c);
  addFloat(slots, "envelope.temp_max_c", &env.temp_max_c);
  addFloat(slots, "envelope.humidity_min_pct", &env.humidity_min_pct);
  addFloat(slots, "envelope.humidity_max_pct", &env.humidity_max_pct);
  addFloat(slots, "envelope.co2_min_ppm", &env.co2_min_ppm);
  addFloat(slots, "envelope.co2_max_ppm", &env.co2_max_ppm);
  addFloat(slots, "envelope.o2_min_pct", &env.o2_min_pct);
  addFloat(slots, "envelope.o2_max_pct", &env.o2_max_pct);
  addFloat(slots, "envelope.photoperiod_max_h", &env.photoperiod_max_h);

  addFloat(slots, "tolerance.temperature_c", &cfg.tolerance.temperature_c);
  addFloat(slots, "tolerance.humidity_pct", &cfg.tolerance.humidity_pct);
  addFloat(slots, "tolerance.co2_ppm", &cfg.tolerance.co2_ppm);
  addFloat(slots, "tolerance.o2_pct", &cfg.tolerance.o2_pct);

  ModePolicy &mp = cfg.mode_policy;
  addFloat(slots, "mode.startup_dwell_s", &mp.startup_dwell_s);
  addFloat(slots, "mode.cooldown_s", &mp.cooldown_s);
  addUint(slots, "mode.escalation_count", &mp.escalation_count);
  addFloat(slots, "mode.escalation_window_s", &mp.escalation_window_s);
  addFloat(slots, "mode.emergency_max_duration_s", &mp.emergency_max_duration_s);

  HazardThresholds &h = cfg.hazards;
  addFloat(slots, "hazard.temp_min_c", &h.temp_min_c);
  addFloat(slots, "hazard.temp_max_c", &h.temp_max_c);
  addFloat(slots, "hazard.humidity_min_pct", &h.humidity_min_pct);
  addFloat(slots, "hazard.humidity_max_pct", &h.humidity_max_pct);
  addFloat(slots, "hazard.co2_toxic_ppm", &h.co2_toxic_ppm);
  addFloat(slots, "hazard.o2_viability_pct", &h.o2_viability_pct);
  addFloat(slots, "hazard.pressure_max_kpa", &h.pressure_max_kpa);
  addFloat(slots, "hazard.co2_low_ppm", &h.co2_low_ppm);
  addFloat(slots, "hazard.o2_fire_pct", &h.o2_fire_pct);

  PhysicsParams &p = cfg.physics;
  addFloat(slots, "physics.tau_temperature_s", &p.tau_temperature_s);
  addFloat(slots, "physics.tau_humidity_s", &p.tau_humidity_s);
  addFloat(slots, "physics.tau_co2_s", &p.tau_co2_s);
  addFloat(slots, "physics.tau_o2_s", &p.tau_o2_s);
  addFloat(slots, "physics.tau_light_s", &p.tau_light_s);
  addFloat(slots, "physics.tau_substrate_s", &p.tau_substrate_s);
  addFloat(slots, "physics.tau_pressure_s", &p.tau_pressure_s);
  addFloat(slots, "physics.tau_mist_lag_s", &p.tau_mist_lag_s);
  addFloat(slots, "physics.tau_photo_lag_s", &p.tau_photo_lag_s);
  addFloat(slots, "physics.heater_rise_c", &p.heater_rise_c);
  addFloat(slots, "physics.shielding_factor", &p.shielding_factor);
  addFloat(slots, "physics.vent_exchange_max", &p.vent_exchange_max);
  addFloat(slots, "physics.humidity_base_pct", &p.humidity_base_pct);
  addFloat(slots, "physics.mister_rise_pct", &p.mister_rise_pct);
  addFloat(slots, "physics.co2_base_ppm", &p.co2_base_ppm);
  addFloat(slots, "physics.co2_actuator_ppm", &p.co2_actuator_ppm);
  addFloat(slots, "physics.photo_co2_uptake_ppm", &p.photo_co2_uptake_ppm);
  addFloat(slots, "physics.o2_base_pct", &p.o2_base_pct);
  addFloat(slots, "physics.photo_o2_gain_pct", &p.photo_o2_gain_pct);
  addFloat(slots, "physics.natural_light_transmission",
           &p.natural_light_transmission);
  addFloat(slots, "physics.substrate_floor", &p.substrate_floor);
  addFloat(slots, "physics.nominal_pressure_kpa", &p.nominal_pressure_kpa);
  addFloat(slots, "physics.reference_temp_c", &p.reference_temp_c);
  addFloat(slots, "physics.inject_pressure_kpa", &p.inject_pressure_kpa);

  addCurve(slots, "heating", cfg.power.heater);
  addCurve(slots, "lighting", cfg.power.lighting);
  addCurve(slots, "ventilation", cfg.power.vent);
  addCurve(slots, "misting", cfg.power.mister);
  addCurve(slots, "scrubber", cfg.power.scrubber);
  addCurve(slots, "fan", cfg.power.fan);
  addFloat(slots, "power.controller_baseline_kw", &cfg.power.controller_baseline_kw);

  addFloat(slots, "nutrient.dosing_threshold_ppm", &cfg.nutrient.dosing_threshold_ppm);
  addFloat(slots, "nutrient.ph_min", &cfg.nutrient.ph_min);
  addFloat(slots, "nutrient.ph_max", &cfg.nutrient.ph_max);

  SensorReading &r = cfg.initial_reading;
  addFloat(slots, "initial.temperature_c", &r.temperature_c);
  addFloat(slots, "initial.humidity_pct", &r.humidity_pct);
  addFloat(slots, "initial.co2_ppm", &r.co2_ppm);
  addFloat(slots, "initial.o2_pct", &r.o2_pct);
  addFloat(slots, "initial.light", &r.light);
  addFloat(slots, "initial.substrate_moisture", &r.substrate_moisture);
  addFloat(slots, "initial.pressure_kpa", &r.pressure_kpa);
  return slots;
}

std::vector<OptionSlot> coordinatorSlots(CoordinatorConfig &cfg) {
  std::vector<OptionSlot> slots;
  addFloat(slots, "coordinator.interval_s", &cfg.interval_s);
  addFloat(slots, "coordinator.o2_viability_pct", &cfg.o2_viability_pct);
  addFloat(slots, "coordinator.o2_surplus_pct", &cfg.o2_surplus_pct);
  addFloat(slots, "coordinator.recovery_margin_pct", &cfg.recovery_margin_pct);
  return slots;
}

const OptionSlot *findSlot(const std::vector<OptionSlot> &slots,
                           const std::string &key) {
  for (size_t i = 0; i < slots.size(); i++) {
    if (slots[i].key == key) return &slots[i];
  }
  return nullptr;
}

bool writeSlot(const std::vector<OptionSlot> &slots, const std::string &key,
               double value, std::string *error) {
  const OptionSlot *slot = findSlot(slots, key);
  if (slot == nullptr) {
    console_printf("Config", "unknown option '%s' rejected", key.c_str());
    return fail(error, "unknown option: " + key);
  }
  if (!std::isfinite(value)) {
    console_printf("Config", "non-finite value for '%s' rejected", key.c_str());
    return fail(error, "non-finite value for " + key);
  }
  if (slot->u != nullptr) {
    if (value < 0.0 || value > 4294967295.0 || std::floor(value) != value) {
      console_printf("Config", "'%s' needs a non-negative integer, got %g",
                     key.c_str(), value);
      return fail(error, key + " requires a non-negative integer");
    }
    *slot->u = static_cast<uint32_t>(value);
  } else {
    if (std::fabs(value) > FLT_MAX) {
      console_printf("Config", "'%s' out of range, got %g", key.c_str(), value);
      return fail(error, key + " is out of range");
    }
    *slot->f = static_cast<float>(value);
  }
  return true;
}

bool readSlot(const std::vector<OptionSlot> &slots, const std::string &key,
              double *value) {
  const OptionSlot *slot = findSlot(slots, key);
  if (slot == nullptr) return false;
  if (value != nullptr) {
    *value = slot->u != nullptr ? static_cast<double>(*slot->u)
                                : static_cast<double>(*slot->f);
  }
  return true;
}

} // namespace

bool dome_config_set_option(DomeConfig &cfg, const std::string &key,
                            double value, std::string *error) {
  return writeSlot(domeSlots(cfg), key, value, error);
}

bool dome_config_get_option(const DomeConfig &cfg, const std::string &key,
                            double *value) {
  DomeConfig copy = cfg;
  return readSlot(domeSlots(copy), key, value);
}

std::vector<std::string> dome_config_option_keys() {
  DomeConfig cfg = dome_config_default("keys");
  std::vector<OptionSlot> slots = domeSlots(cfg);
  std::vector<std::string> keys;
  keys.reserve(slots.size());
  for (size_t i = 0; i < slots.size(); i++) {
    keys.push_back(slots[i].key);
  }
  return keys;
}

bool coordinator_config_set_option(CoordinatorConfig &cfg, const std::string &key,
                                   double value, std::string *error) {
  return writeSlot(coordinatorSlots(cfg), key, value, error);
}

bool coordinator_config_get_option(const CoordinatorConfig &cfg,
                                   const std::string &key, double *value) {
  CoordinatorConfig copy = cfg;
  return readSlot(coordinatorSlots(copy), key, value);
}
