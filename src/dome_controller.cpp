/*
 * *****************************************************************************
 * DOME CONTROLLER - IMPLEMENTATION
 * *****************************************************************************
 */

#include "dome_controller.h"
#include "config.h"
#include "console.h"

#include <algorithm>
#include <cmath>

static float clampf(float v, float lo, float hi) {
  if (v < lo) return lo;
  if (v > hi) return hi;
  return v;
}

float photoperiod_lighting(float hourOfDay, float photoperiodH) {
  const float ramp = Config::Lighting::RAMP_H;
  if (!(photoperiodH > 0.0f) || hourOfDay < 0.0f || hourOfDay >= photoperiodH) {
    return 0.0f;
  }
  // Sunrise ramp, full power, sunset ramp
  float level = std::min(hourOfDay / ramp, (photoperiodH - hourOfDay) / ramp);
  return clampf(level, 0.0f, 1.0f);
}

static float fanSpeed(float temperatureError) {
  using namespace Config::Fan;
  return BASE_SPEED + std::min(std::fabs(temperatureError) / ERROR_SPAN_C, BOOST_RANGE);
}

// --- Construction ---

DomeController::DomeController()
    : initialized_(false), config_(dome_config_default("dome")),
      telemetry_(1), substrateReadyDay_(0.0f), tickFaults_(0) {
  state_.time_s = 0.0;
  state_.command = actuator_command_off();
  state_.setpoint = setpoint_profile_for(config_.profiles, MODE_STARTUP);
  state_.alert = ALERT_NORMAL;
  nutrient_.valid = false;
  nutrient_.concentration_ppm = 0.0f;
  nutrient_.ph = 0.0f;
}

bool DomeController::init(const DomeConfig &config, std::string *error) {
  std::string why;
  if (!dome_config_validate(config, &why)) {
    console_printf("Controller", "[%s] configuration rejected: %s",
                   config.dome_id.c_str(), why.c_str());
    if (error != nullptr) *error = why;
    initialized_ = false;
    return false;
  }

  config_ = config;
  state_.time_s = 0.0;
  state_.physics = DomePhysics(config.physics, config.initial_reading);
  state_.pid_temperature = PidController(config.dome_id + "/temperature",
                                         config.pid_temperature);
  state_.pid_humidity = PidController(config.dome_id + "/humidity",
                                      config.pid_humidity);
  state_.pid_co2 = PidController(config.dome_id + "/co2", config.pid_co2);
  state_.pid_o2 = PidController(config.dome_id + "/o2", config.pid_o2);
  state_.modes = ModeStateMachine(config.mode_policy);
  state_.monitor = EmergencyMonitor(config.hazards);
  state_.energy = EnergyAccountant(config.power);
  state_.command = actuator_command_off();
  state_.setpoint = setpoint_profile_for(config.profiles, MODE_STARTUP);
  state_.alert = ALERT_NORMAL;
  state_.alert_messages.clear();

  telemetry_ = TelemetryBuffer(config.telemetry_capacity);
  tickFaults_ = 0;
  initialized_ = true;

  console_printf("Controller", "[%s] initialized in %s, tick %.1f s",
                 config.dome_id.c_str(), mode_name(MODE_STARTUP),
                 config.tick_interval_s);
  return true;
}

// --- Tick ---

void DomeController::recordFault(const char *what) {
  tickFaults_++;
  console_printf("Controller", "[%s] tick fault at t=%.0f s: %s (rolled back)",
                 config_.dome_id.c_str(), state_.time_s, what);
}

void DomeController::computeCommand(DomeState &s, const SensorReading &r,
                                    float dtS) const {
  const Setpoint &sp = s.setpoint;
  ActuatorCommand cmd = actuator_command_off();

  cmd.heater = s.pid_temperature.update(sp.temperature_c, r.temperature_c, dtS);

  // Humidity loop is signed: positive mists, negative vents
  float humidity = s.pid_humidity.update(sp.humidity_pct, r.humidity_pct, dtS);
  cmd.mister = humidity > 0.0f ? humidity : 0.0f;
  cmd.vent = humidity < 0.0f ? -humidity : 0.0f;

  cmd.co2_rate = s.pid_co2.update(sp.co2_ppm, r.co2_ppm, dtS);

  // O2 loop may only raise lighting above the photoperiod schedule
  const double cycleS = Config::Lighting::CYCLE_H * 3600.0;
  float hourOfDay = static_cast<float>(std::fmod(s.time_s, cycleS) / 3600.0);
  float scheduled = photoperiod_lighting(hourOfDay, sp.photoperiod_h);
  float boost = s.pid_o2.update(sp.o2_pct, r.o2_pct, dtS);
  cmd.lighting = std::max(scheduled, boost);

  cmd.fan = fanSpeed(sp.temperature_c - r.temperature_c);

  const NutrientPolicy &np = config_.nutrient;
  cmd.nutrient_dosing = cmd.mister > 0.0f && nutrient_.valid &&
                        nutrient_.concentration_ppm < np.dosing_threshold_ppm &&
                        nutrient_.ph >= np.ph_min && nutrient_.ph <= np.ph_max;

  s.command = cmd;
}

bool DomeController::tick(float dtS, const AmbientConditions &ambient) {
  if (!initialized_) {
    return false;
  }
  if (!(dtS > 0.0f) || !std::isfinite(dtS)) {
    recordFault("non-positive dt");
    return false;
  }

  DomeState next = state_;
  const double now = next.time_s;

  if (next.modes.mode() != MODE_SHUTDOWN) {
    SensorReading r = next.physics.reading();

    // --- Hazards first, they decide the mode ---
    next.monitor.evaluate(r, now);

    const Setpoint &startup = setpoint_profile_for(config_.profiles, MODE_STARTUP);
    bool stabilized = setpoint_reached(startup, r, config_.tolerance);

    Mode before = next.modes.mode();
    if (next.modes.update(now, next.monitor.anyOpen(), stabilized)) {
      Mode after = next.modes.mode();
      if (after != MODE_EMERGENCY && after != before) {
        next.pid_temperature.reset();
        next.pid_humidity.reset();
        next.pid_co2.reset();
        next.pid_o2.reset();
      }
    }
  }

  Mode mode = next.modes.mode();
  next.setpoint = setpoint_profile_for(config_.profiles, mode);

  if (mode == MODE_SHUTDOWN) {
    next.command = actuator_command_off();
  } else {
    const SensorReading &r = next.physics.reading();
    computeCommand(next, r, dtS);
    if (next.monitor.anyOpen()) {
      next.command = next.monitor.applyCorrectiveActions(next.command);
    }
    next.command = actuator_command_clamp(next.command);

    // --- Advisory alerts ---
    std::vector<std::string> messages;
    AlertLevel level = next.monitor.gradeAlerts(r, next.setpoint,
                                                config_.tolerance, &messages);
    if (level != next.alert) {
      console_printf("Alert", "[%s] %s -> %s at t=%.0f s%s%s",
                     config_.dome_id.c_str(), alert_level_name(next.alert),
                     alert_level_name(level), now,
                     messages.empty() ? "" : ": ",
                     messages.empty() ? "" : messages.front().c_str());
    }
    next.alert = level;
    next.alert_messages = messages;
  }

  // --- Plant and energy ---
  if (!next.physics.step(next.command, ambient, dtS)) {
    recordFault("physics step refused");
    return false;
  }
  if (!sensor_reading_finite(next.physics.reading())) {
    recordFault("non-finite reading");
    return false;
  }
  next.energy.integrate(next.command, dtS);
  next.time_s = now + dtS;

  state_ = next;

  TelemetrySample sample;
  sample.time_s = state_.time_s;
  sample.mode = mode;
  sample.reading = state_.physics.reading();
  sample.command = state_.command;
  sample.setpoint = state_.setpoint;
  sample.ledger = state_.energy.ledger();
  sample.alert = state_.alert;
  telemetry_.push(sample);
  return true;
}

// --- Operator and collaborator inputs ---

float DomeController::missionDay() const {
  return static_cast<float>(state_.time_s / Config::SECONDS_PER_DAY);
}

bool DomeController::requestMode(Mode target, std::string *why) {
  if (!initialized_) {
    if (why != nullptr) *why = "dome not initialized";
    return false;
  }
  std::string reason;
  bool ready = missionDay() >= substrateReadyDay_;
  Mode before = state_.modes.mode();
  if (!state_.modes.requestMode(target, ready, state_.time_s, &reason)) {
    console_printf("Controller", "[%s] mode request %s refused: %s",
                   config_.dome_id.c_str(), mode_name(target), reason.c_str());
    if (why != nullptr) *why = reason;
    return false;
  }
  if (state_.modes.mode() != before) {
    state_.pid_temperature.reset();
    state_.pid_humidity.reset();
    state_.pid_co2.reset();
    state_.pid_o2.reset();
    state_.setpoint = setpoint_profile_for(config_.profiles, state_.modes.mode());
  }
  return true;
}

void DomeController::setSubstrateReadyDay(float day) {
  substrateReadyDay_ = day;
}

void DomeController::setNutrientInput(const NutrientInput &input) {
  nutrient_ = input;
}

bool DomeController::setProfile(Mode mode, const Setpoint &setpoint) {
  if (mode < MODE_STARTUP || mode >= MODE_SHUTDOWN) {
    return false;
  }
  if (!std::isfinite(setpoint.temperature_c) || !std::isfinite(setpoint.humidity_pct) ||
      !std::isfinite(setpoint.co2_ppm) || !std::isfinite(setpoint.o2_pct) ||
      !std::isfinite(setpoint.photoperiod_h)) {
    console_printf("Controller", "[%s] non-finite %s profile refused",
                   config_.dome_id.c_str(), mode_name(mode));
    return false;
  }

  std::string why;
  if (!setpoint_within_envelope(setpoint, config_.envelope, &why)) {
    console_printf("Controller", "[%s] warning: %s profile outside envelope (%s)",
                   config_.dome_id.c_str(), mode_name(mode), why.c_str());
  }
  config_.profiles.by_mode[mode] = setpoint;
  if (mode == MODE_EMERGENCY) {
    config_.profiles.by_mode[MODE_SHUTDOWN] = setpoint;
  }
  return true;
}

bool DomeController::setSensorReading(const SensorReading &reading) {
  if (!initialized_ || !sensor_reading_finite(reading)) {
    return false;
  }
  state_.physics.setReading(reading);
  return true;
}

bool DomeController::applyO2Delta(float deltaPct) {
  if (!initialized_ || !std::isfinite(deltaPct)) {
    return false;
  }
  state_.physics.applyO2Delta(deltaPct);
  return true;
}

uint32_t DomeController::faultCount() const {
  return tickFaults_ + state_.pid_temperature.faultCount() +
         state_.pid_humidity.faultCount() + state_.pid_co2.faultCount() +
         state_.pid_o2.faultCount();
}
