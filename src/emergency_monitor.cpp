/*
 * *****************************************************************************
 * EMERGENCY MONITOR - IMPLEMENTATION
 * *****************************************************************************
 */

#include "emergency_monitor.h"
#include "config.h"
#include "console.h"

#include <cmath>
#include <stdio.h>

HazardThresholds hazard_thresholds_default() {
  using namespace Config::Hazard;
  HazardThresholds t;
  t.temp_min_c = TEMP_MIN_C;
  t.temp_max_c = TEMP_MAX_C;
  t.humidity_min_pct = RH_MIN_PCT;
  t.humidity_max_pct = RH_MAX_PCT;
  t.co2_toxic_ppm = CO2_TOXIC_PPM;
  t.o2_viability_pct = O2_VIABILITY_PCT;
  t.pressure_max_kpa = PRESSURE_MAX_KPA;
  t.co2_low_ppm = CO2_LOW_PPM;
  t.o2_fire_pct = O2_FIRE_PCT;
  return t;
}

bool hazard_predicate(HazardKind kind, const SensorReading &r,
                      const HazardThresholds &t, int *direction) {
  int dir = 0;
  switch (kind) {
  case HAZARD_OVERPRESSURE:
    if (r.pressure_kpa > t.pressure_max_kpa) dir = 1;
    break;
  case HAZARD_O2_DEFICIT:
    if (r.o2_pct < t.o2_viability_pct) dir = -1;
    break;
  case HAZARD_CO2_EXCESS:
    if (r.co2_ppm > t.co2_toxic_ppm) dir = 1;
    break;
  case HAZARD_TEMPERATURE_EXCURSION:
    if (r.temperature_c < t.temp_min_c) dir = -1;
    else if (r.temperature_c > t.temp_max_c) dir = 1;
    break;
  case HAZARD_HUMIDITY_EXCURSION:
    if (r.humidity_pct < t.humidity_min_pct) dir = -1;
    else if (r.humidity_pct > t.humidity_max_pct) dir = 1;
    break;
  default:
    break;
  }
  if (direction != nullptr) *direction = dir;
  return dir != 0;
}

EmergencyMonitor::EmergencyMonitor() : thresholds_(hazard_thresholds_default()) {
  for (int i = 0; i < HAZARD_KIND_COUNT; i++) {
    openIndex_[i] = -1;
    direction_[i] = 0;
  }
}

EmergencyMonitor::EmergencyMonitor(const HazardThresholds &thresholds)
    : thresholds_(thresholds) {
  for (int i = 0; i < HAZARD_KIND_COUNT; i++) {
    openIndex_[i] = -1;
    direction_[i] = 0;
  }
}

const char *EmergencyMonitor::describeAction(HazardKind kind, int direction) const {
  switch (kind) {
  case HAZARD_OVERPRESSURE:
    return "vent=max heater=0 injection=0";
  case HAZARD_O2_DEFICIT:
    return "vent=0 lighting=max";
  case HAZARD_CO2_EXCESS:
    return "scrub=max vent=max";
  case HAZARD_TEMPERATURE_EXCURSION:
    return direction < 0 ? "heater=max" : "heater=0 lighting=0";
  case HAZARD_HUMIDITY_EXCURSION:
    return direction < 0 ? "mister=max vent=0" : "mister=0 vent=max";
  default:
    return "none";
  }
}

int EmergencyMonitor::evaluate(const SensorReading &r, double timeS) {
  int opened = 0;

  for (int i = 0; i < HAZARD_KIND_COUNT; i++) {
    HazardKind kind = static_cast<HazardKind>(i);
    int dir = 0;
    bool active = hazard_predicate(kind, r, thresholds_, &dir);

    if (active) {
      int previous = direction_[i];
      direction_[i] = dir;
      if (openIndex_[i] >= 0 && dir != previous) {
        // Same episode, opposite side of the band: the action follows it
        EmergencyEvent &ev = log_[openIndex_[i]];
        ev.action = describeAction(kind, dir);
        console_printf("Emergency", "%s reversed at t=%.0f s -> %s",
                       hazard_name(kind), timeS, ev.action.c_str());
      }
      if (openIndex_[i] < 0) {
        EmergencyEvent ev;
        ev.time_s = timeS;
        ev.kind = kind;
        ev.trigger = r;
        ev.action = describeAction(kind, dir);
        ev.resolved = false;
        ev.resolved_at_s = 0.0;
        log_.push_back(ev);
        openIndex_[i] = static_cast<int>(log_.size()) - 1;
        opened++;
        console_printf("Emergency", "%s opened at t=%.0f s -> %s",
                       hazard_name(kind), timeS, ev.action.c_str());
      }
    } else if (openIndex_[i] >= 0) {
      EmergencyEvent &ev = log_[openIndex_[i]];
      ev.resolved = true;
      ev.resolved_at_s = timeS;
      openIndex_[i] = -1;
      direction_[i] = 0;
      console_printf("Emergency", "%s resolved at t=%.0f s (open %.0f s)",
                     hazard_name(kind), timeS, timeS - ev.time_s);
    }
  }
  return opened;
}

bool EmergencyMonitor::anyOpen() const {
  for (int i = 0; i < HAZARD_KIND_COUNT; i++) {
    if (openIndex_[i] >= 0) return true;
  }
  return false;
}

bool EmergencyMonitor::isOpen(HazardKind kind) const {
  if (kind < 0 || kind >= HAZARD_KIND_COUNT) return false;
  return openIndex_[kind] >= 0;
}

ActuatorCommand EmergencyMonitor::applyCorrectiveActions(const ActuatorCommand &pid) const {
  ActuatorCommand cmd = pid;

  // Lowest priority first so higher-priority hazards overwrite shared channels
  for (int i = HAZARD_KIND_COUNT - 1; i >= 0; i--) {
    if (openIndex_[i] < 0) continue;

    switch (static_cast<HazardKind>(i)) {
    case HAZARD_OVERPRESSURE:
      cmd.vent = 1.0f;
      cmd.heater = 0.0f;
      if (cmd.co2_rate > 0.0f) cmd.co2_rate = 0.0f;
      break;
    case HAZARD_O2_DEFICIT:
      cmd.vent = 0.0f;
      cmd.lighting = 1.0f;
      break;
    case HAZARD_CO2_EXCESS:
      cmd.co2_rate = -1.0f;
      cmd.vent = 1.0f;
      break;
    case HAZARD_TEMPERATURE_EXCURSION:
      if (direction_[i] < 0) {
        cmd.heater = 1.0f;
      } else {
        cmd.heater = 0.0f;
        cmd.lighting = 0.0f;
      }
      break;
    case HAZARD_HUMIDITY_EXCURSION:
      if (direction_[i] < 0) {
        cmd.mister = 1.0f;
        cmd.vent = 0.0f;
      } else {
        cmd.mister = 0.0f;
        cmd.vent = 1.0f;
      }
      break;
    default:
      break;
    }
  }
  return cmd;
}

static void raiseAlert(AlertLevel level, const char *msg, AlertLevel &worst,
                       std::vector<std::string> *messages) {
  if (level > worst) worst = level;
  if (messages != nullptr) {
    messages->push_back(std::string(alert_level_name(level)) + ": " + msg);
  }
}

AlertLevel EmergencyMonitor::gradeAlerts(const SensorReading &r,
                                         const Setpoint &sp,
                                         const SetpointTolerance &tol,
                                         std::vector<std::string> *messages) const {
  AlertLevel worst = ALERT_NORMAL;
  char msg[96];

  float tempError = std::fabs(r.temperature_c - sp.temperature_c);
  if (tempError > tol.temperature_c * 3.0f) {
    snprintf(msg, sizeof(msg), "temperature %.1f C critically out of range",
             r.temperature_c);
    raiseAlert(ALERT_CRITICAL, msg, worst, messages);
  } else if (tempError > tol.temperature_c * 2.0f) {
    snprintf(msg, sizeof(msg), "temperature %.1f C outside tolerance",
             r.temperature_c);
    raiseAlert(ALERT_WARNING, msg, worst, messages);
  }

  if (std::fabs(r.humidity_pct - sp.humidity_pct) > tol.humidity_pct * 2.0f) {
    snprintf(msg, sizeof(msg), "humidity %.1f %% outside tolerance",
             r.humidity_pct);
    raiseAlert(ALERT_WARNING, msg, worst, messages);
  }

  if (r.co2_ppm < thresholds_.co2_low_ppm) {
    snprintf(msg, sizeof(msg), "CO2 %.0f ppm too low for plant growth", r.co2_ppm);
    raiseAlert(ALERT_WARNING, msg, worst, messages);
  }

  if (r.o2_pct > thresholds_.o2_fire_pct) {
    snprintf(msg, sizeof(msg), "O2 %.1f %% fire hazard", r.o2_pct);
    raiseAlert(ALERT_CRITICAL, msg, worst, messages);
  }

  return worst;
}
