/*
 * *****************************************************************************
 * EMERGENCY MONITOR
 * *****************************************************************************
 * Evaluated every tick before PID computation:
 * - One predicate per HazardKind over the current reading
 * - An EmergencyEvent opens the first tick a predicate holds and closes
 *   the first tick it no longer holds; the log is append-only
 * - While a hazard is open its fixed corrective action overrides the PID
 *   output on the channels it names; on conflicts the higher-priority
 *   hazard wins (HazardKind order)
 * - Advisory alerts grade readings against the active setpoint without
 *   affecting the mode
 * *****************************************************************************
 */

#pragma once

#include "dome_types.h"
#include "setpoint_profile.h"

#include <string>
#include <vector>

struct HazardThresholds {
  float temp_min_c;
  float temp_max_c;
  float humidity_min_pct;
  float humidity_max_pct;
  float co2_toxic_ppm;
  float o2_viability_pct;
  float pressure_max_kpa;

  // Advisory only
  float co2_low_ppm;
  float o2_fire_pct;
};

HazardThresholds hazard_thresholds_default();

/**
 * @brief Evaluate a single hazard predicate
 * @param direction Optional, receives -1 (below band), +1 (above) or 0
 * @return true when the hazard condition holds
 */
bool hazard_predicate(HazardKind kind, const SensorReading &r,
                      const HazardThresholds &t, int *direction);

class EmergencyMonitor {
public:
  EmergencyMonitor();
  explicit EmergencyMonitor(const HazardThresholds &thresholds);

  /**
   * @brief Evaluate all predicates, open and close events
   * @param r Reading of the current tick
   * @param timeS Simulation time of the tick
   * @return Number of events opened by this evaluation
   */
  int evaluate(const SensorReading &r, double timeS);

  bool anyOpen() const;
  bool isOpen(HazardKind kind) const;

  /**
   * @brief Overlay the corrective actions of all open hazards
   * @param pid Command computed by the regulation loops
   * @return Command with hazard channels overridden
   */
  ActuatorCommand applyCorrectiveActions(const ActuatorCommand &pid) const;

  /**
   * @brief Grade the reading against the active setpoint
   * @param messages Optional, receives one line per raised alert
   * @return Worst alert level found
   */
  AlertLevel gradeAlerts(const SensorReading &r, const Setpoint &sp,
                         const SetpointTolerance &tol,
                         std::vector<std::string> *messages) const;

  const std::vector<EmergencyEvent> &log() const { return log_; }
  const HazardThresholds &thresholds() const { return thresholds_; }

private:
  const char *describeAction(HazardKind kind, int direction) const;

  HazardThresholds thresholds_;
  std::vector<EmergencyEvent> log_;
  int openIndex_[HAZARD_KIND_COUNT];  // Index into log_, -1 when closed
  int direction_[HAZARD_KIND_COUNT];
};
