/*
 * *****************************************************************************
 * DOME CONTROLLER - PUBLIC API
 * *****************************************************************************
 * Closed-loop control of one dome. Each tick:
 * - Evaluates hazard predicates on the current reading
 * - Advances the mode state machine and selects the active setpoint
 * - Runs the temperature, humidity, CO2 and O2 loops plus the lighting
 *   schedule, circulation fan and nutrient dosing
 * - Overlays the corrective actions of open hazards, clamps the command
 * - Advances the physical model and books the energy drawn
 *
 * A tick is all or nothing: it works on a copy of the DomeState and only
 * commits it when every step succeeded. A rejected tick leaves the dome at
 * its pre-tick state and is counted in faultCount().
 *
 * In SHUTDOWN the dome holds every actuator off; physics and energy
 * accounting keep running, control and hazard evaluation do not.
 * *****************************************************************************
 */

#pragma once

#include "dome_config.h"
#include "dome_physics.h"
#include "dome_types.h"
#include "emergency_monitor.h"
#include "energy_accountant.h"
#include "mode_state_machine.h"
#include "pid_controller.h"
#include "telemetry.h"

#include <stdint.h>
#include <string>
#include <vector>

// =============================================================================
// DATA STRUCTURES
// =============================================================================

/**
 * @brief Everything a tick mutates, owned by exactly one controller
 */
struct DomeState {
  double time_s;
  DomePhysics physics;
  PidController pid_temperature;
  PidController pid_humidity;
  PidController pid_co2;
  PidController pid_o2;
  ModeStateMachine modes;
  EmergencyMonitor monitor;
  EnergyAccountant energy;
  ActuatorCommand command;
  Setpoint setpoint;
  AlertLevel alert;
  std::vector<std::string> alert_messages;
};

// =============================================================================
// CONTROLLER
// =============================================================================

class DomeController {
public:
  DomeController();

  /**
   * @brief Validate the configuration and create a dome in STARTUP
   * @param error Optional, receives the configuration problem
   * @return false (dome stays uninitialized) on a configuration error
   */
  bool init(const DomeConfig &config, std::string *error = nullptr);

  bool isInitialized() const { return initialized_; }

  /**
   * @brief Advance the dome by one control tick
   * @param dtS Tick length in seconds (> 0)
   * @param ambient Exterior boundary for this tick
   * @return true when the tick was committed
   */
  bool tick(float dtS, const AmbientConditions &ambient);

  /**
   * @brief Operator transition between IDLE, GROWING and MAINTENANCE
   * @param why Optional, receives the rejection reason
   */
  bool requestMode(Mode target, std::string *why = nullptr);

  /**
   * @brief Mission day from which GROWING may be selected
   */
  void setSubstrateReadyDay(float day);
  void setNutrientInput(const NutrientInput &input);

  /**
   * @brief Replace the profile of a mode while running
   *
   * A profile outside the survivable envelope is accepted with a warning;
   * non-finite values are refused.
   */
  bool setProfile(Mode mode, const Setpoint &setpoint);

  /**
   * @brief Overwrite the physical state (disturbance injection)
   */
  bool setSensorReading(const SensorReading &reading);

  /**
   * @brief Apply a coordinator O2 transfer (percentage points)
   */
  bool applyO2Delta(float deltaPct);

  // --- State access ---
  const std::string &id() const { return config_.dome_id; }
  Mode mode() const { return state_.modes.mode(); }
  double timeS() const { return state_.time_s; }
  float missionDay() const;
  const SensorReading &reading() const { return state_.physics.reading(); }
  const ActuatorCommand &command() const { return state_.command; }
  const Setpoint &setpoint() const { return state_.setpoint; }
  const EnergyLedger &ledger() const { return state_.energy.ledger(); }
  const std::vector<EmergencyEvent> &emergencyLog() const { return state_.monitor.log(); }
  const std::vector<ModeTransition> &transitions() const { return state_.modes.transitions(); }
  uint32_t emergencyEntries() const { return state_.modes.emergencyEntries(); }
  AlertLevel alertLevel() const { return state_.alert; }
  const std::vector<std::string> &alertMessages() const { return state_.alert_messages; }
  const TelemetryBuffer &telemetry() const { return telemetry_; }
  const DomeState &state() const { return state_; }
  const DomeConfig &config() const { return config_; }

  /**
   * @brief Rejected ticks plus faults counted by the regulation loops
   */
  uint32_t faultCount() const;

private:
  void computeCommand(DomeState &s, const SensorReading &r, float dtS) const;
  void recordFault(const char *what);

  bool initialized_;
  DomeConfig config_;
  DomeState state_;
  TelemetryBuffer telemetry_;
  NutrientInput nutrient_;
  float substrateReadyDay_;
  uint32_t tickFaults_;
};

/**
 * @brief Supplemental lighting fraction of the photoperiod schedule
 * @param hourOfDay Hour within the 24 h cycle, lights on from hour 0
 * @param photoperiodH Hours of light per cycle
 */
float photoperiod_lighting(float hourOfDay, float photoperiodH);
