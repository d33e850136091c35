/*
 * *****************************************************************************
 * MODE STATE MACHINE
 * *****************************************************************************
 * Governs which setpoint profile and which safety behaviour are active.
 *
 *   STARTUP --(stable for startup_dwell_s)--> IDLE
 *   IDLE <-> GROWING <-> MAINTENANCE          (operator, also IDLE<->MAINT)
 *   any --(hazard open)--> EMERGENCY
 *   EMERGENCY --(clear for cooldown_s)--> IDLE
 *   EMERGENCY --(escalation or unresolved)--> SHUTDOWN   (terminal)
 *
 * A trigger is a tick on which a hazard opens while none was open on the
 * previous tick: a fresh emergency, or a re-trigger during cooldown.
 * *****************************************************************************
 */

#pragma once

#include "dome_types.h"

#include <deque>
#include <stdint.h>
#include <string>
#include <vector>

struct ModePolicy {
  float startup_dwell_s;
  float cooldown_s;
  uint32_t escalation_count;        ///< Triggers within the window -> SHUTDOWN
  float escalation_window_s;
  float emergency_max_duration_s;   ///< Hazard open this long -> SHUTDOWN
};

ModePolicy mode_policy_default();

struct ModeTransition {
  double time_s;
  Mode from;
  Mode to;
  std::string reason;
};

class ModeStateMachine {
public:
  ModeStateMachine();
  explicit ModeStateMachine(const ModePolicy &policy);

  Mode mode() const { return mode_; }

  /**
   * @brief Operator-driven transition between IDLE, GROWING and MAINTENANCE
   * @param target Requested mode
   * @param substrateReady Whether GROWING setpoints may be selected yet
   * @param timeS Simulation time of the request
   * @param why Optional, receives the rejection reason
   * @return true when the mode is (now) the target
   */
  bool requestMode(Mode target, bool substrateReady, double timeS,
                   std::string *why);

  /**
   * @brief Advance the automatic transitions by one tick
   * @param timeS Simulation time of the tick
   * @param hazardOpen At least one hazard is open after evaluation
   * @param stabilized Readings within tolerance of the startup profile
   * @return true when the mode changed on this tick (possibly twice, see
   *         transitions())
   */
  bool update(double timeS, bool hazardOpen, bool stabilized);

  const std::vector<ModeTransition> &transitions() const { return transitions_; }
  uint32_t emergencyEntries() const { return emergencyEntries_; }
  size_t recentTriggers() const { return triggers_.size(); }
  const ModePolicy &policy() const { return policy_; }

private:
  void transition(Mode to, double timeS, const std::string &reason);
  void pruneTriggers(double timeS);

  ModePolicy policy_;
  Mode mode_;
  std::vector<ModeTransition> transitions_;
  std::deque<double> triggers_;

  bool hazardWasOpen_;
  double hazardOpenSince_;
  double clearSince_;       // < 0 while not clear
  double stableSince_;      // < 0 while not stable
  uint32_t emergencyEntries_;
};
