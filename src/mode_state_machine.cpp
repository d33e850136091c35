/*
 * *****************************************************************************
 * MODE STATE MACHINE - IMPLEMENTATION
 * *****************************************************************************
 */

#include "mode_state_machine.h"
#include "config.h"
#include "console.h"

#include <stdio.h>

ModePolicy mode_policy_default() {
  ModePolicy p;
  p.startup_dwell_s = Config::STARTUP_DWELL_S;
  p.cooldown_s = Config::Hazard::COOLDOWN_S;
  p.escalation_count = Config::Hazard::ESCALATION_COUNT;
  p.escalation_window_s = Config::Hazard::ESCALATION_WINDOW_S;
  p.emergency_max_duration_s = Config::Hazard::EMERGENCY_MAX_DURATION_S;
  return p;
}

ModeStateMachine::ModeStateMachine()
    : policy_(mode_policy_default()), mode_(MODE_STARTUP),
      hazardWasOpen_(false), hazardOpenSince_(0.0), clearSince_(-1.0),
      stableSince_(-1.0), emergencyEntries_(0) {}

ModeStateMachine::ModeStateMachine(const ModePolicy &policy)
    : policy_(policy), mode_(MODE_STARTUP), hazardWasOpen_(false),
      hazardOpenSince_(0.0), clearSince_(-1.0), stableSince_(-1.0),
      emergencyEntries_(0) {}

static bool isOperatorMode(Mode m) {
  return m == MODE_IDLE || m == MODE_GROWING || m == MODE_MAINTENANCE;
}

void ModeStateMachine::transition(Mode to, double timeS, const std::string &reason) {
  ModeTransition t;
  t.time_s = timeS;
  t.from = mode_;
  t.to = to;
  t.reason = reason;
  transitions_.push_back(t);

  console_printf("Mode", "%s -> %s at t=%.0f s (%s)", mode_name(mode_),
                 mode_name(to), timeS, reason.c_str());

  mode_ = to;
  if (to == MODE_EMERGENCY) {
    emergencyEntries_++;
  }
  stableSince_ = -1.0;
}

void ModeStateMachine::pruneTriggers(double timeS) {
  while (!triggers_.empty() &&
         timeS - triggers_.front() > policy_.escalation_window_s) {
    triggers_.pop_front();
  }
}

bool ModeStateMachine::requestMode(Mode target, bool substrateReady,
                                   double timeS, std::string *why) {
  if (!isOperatorMode(target)) {
    if (why) *why = std::string("mode ") + mode_name(target) + " cannot be requested";
    return false;
  }
  if (!isOperatorMode(mode_)) {
    if (why) *why = std::string("operator transitions locked in ") + mode_name(mode_);
    return false;
  }
  if (target == MODE_GROWING && !substrateReady) {
    if (why) *why = "substrate not ready for GROWING";
    return false;
  }
  if (target == mode_) {
    return true;
  }

  transition(target, timeS, "operator request");
  return true;
}

bool ModeStateMachine::update(double timeS, bool hazardOpen, bool stabilized) {
  if (mode_ == MODE_SHUTDOWN) {
    return false;
  }

  Mode before = mode_;
  bool newEpisode = hazardOpen && !hazardWasOpen_;
  hazardWasOpen_ = hazardOpen;

  // --- Hazard present: force EMERGENCY, watch for escalation ---
  if (hazardOpen) {
    clearSince_ = -1.0;

    if (newEpisode) {
      hazardOpenSince_ = timeS;
      pruneTriggers(timeS);
      triggers_.push_back(timeS);

      if (triggers_.size() >= policy_.escalation_count) {
        // SHUTDOWN is only ever entered from EMERGENCY
        if (mode_ != MODE_EMERGENCY) {
          transition(MODE_EMERGENCY, timeS, "hazard open");
        }
        char reason[96];
        snprintf(reason, sizeof(reason), "%u triggers within %.0f s",
                 static_cast<unsigned>(triggers_.size()),
                 policy_.escalation_window_s);
        transition(MODE_SHUTDOWN, timeS, reason);
        return true;
      }
    }

    if (mode_ != MODE_EMERGENCY) {
      transition(MODE_EMERGENCY, timeS, "hazard open");
    } else if (timeS - hazardOpenSince_ >= policy_.emergency_max_duration_s) {
      transition(MODE_SHUTDOWN, timeS, "hazard unresolved");
    }
    return mode_ != before;
  }

  // --- No hazard ---
  switch (mode_) {
  case MODE_EMERGENCY:
    if (clearSince_ < 0.0) {
      clearSince_ = timeS;
    }
    if (timeS - clearSince_ >= policy_.cooldown_s) {
      clearSince_ = -1.0;
      transition(MODE_IDLE, timeS, "cooldown complete");
    }
    break;

  case MODE_STARTUP:
    if (!stabilized) {
      stableSince_ = -1.0;
    } else {
      if (stableSince_ < 0.0) {
        stableSince_ = timeS;
      }
      if (timeS - stableSince_ >= policy_.startup_dwell_s) {
        transition(MODE_IDLE, timeS, "readings stabilized");
      }
    }
    break;

  default:
    break;
  }

  return mode_ != before;
}
