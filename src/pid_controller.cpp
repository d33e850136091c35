/*
 * *****************************************************************************
 * PID CONTROLLER - IMPLEMENTATION
 * *****************************************************************************
 */

#include "pid_controller.h"
#include "console.h"

#include <cmath>

static float clampf(float v, float lo, float hi) {
  if (v < lo) return lo;
  if (v > hi) return hi;
  return v;
}

static PidState zeroState() {
  PidState s;
  s.integral = 0.0f;
  s.previous_error = 0.0f;
  s.windup = false;
  s.faults = 0;
  return s;
}

PidController::PidController()
    : name_("pid"), state_(zeroState()), pTerm_(0), iTerm_(0), dTerm_(0) {
  gains_.kp = 0.0f;
  gains_.ki = 0.0f;
  gains_.kd = 0.0f;
  gains_.out_min = 0.0f;
  gains_.out_max = 1.0f;
  gains_.integral_limit = 0.0f;
}

PidController::PidController(const std::string &name, const PidGains &gains)
    : name_(name), gains_(gains), state_(zeroState()), pTerm_(0), iTerm_(0),
      dTerm_(0) {}

float PidController::neutralOutput() const {
  return clampf(0.0f, gains_.out_min, gains_.out_max);
}

float PidController::update(float setpoint, float measured, float dtS) {
  if (!(dtS > 0.0f) || !std::isfinite(dtS)) {
    state_.faults++;
    console_printf("PID", "[%s] fault: dt=%.3f s, holding neutral output %.3f",
                   name_.c_str(), dtS, neutralOutput());
    return neutralOutput();
  }
  if (!std::isfinite(setpoint) || !std::isfinite(measured)) {
    state_.faults++;
    console_printf("PID", "[%s] fault: non-finite input (sp=%f, pv=%f)",
                   name_.c_str(), setpoint, measured);
    return neutralOutput();
  }

  float error = setpoint - measured;

  // Integral with anti-windup clamp
  float integral = state_.integral + error * dtS;
  float limit = gains_.integral_limit;
  state_.windup = false;
  if (integral > limit) {
    integral = limit;
    state_.windup = true;
  } else if (integral < -limit) {
    integral = -limit;
    state_.windup = true;
  }
  state_.integral = integral;

  float derivative = (error - state_.previous_error) / dtS;
  state_.previous_error = error;

  pTerm_ = gains_.kp * error;
  iTerm_ = gains_.ki * state_.integral;
  dTerm_ = gains_.kd * derivative;

  return clampf(pTerm_ + iTerm_ + dTerm_, gains_.out_min, gains_.out_max);
}

void PidController::reset() {
  uint32_t faults = state_.faults;
  state_ = zeroState();
  state_.faults = faults;
  pTerm_ = 0;
  iTerm_ = 0;
  dTerm_ = 0;
}

void PidController::setGains(const PidGains &gains) {
  gains_ = gains;
}

void PidController::getTerms(float &p, float &i, float &d) const {
  p = pTerm_;
  i = iTerm_;
  d = dTerm_;
}
