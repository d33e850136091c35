/*
 * *****************************************************************************
 * PID CONTROLLER
 * *****************************************************************************
 * Discrete proportional-integral-derivative regulator, one instance per
 * controlled variable:
 * - Integral clamped to +/- integral_limit (anti-windup)
 * - Output clamped to [out_min, out_max]
 * - dt <= 0 or non-finite input: neutral output, fault counted and logged
 * *****************************************************************************
 */

#pragma once

#include <stdint.h>
#include <string>

struct PidGains {
  float kp;
  float ki;
  float kd;
  float out_min;
  float out_max;
  float integral_limit;     ///< |integral| bound (error x seconds)
};

/**
 * @brief Internal state owned by one controller
 *
 * Only reset() clears it; nothing resets it implicitly.
 */
struct PidState {
  float integral;
  float previous_error;
  bool windup;              ///< Integral currently held at its clamp
  uint32_t faults;
};

class PidController {
public:
  PidController();
  PidController(const std::string &name, const PidGains &gains);

  /**
   * @brief Compute the control action
   * @param setpoint Desired value
   * @param measured Current measured value
   * @param dtS Elapsed time in seconds (must be > 0)
   * @return Output in [out_min, out_max]; neutralOutput() on fault
   */
  float update(float setpoint, float measured, float dtS);

  /**
   * @brief Clear integral and derivative memory (fault count is kept)
   */
  void reset();

  void setGains(const PidGains &gains);
  const PidGains &gains() const { return gains_; }
  const PidState &state() const { return state_; }
  const std::string &name() const { return name_; }

  /**
   * @brief Output returned on fault: 0 clamped into the output range
   */
  float neutralOutput() const;

  uint32_t faultCount() const { return state_.faults; }

  /**
   * @brief Individual terms of the last successful update, for diagnosis
   */
  void getTerms(float &p, float &i, float &d) const;

private:
  std::string name_;
  PidGains gains_;
  PidState state_;
  float pTerm_;
  float iTerm_;
  float dTerm_;
};
