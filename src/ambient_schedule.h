/*
 * *****************************************************************************
 * AMBIENT SCHEDULE
 * *****************************************************************************
 * Astronomical input: exterior temperature and natural light over the lunar
 * day/night cycle, plus the (vacuum) gas boundary the vents exchange with.
 * *****************************************************************************
 */

#pragma once

#include "dome_types.h"

struct AmbientProfile {
  float exterior_max_c;
  float exterior_min_c;
  float day_h;
  float night_h;
  float o2_pct;
  float co2_ppm;
  float humidity_pct;
  float pressure_kpa;
};

AmbientProfile ambient_profile_default();

class AmbientSchedule {
public:
  AmbientSchedule();
  explicit AmbientSchedule(const AmbientProfile &profile);

  /**
   * @brief Fixed conditions regardless of time (bench tests, scenarios)
   */
  static AmbientSchedule constant(const AmbientConditions &conditions);

  /**
   * @brief Conditions at a simulation time
   *
   * Day phase: exterior rises from min to max and back following a half
   * sine, daylight follows the same curve. Night phase: exterior at min,
   * no daylight. Time 0 is lunar sunrise.
   */
  AmbientConditions at(double timeS) const;

  const AmbientProfile &profile() const { return profile_; }

private:
  AmbientProfile profile_;
  bool fixed_;
  AmbientConditions fixedConditions_;
};
