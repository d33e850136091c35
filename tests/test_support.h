/*
 * *****************************************************************************
 * TEST SUPPORT
 * *****************************************************************************
 * Console capture and small fixtures shared by the test files.
 * *****************************************************************************
 */

#pragma once

#include "config.h"
#include "console.h"
#include "dome_config.h"
#include "dome_controller.h"
#include "dome_types.h"

#include <gtest/gtest.h>
#include <cmath>
#include <iostream>
#include <ostream>
#include <sstream>
#include <string>

// Redirects console output into a string for the lifetime of the object
class ConsoleCapture {
public:
  ConsoleCapture() : previous_(console_stream()) { console_attach(&buffer_); }
  ~ConsoleCapture() { console_attach(previous_); }

  std::string text() const { return buffer_.str(); }
  bool contains(const std::string &needle) const {
    return buffer_.str().find(needle) != std::string::npos;
  }

private:
  std::ostream *previous_;
  std::ostringstream buffer_;
};

inline AmbientConditions ambient_at(float exteriorC) {
  AmbientConditions a;
  a.exterior_c = exteriorC;
  a.daylight = 0.0f;
  a.o2_pct = 0.0f;
  a.co2_ppm = 0.0f;
  a.humidity_pct = 0.0f;
  a.pressure_kpa = 0.0f;
  return a;
}

inline SensorReading nominal_reading() {
  SensorReading r;
  r.temperature_c = 20.0f;
  r.humidity_pct = 55.0f;
  r.co2_ppm = 800.0f;
  r.o2_pct = 20.9f;
  r.light = 0.0f;
  r.substrate_moisture = 0.4f;
  r.pressure_kpa = 100.6f;
  return r;
}

// Runs a dome for durationS with 1 s ticks under a constant exterior
inline void run_for(DomeController &dome, double durationS, float exteriorC = 0.0f) {
  AmbientConditions a = ambient_at(exteriorC);
  double end = dome.timeS() + durationS;
  while (dome.timeS() < end - 1e-6) {
    ASSERT_TRUE(dome.tick(1.0f, a));
  }
}

// A dome that has already settled from STARTUP into IDLE
inline void boot_to_idle(DomeController &dome, const std::string &id) {
  ASSERT_TRUE(dome.init(dome_config_default(id)));
  run_for(dome, 1200.0);
  ASSERT_EQ(dome.mode(), MODE_IDLE);
}
