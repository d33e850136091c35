/*
 * *****************************************************************************
 * MISSION RUN
 * *****************************************************************************
 * Discrete time-stepped loop over a caller-owned set of domes:
 * - Every dome ticks once per step against the same ambient conditions
 * - The coordinator runs on its own cadence after all domes ticked
 * - A stop request is honoured between ticks, never inside one
 * - A dome in SHUTDOWN is a dome-level failure; the run goes on
 * - A dome whose tick is rejected stalls: it leaves the lockstep set and is
 *   reported failed, the others go on
 * *****************************************************************************
 */

#pragma once

#include "ambient_schedule.h"
#include "dome_coordinator.h"
#include "dome_types.h"

#include <atomic>
#include <functional>
#include <stdint.h>
#include <string>
#include <vector>

enum RunStatus {
  RUN_OK,
  RUN_FAILED                ///< The run itself could not proceed
};

const char *run_status_name(RunStatus status);

struct DomeOutcome {
  std::string id;
  bool operational;         ///< false once the dome reached SHUTDOWN or stalled
  bool stalled;             ///< A tick was rejected, dome left the run
  uint32_t rejected_ticks;
  double time_s;            ///< Dome clock at the end of the run
  Mode final_mode;
  SensorReading final_reading;
  EnergyLedger ledger;
  size_t emergency_events;
  uint32_t emergency_entries;
  uint32_t faults;
};

struct RunSummary {
  RunStatus status;
  std::string error;        ///< Why the run failed (status RUN_FAILED)
  bool stopped;             ///< Ended early on request
  double simulated_s;
  uint64_t ticks;
  uint32_t coordinator_passes;
  uint32_t transfers;
  uint32_t declined;
  std::vector<DomeOutcome> domes;

  size_t shutdownCount() const;
  size_t stalledCount() const;
  size_t failedCount() const;
};

class MissionRun {
public:
  /**
   * @brief Called before every step with the run time and the dome set
   *
   * Used by scenarios to inject disturbances and operator requests.
   */
  typedef std::function<void(double timeS, DomeSet &domes)> StepHook;

  MissionRun();
  explicit MissionRun(const AmbientSchedule &ambient);

  void setStepHook(const StepHook &hook) { hook_ = hook; }

  /**
   * @brief Advance all domes from their current time for durationS
   * @param dtS Step length in seconds
   * @return Summary; status RUN_FAILED when the run could not start or every
   *         dome stalled
   */
  RunSummary run(DomeSet &domes, DomeCoordinator &coordinator,
                 double durationS, float dtS);

  /**
   * @brief Ask the running loop to stop before its next step
   *
   * The request is cleared when the next run() starts.
   */
  void requestStop() { stop_.store(true); }
  bool stopRequested() const { return stop_.load(); }

private:
  RunSummary failed(const std::string &why) const;

  AmbientSchedule ambient_;
  StepHook hook_;
  std::atomic<bool> stop_;
};

/**
 * @brief Print a summary through the console, one line per dome
 */
void run_summary_print(const RunSummary &summary);
