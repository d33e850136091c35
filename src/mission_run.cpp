/*
 * *****************************************************************************
 * MISSION RUN - IMPLEMENTATION
 * *****************************************************************************
 */

#include "mission_run.h"
#include "console.h"

#include <algorithm>
#include <cmath>
#include <string>

const char *run_status_name(RunStatus status) {
  switch (status) {
  case RUN_OK:
    return "OK";
  case RUN_FAILED:
    return "FAILED";
  default:
    return "UNKNOWN";
  }
}

size_t RunSummary::shutdownCount() const {
  size_t n = 0;
  for (size_t i = 0; i < domes.size(); i++) {
    if (domes[i].final_mode == MODE_SHUTDOWN) n++;
  }
  return n;
}

size_t RunSummary::stalledCount() const {
  size_t n = 0;
  for (size_t i = 0; i < domes.size(); i++) {
    if (domes[i].stalled) n++;
  }
  return n;
}

size_t RunSummary::failedCount() const {
  size_t n = 0;
  for (size_t i = 0; i < domes.size(); i++) {
    if (!domes[i].operational) n++;
  }
  return n;
}

MissionRun::MissionRun() : ambient_(), stop_(false) {}

MissionRun::MissionRun(const AmbientSchedule &ambient)
    : ambient_(ambient), stop_(false) {}

static RunSummary emptySummary() {
  RunSummary s;
  s.status = RUN_OK;
  s.stopped = false;
  s.simulated_s = 0.0;
  s.ticks = 0;
  s.coordinator_passes = 0;
  s.transfers = 0;
  s.declined = 0;
  return s;
}

RunSummary MissionRun::failed(const std::string &why) const {
  console_printf("Mission", "run failed: %s", why.c_str());
  RunSummary s = emptySummary();
  s.status = RUN_FAILED;
  s.error = why;
  return s;
}

RunSummary MissionRun::run(DomeSet &domes, DomeCoordinator &coordinator,
                           double durationS, float dtS) {
  // --- Preconditions ---
  if (domes.empty()) {
    return failed("no domes to run");
  }
  for (size_t i = 0; i < domes.size(); i++) {
    if (domes[i] == nullptr || !domes[i]->isInitialized()) {
      return failed("dome " + std::to_string(i) + " is not initialized");
    }
  }
  if (!(durationS > 0.0) || !std::isfinite(durationS)) {
    return failed("duration must be positive");
  }
  if (!(dtS > 0.0f) || !std::isfinite(dtS)) {
    return failed("tick length must be positive");
  }

  stop_.store(false);

  RunSummary summary = emptySummary();
  uint32_t passesBefore = coordinator.passes();
  uint32_t transfersBefore = coordinator.transfersApplied();
  uint32_t declinedBefore = coordinator.declinedCount();

  const double start = domes.front()->timeS();
  const double end = start + durationS;
  double now = start;

  // Domes still in lockstep; a rejected tick removes a dome from it
  DomeSet active = domes;
  std::vector<uint32_t> rejected(domes.size(), 0);

  console_printf("Mission", "running %u domes for %.1f h, dt=%.1f s",
                 static_cast<unsigned>(domes.size()), durationS / 3600.0, dtS);

  // --- Main loop ---
  while (now < end - 1e-9) {
    if (stop_.load()) {
      summary.stopped = true;
      console_printf("Mission", "stop requested at t=%.0f s", now);
      break;
    }
    if (hook_) {
      hook_(now, domes);
    }

    float step = static_cast<float>(std::min(static_cast<double>(dtS), end - now));
    AmbientConditions ambient = ambient_.at(now);
    DomeSet ticked;
    ticked.reserve(active.size());
    for (size_t i = 0; i < domes.size(); i++) {
      if (std::find(active.begin(), active.end(), domes[i]) == active.end()) {
        continue;
      }
      if (domes[i]->tick(step, ambient)) {
        ticked.push_back(domes[i]);
        continue;
      }
      rejected[i]++;
      console_printf("Mission", "[%s] tick rejected at t=%.0f s, dome stalled",
                     domes[i]->id().c_str(), now);
    }
    active.swap(ticked);
    now += step;
    summary.ticks++;

    if (active.empty()) {
      summary.status = RUN_FAILED;
      summary.error = "every dome stalled";
      console_printf("Mission", "run failed: %s", summary.error.c_str());
      break;
    }

    // Barrier: every active dome finished this tick
    if (coordinator.due(now)) {
      coordinator.rebalance(now, active);
    }
  }

  // --- Outcome ---
  summary.simulated_s = now - start;
  summary.coordinator_passes = coordinator.passes() - passesBefore;
  summary.transfers = coordinator.transfersApplied() - transfersBefore;
  summary.declined = coordinator.declinedCount() - declinedBefore;

  for (size_t i = 0; i < domes.size(); i++) {
    const DomeController &d = *domes[i];
    DomeOutcome out;
    out.id = d.id();
    out.final_mode = d.mode();
    out.rejected_ticks = rejected[i];
    out.stalled = rejected[i] > 0;
    out.operational = d.mode() != MODE_SHUTDOWN && !out.stalled;
    out.time_s = d.timeS();
    out.final_reading = d.reading();
    out.ledger = d.ledger();
    out.emergency_events = d.emergencyLog().size();
    out.emergency_entries = d.emergencyEntries();
    out.faults = d.faultCount();
    summary.domes.push_back(out);
  }
  return summary;
}

void run_summary_print(const RunSummary &summary) {
  console_printf("Summary", "status %s%s, %.1f h simulated, %llu ticks",
                 run_status_name(summary.status),
                 summary.stopped ? " (stopped)" : "", summary.simulated_s / 3600.0,
                 static_cast<unsigned long long>(summary.ticks));
  if (summary.status == RUN_FAILED) {
    console_printf("Summary", "error: %s", summary.error.c_str());
    if (summary.domes.empty()) return;
  }
  console_printf("Summary", "coordinator: %u passes, %u transfers, %u declined",
                 summary.coordinator_passes, summary.transfers, summary.declined);

  for (size_t i = 0; i < summary.domes.size(); i++) {
    const DomeOutcome &d = summary.domes[i];
    console_printf("Summary",
                   "[%s] %s%s in %s | T=%.1f C RH=%.0f %% CO2=%.0f ppm O2=%.2f %% | "
                   "%.2f kWh | %u emergencies, %u entries, %u faults",
                   d.id.c_str(), d.operational ? "operational" : "FAILED",
                   d.stalled ? " (stalled)" : "", mode_name(d.final_mode), d.final_reading.temperature_c,
                   d.final_reading.humidity_pct, d.final_reading.co2_ppm,
                   d.final_reading.o2_pct, d.ledger.total(),
                   static_cast<unsigned>(d.emergency_events), d.emergency_entries,
                   d.faults);
    for (int c = 0; c < ENERGY_CHANNEL_COUNT; c++) {
      console_printf("Summary", "[%s]   %-12s %8.3f kWh", d.id.c_str(),
                     energy_channel_name(static_cast<EnergyChannel>(c)),
                     d.ledger.kwh[c]);
    }
  }
  if (summary.shutdownCount() > 0) {
    console_printf("Summary", "%u of %u domes shut down (dome-level failure)",
                   static_cast<unsigned>(summary.shutdownCount()),
                   static_cast<unsigned>(summary.domes.size()));
  }
  if (summary.stalledCount() > 0) {
    console_printf("Summary", "%u of %u domes stalled on a rejected tick",
                   static_cast<unsigned>(summary.stalledCount()),
                   static_cast<unsigned>(summary.domes.size()));
  }
}
