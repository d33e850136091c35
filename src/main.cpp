/*
 * *****************************************************************************
 * DOME SIMULATION
 * *****************************************************************************
 * Closed-loop control of temperature, relative humidity, CO₂ and O₂ in two
 * sealed growth domes under lunar ambient conditions, with O₂ sharing
 * between the domes.
 *
 * Scenario (48 h):
 * - Both domes boot in STARTUP and settle into IDLE
 * - Operator selects GROWING once the substrate is ready
 * - 06:00  CO₂ leak in dome-alpha (5000 ppm)
 * - 10:00  O₂ loss in dome-beta (17.5 %), relieved from dome-alpha
 * *****************************************************************************
 */

#include "console.h"
#include "dome_config.h"
#include "dome_controller.h"
#include "dome_coordinator.h"
#include "mission_run.h"

#include <csignal>
#include <string>

// Configuration
static constexpr double SCENARIO_DURATION_S = 48.0 * 3600.0;
static constexpr float SUBSTRATE_READY_DAY = 0.04f;         // ~1 h after boot
static constexpr double CO2_LEAK_AT_S = 6.0 * 3600.0;
static constexpr float CO2_LEAK_PPM = 5000.0f;
static constexpr double O2_LOSS_AT_S = 10.0 * 3600.0;
static constexpr float O2_LOSS_PCT = 17.5f;
static constexpr float ALPHA_PHOTO_O2_GAIN_PCT = 2.4f;      // Dense crop

// Domes and coordination (caller-owned, no global registry in the core)
static DomeController g_alpha;
static DomeController g_beta;
static DomeSet g_domes;
static DomeCoordinator g_coordinator;
static MissionRun g_mission;

// Scenario state
static bool g_co2LeakDone = false;
static bool g_o2LossDone = false;

// Forward declarations
static bool setup();
static int loop();
static bool initDome(DomeController &dome, const DomeConfig &cfg);
static void scenarioStep(double timeS, DomeSet &domes);
static void onSignal(int sig);

int main() {
  std::signal(SIGINT, onSignal);
  if (!setup()) {
    return 1;
  }
  return loop();
}

// ---------- Setup / Loop ----------
static bool setup() {
  console_printf("Boot", "Booting dome simulation...");

  DomeConfig alpha = dome_config_default("dome-alpha");
  std::string error;
  if (!dome_config_set_option(alpha, "physics.photo_o2_gain_pct",
                              ALPHA_PHOTO_O2_GAIN_PCT, &error)) {
    console_printf("Boot", "option rejected: %s", error.c_str());
    return false;
  }
  DomeConfig beta = dome_config_default("dome-beta");

  if (!initDome(g_alpha, alpha) || !initDome(g_beta, beta)) {
    return false;
  }
  g_domes.push_back(&g_alpha);
  g_domes.push_back(&g_beta);

  CoordinatorConfig coordinator = coordinator_config_default();
  if (!coordinator_config_validate(coordinator, &error)) {
    console_printf("Boot", "coordinator configuration rejected: %s", error.c_str());
    return false;
  }
  g_coordinator = DomeCoordinator(coordinator);
  g_mission.setStepHook(scenarioStep);

  console_printf("Boot", "EXIT SETUP");
  return true;
}

static int loop() {
  RunSummary summary = g_mission.run(g_domes, g_coordinator, SCENARIO_DURATION_S,
                                     g_alpha.config().tick_interval_s);
  run_summary_print(summary);
  return summary.status == RUN_OK ? 0 : 1;
}

// ---------- Domes ----------
static bool initDome(DomeController &dome, const DomeConfig &cfg) {
  std::string error;
  if (!dome.init(cfg, &error)) {
    console_printf("Boot", "%s not started: %s", cfg.dome_id.c_str(), error.c_str());
    return false;
  }
  dome.setSubstrateReadyDay(SUBSTRATE_READY_DAY);

  NutrientInput nutrient;
  nutrient.valid = true;
  nutrient.concentration_ppm = 120.0f;
  nutrient.ph = 6.2f;
  dome.setNutrientInput(nutrient);
  return true;
}

// ---------- Scenario ----------
static void scenarioStep(double timeS, DomeSet &domes) {
  // Operator keeps every idle dome growing once the substrate is ready
  for (size_t i = 0; i < domes.size(); i++) {
    DomeController &dome = *domes[i];
    if (dome.mode() == MODE_IDLE && dome.missionDay() >= SUBSTRATE_READY_DAY) {
      std::string why;
      if (!dome.requestMode(MODE_GROWING, &why)) {
        console_printf("Scenario", "%s stays idle: %s", dome.id().c_str(), why.c_str());
      }
    }
  }

  if (!g_co2LeakDone && timeS >= CO2_LEAK_AT_S) {
    g_co2LeakDone = true;
    SensorReading r = g_alpha.reading();
    r.co2_ppm = CO2_LEAK_PPM;
    if (!g_alpha.setSensorReading(r)) return;
    console_printf("Scenario", "CO2 leak in %s: %.0f ppm", g_alpha.id().c_str(),
                   CO2_LEAK_PPM);
  }

  if (!g_o2LossDone && timeS >= O2_LOSS_AT_S) {
    g_o2LossDone = true;
    SensorReading r = g_beta.reading();
    r.o2_pct = O2_LOSS_PCT;
    if (!g_beta.setSensorReading(r)) return;
    console_printf("Scenario", "O2 loss in %s: %.1f %%", g_beta.id().c_str(),
                   O2_LOSS_PCT);
  }
}

static void onSignal(int sig) {
  (void)sig;
  g_mission.requestStop();
}
