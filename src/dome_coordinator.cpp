/*
 * *****************************************************************************
 * MULTI-DOME COORDINATOR - IMPLEMENTATION
 * *****************************************************************************
 */

#include "dome_coordinator.h"
#include "console.h"

#include <algorithm>
#include <stdio.h>

float TransferPlan::deltaSum() const {
  double sum = 0.0;
  for (size_t i = 0; i < deltas.size(); i++) {
    sum += deltas[i];
  }
  return static_cast<float>(sum);
}

DomeCoordinator::DomeCoordinator()
    : config_(coordinator_config_default()), nextDueS_(config_.interval_s),
      passes_(0), transfersApplied_(0), declined_(0) {}

DomeCoordinator::DomeCoordinator(const CoordinatorConfig &config)
    : config_(config), nextDueS_(config.interval_s), passes_(0),
      transfersApplied_(0), declined_(0) {}

static bool takesPart(const DomeController *dome) {
  return dome != nullptr && dome->isInitialized() &&
         dome->mode() != MODE_SHUTDOWN;
}

// A dome's own hazard threshold is honoured when stricter than the shared one
float DomeCoordinator::viabilityFor(const DomeController &dome) const {
  return std::max(config_.o2_viability_pct, dome.config().hazards.o2_viability_pct);
}

float DomeCoordinator::donorFloorFor(const DomeController &dome) const {
  return std::max(config_.o2_surplus_pct, dome.config().hazards.o2_viability_pct);
}

TransferPlan DomeCoordinator::plan(const DomeSet &domes) const {
  TransferPlan result;
  result.deltas.assign(domes.size(), 0.0f);

  // --- Snapshot ---
  std::vector<float> o2(domes.size(), 0.0f);
  std::vector<float> viability(domes.size(), 0.0f);
  std::vector<float> capacity(domes.size(), 0.0f);
  std::vector<size_t> deficits;
  for (size_t i = 0; i < domes.size(); i++) {
    if (!takesPart(domes[i])) continue;
    o2[i] = domes[i]->reading().o2_pct;
    viability[i] = viabilityFor(*domes[i]);
    float donorFloor = donorFloorFor(*domes[i]);
    if (o2[i] < viability[i]) {
      deficits.push_back(i);
    } else if (o2[i] > donorFloor) {
      capacity[i] = o2[i] - donorFloor;
    }
  }

  // Worst deficit first, measured against each dome's own threshold
  std::stable_sort(deficits.begin(), deficits.end(),
                   [&o2, &viability](size_t a, size_t b) {
                     return o2[a] - viability[a] < o2[b] - viability[b];
                   });

  for (size_t n = 0; n < deficits.size(); n++) {
    size_t to = deficits[n];
    float fullNeed = viability[to] + config_.recovery_margin_pct - o2[to];
    float minNeed = viability[to] - o2[to];

    float available = 0.0f;
    for (size_t d = 0; d < capacity.size(); d++) {
      available += capacity[d];
    }

    if (!(available > 0.0f)) {
      char note[160];
      snprintf(note, sizeof(note),
               "redistribution declined: %s needs %.2f %% O2, no donor above %.1f %%",
               domes[to]->id().c_str(), fullNeed, config_.o2_surplus_pct);
      result.declined.push_back(note);
      continue;
    }
    // Partial relief when donors cannot cover the viability gap; the
    // recipient's own emergency monitor stays in charge of the rest
    float amount = std::min(fullNeed, available);
    if (amount < minNeed) {
      console_printf("Coordinator", "%s: partial relief %.2f of %.2f %% O2",
                     domes[to]->id().c_str(), amount, minNeed);
    }

    // Proportional draw; the last donor takes the rounding remainder
    float remaining = amount;
    size_t lastDonor = capacity.size();
    for (size_t d = 0; d < capacity.size(); d++) {
      if (capacity[d] > 0.0f) lastDonor = d;
    }
    for (size_t d = 0; d < capacity.size() && remaining > 0.0f; d++) {
      if (!(capacity[d] > 0.0f)) continue;
      float share = (d == lastDonor) ? remaining : amount * capacity[d] / available;
      share = std::min(share, std::min(capacity[d], remaining));
      if (!(share > 0.0f)) continue;

      O2Transfer t;
      t.from = d;
      t.to = to;
      t.amount_pct = share;
      result.transfers.push_back(t);

      result.deltas[d] -= share;
      result.deltas[to] += share;
      capacity[d] -= share;
      remaining -= share;
    }
  }
  return result;
}

bool DomeCoordinator::apply(const TransferPlan &plan, DomeSet &domes) {
  if (plan.deltas.size() != domes.size()) {
    console_printf("Coordinator", "plan for %u domes does not match %u domes, not applied",
                   static_cast<unsigned>(plan.deltas.size()),
                   static_cast<unsigned>(domes.size()));
    return false;
  }
  for (size_t i = 0; i < domes.size(); i++) {
    if (plan.deltas[i] != 0.0f && !takesPart(domes[i])) {
      console_printf("Coordinator", "dome %u cannot take part, plan not applied",
                     static_cast<unsigned>(i));
      return false;
    }
  }

  for (size_t i = 0; i < domes.size(); i++) {
    if (plan.deltas[i] != 0.0f) {
      domes[i]->applyO2Delta(plan.deltas[i]);
    }
  }
  for (size_t n = 0; n < plan.transfers.size(); n++) {
    const O2Transfer &t = plan.transfers[n];
    console_printf("Coordinator", "%.2f %% O2 from %s to %s", t.amount_pct,
                   domes[t.from]->id().c_str(), domes[t.to]->id().c_str());
  }
  transfersApplied_ += static_cast<uint32_t>(plan.transfers.size());
  return true;
}

TransferPlan DomeCoordinator::rebalance(double timeS, DomeSet &domes) {
  TransferPlan result;
  if (!due(timeS)) {
    return result;
  }
  nextDueS_ = timeS + config_.interval_s;
  passes_++;

  result = plan(domes);
  for (size_t i = 0; i < result.declined.size(); i++) {
    console_printf("Coordinator", "%s", result.declined[i].c_str());
  }
  declined_ += static_cast<uint32_t>(result.declined.size());

  if (!result.empty() && !apply(result, domes)) {
    result.transfers.clear();
    result.deltas.assign(domes.size(), 0.0f);
  }
  return result;
}
