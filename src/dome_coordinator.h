/*
 * *****************************************************************************
 * MULTI-DOME COORDINATOR
 * *****************************************************************************
 * O2 redistribution between domes on a coarser cadence than the tick:
 * - Runs after every dome finished its tick, on a snapshot of all readings
 * - Deficit domes (below viability) are served worst first, each drawing
 *   proportionally from donors above the surplus threshold
 * - Viability is the stricter of the shared threshold and the dome's own
 *   hazard threshold; a donor's floor is the stricter of the surplus
 *   threshold and its own viability
 * - Donors never drop below their floor; the deltas of one plan sum to
 *   zero (domes share one volume unit)
 * - Donor capacity short of the need gives partial relief; with no donor
 *   capacity at all the deficit is declined and left to the dome's
 *   emergency monitor
 * - Domes in SHUTDOWN neither give nor receive
 *
 * The dome collection is owned by the caller and passed in on every call.
 * *****************************************************************************
 */

#pragma once

#include "dome_config.h"
#include "dome_controller.h"

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

typedef std::vector<DomeController *> DomeSet;

struct O2Transfer {
  size_t from;              ///< Donor index in the dome set
  size_t to;                ///< Recipient index in the dome set
  float amount_pct;         ///< O2 percentage points moved
};

struct TransferPlan {
  std::vector<O2Transfer> transfers;
  std::vector<float> deltas;            ///< Per dome, same order as the set
  std::vector<std::string> declined;    ///< One note per declined deficit

  bool empty() const { return transfers.empty(); }
  float deltaSum() const;
};

class DomeCoordinator {
public:
  DomeCoordinator();
  explicit DomeCoordinator(const CoordinatorConfig &config);

  /**
   * @brief True when a redistribution pass is due at timeS
   */
  bool due(double timeS) const { return timeS >= nextDueS_; }

  /**
   * @brief Compute transfers from a snapshot of the domes (domes untouched)
   */
  TransferPlan plan(const DomeSet &domes) const;

  /**
   * @brief Apply every delta of a plan in one pass
   * @return false (nothing applied) when the plan does not match the set
   */
  bool apply(const TransferPlan &plan, DomeSet &domes);

  /**
   * @brief plan() + apply() when due, then schedule the next pass
   */
  TransferPlan rebalance(double timeS, DomeSet &domes);

  const CoordinatorConfig &config() const { return config_; }
  uint32_t passes() const { return passes_; }
  uint32_t transfersApplied() const { return transfersApplied_; }
  uint32_t declinedCount() const { return declined_; }

private:
  float viabilityFor(const DomeController &dome) const;
  float donorFloorFor(const DomeController &dome) const;

  CoordinatorConfig config_;
  double nextDueS_;
  uint32_t passes_;
  uint32_t transfersApplied_;
  uint32_t declined_;
};
