// roster.h
#pragma once
#include <string>
#include <vector>

#include "balancer.h"
#include "config.h"
#include "greedy_fill.h"
#include "penalties.h"
#include "pins.h"
#include "types.h"
#include "validation.h"

namespace roster {

// Everything one generation needs. Input order of each list is seniority.
struct RosterInput {
  std::vector<Person> primary;
  std::vector<Person> secondary;
  int days = 6;
  int rooms = 11;
  std::vector<PinRequest> pins;   // 0-based days
};

struct RosterResult {
  int days = 0;
  int rooms = 0;
  RosterConfig config;

  std::vector<Assignment> assignments;        // day-major, room ascending
  std::vector<DutyTally> primary_duties;      // sorted by duties, descending
  std::vector<DutyTally> secondary_duties;
  PopulationStats primary_stats;
  PopulationStats secondary_stats;

  std::vector<PinOutcome> pins;
  std::vector<Violation> findings;
  FillReport fill;
  BalanceStats balance;                       // summed over rounds
  RosterCost cost;
  int score = 0;                              // cost.total()

  unsigned long long seed = 0;
  int trial = 0;
  long long elapsed_ms = 0;
};

// Build a person list from names, rank = position in the list.
std::vector<Person> make_people(const std::vector<std::string>& names, Population pop);

// Full pipeline for one seed: resolve config, place pins, fill, balance,
// validate. Throws ConfigError / CapacityError / PinValidationError before
// any assignment; everything else comes back as findings.
RosterResult generate_roster(const RosterInput& in, const GenerationSettings& settings);

// Convenience overload taking plain name lists.
RosterResult generate_roster(const std::vector<std::string>& primary,
                             const std::vector<std::string>& secondary,
                             int days, int rooms,
                             const std::vector<PinRequest>& pins,
                             const GenerationSettings& settings);

// Best of settings.trials independent runs (seed base + i) on up to
// settings.threads workers. Lowest score wins, earliest trial on ties.
RosterResult run_trials(const RosterInput& in, const GenerationSettings& settings);

PopulationStats compute_stats(const std::vector<DutyTally>& tallies);

}  // namespace roster
