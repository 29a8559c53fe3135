// pins.h
#pragma once
#include "types.h"
#include "schedule_state.h"
#include <random>
#include <string>
#include <vector>

namespace roster {

struct PinOutcome {
  PinRequest request;
  bool placed = false;
  int room = -1;
  std::string partner;
};

// Collects every problem (unknown person, day out of range, more pins than
// rooms on a day, duplicate person+day) and throws PinValidationError once.
void validate_pins(const std::vector<PinRequest>& pins, const ScheduleState& S);

// Seat each pinned person with a partner, in day order, and protect the
// pinned (person, day). Pins without any feasible room/partner come back
// with placed == false; they do not abort the run.
std::vector<PinOutcome> place_pins(ScheduleState& S,
                                   const std::vector<PinRequest>& pins,
                                   std::mt19937_64& rng,
                                   bool verbose = false);

}  // namespace roster
