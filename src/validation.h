// validation.h
#pragma once
#include <string>
#include <vector>

#include "schedule_state.h"
#include "types.h"

namespace roster {

enum class ViolationKind {
  UnfilledSlot,        // hard
  IdenticalOccupants,  // hard
  DoubleBooked,        // hard: one person in two rooms on a day
  ConsecutiveRoom,     // hard: same room on two consecutive days
  TotalMismatch,       // hard: duty counts do not add up to the grid
  PositionOrder,       // hard: primary/secondary position rule broken
  SecondaryTarget,
  Seniority,
  CeilingExceeded,
  PinNotSatisfied,
};

struct Violation {
  ViolationKind kind;
  int day = -1;           // -1 when not tied to a day
  int room = -1;
  std::string person;     // primary name involved, if any
  std::string message;
};

const char* violation_label(ViolationKind k);
bool is_hard(ViolationKind k);

// Re-derives everything from the slot matrix (never from the tracker's
// counters) and reports every problem found. Never throws.
std::vector<Violation> validate_roster(const ScheduleState& S,
                                       const std::vector<PinRequest>& pins);

int count_hard(const std::vector<Violation>& v);

}  // namespace roster
