// positions.h
#pragma once
#include "types.h"

namespace roster {

struct ScheduleState;

// True when a should sit in the primary position of a slot shared with b.
//  - mixed pair: the primary-population member
//  - same population: the more senior (lower rank)
bool takes_primary_position(const ScheduleState& S, int a, int b);

// Reorder a filled slot so the occupants follow the rule above. Idempotent;
// half-empty slots are left alone.
void resolve_positions(const ScheduleState& S, Slot& slot);

}  // namespace roster
