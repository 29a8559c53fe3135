#include "positions.h"
#include "schedule_state.h"
#include <utility>

namespace roster {

bool takes_primary_position(const ScheduleState& S, int a, int b) {
  const Person& pa = S.people[a];
  const Person& pb = S.people[b];
  if (pa.population != pb.population) return pa.population == Population::Primary;
  return pa.rank < pb.rank;
}

void resolve_positions(const ScheduleState& S, Slot& slot) {
  if (!slot.filled()) return;
  if (takes_primary_position(S, slot.secondary, slot.primary))
    std::swap(slot.primary, slot.secondary);
}

}  // namespace roster
