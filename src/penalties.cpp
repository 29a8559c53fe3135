// penalties.cpp
#include "penalties.h"
#include <cstdlib>
#include <algorithm>

namespace roster {

std::vector<std::pair<int,int>> seniority_violations(const ScheduleState& S) {
  std::vector<std::pair<int,int>> out;
  // primary ids are in rank order
  for (int i = 0; i < S.primary_count; ++i)
    for (int j = i + 1; j < S.primary_count; ++j)
      if (S.duty_count[i] > S.duty_count[j]) out.push_back({i, j});
  return out;
}

int seniority_violation_count(const ScheduleState& S, int p1, int c1, int p2, int c2) {
  auto count_of = [&](int p) {
    if (p == p1) return c1;
    if (p == p2) return c2;
    return S.duty_count[p];
  };
  int c = 0;
  for (int i = 0; i < S.primary_count; ++i) {
    const int ci = count_of(i);
    for (int j = i + 1; j < S.primary_count; ++j)
      if (ci > count_of(j)) ++c;
  }
  return c;
}

int secondary_target_deviation(const ScheduleState& S) {
  int c = 0;
  for (int p = S.primary_count; p < S.person_count(); ++p)
    c += std::abs(S.duty_count[p] - S.config.secondary_duty_target);
  return c;
}

int primary_ceiling_excess(const ScheduleState& S) {
  int c = 0;
  for (int p = 0; p < S.primary_count; ++p)
    c += std::max(0, S.duty_count[p] - S.cap[p]);
  return c;
}

int unfilled_slots(const ScheduleState& S) {
  return (int)std::count_if(S.slots.begin(), S.slots.end(), [](const Slot& s) { return !s.filled(); });
}

RosterCost evaluate(const ScheduleState& S, int unsatisfied_pins) {
  RosterCost rc;
  rc.unfilled = unfilled_slots(S);
  rc.target_deviation = secondary_target_deviation(S);
  rc.seniority = (int)seniority_violations(S).size();
  rc.ceiling_excess = primary_ceiling_excess(S);
  rc.unsatisfied_pins = unsatisfied_pins;
  return rc;
}

}  // namespace roster
