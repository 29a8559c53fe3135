// penalties.h
#pragma once
#include <vector>
#include <utility>
#include "schedule_state.h"

namespace roster {

struct PenaltyWeights {
  int w_unfilled = 1000;     // per empty slot
  int w_target = 100;        // per duty a secondary person is off target
  int w_seniority = 50;      // per violating (senior, junior) pair
  int w_ceiling = 10;        // per duty above a primary ceiling
  int w_pin = 500;           // per pin that could not be honoured
};

struct RosterCost {
  int unfilled = 0;
  int target_deviation = 0;
  int seniority = 0;
  int ceiling_excess = 0;
  int unsatisfied_pins = 0;
  int total(const PenaltyWeights& W = PenaltyWeights{}) const {
    return W.w_unfilled * unfilled + W.w_target * target_deviation + W.w_seniority * seniority +
           W.w_ceiling * ceiling_excess + W.w_pin * unsatisfied_pins;
  }
};

// (senior, junior) primary pairs where the senior carries more duties.
std::vector<std::pair<int,int>> seniority_violations(const ScheduleState& S);

// Same count as seniority_violations(S).size() with two counts overridden;
// lets the balancer price a move without applying it.
int seniority_violation_count(const ScheduleState& S, int p1 = -1, int c1 = 0, int p2 = -1, int c2 = 0);

int secondary_target_deviation(const ScheduleState& S);
int primary_ceiling_excess(const ScheduleState& S);
int unfilled_slots(const ScheduleState& S);

RosterCost evaluate(const ScheduleState& S, int unsatisfied_pins);

}  // namespace roster
