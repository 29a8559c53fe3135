#pragma once
#include "schedule_state.h"
#include <random>
#include <vector>

namespace roster {

struct FillReport {
  std::vector<std::pair<int,int>> unfilled;   // (day, room)
  int cap_relaxations = 0;                    // picks made above someone's cap
  int secondary_top_ups = 0;                  // end-of-day primary -> secondary swaps
  int room_exchanges = 0;                     // seated people moved to free a blocked room
};

// Eligible for (day, room): not picked for this room yet, free today, under
// cap and not in this room on an adjacent day.
bool eligible_for(const ScheduleState& S, int p, int day, int room, int exclude);

// Greedy pick: fewest duties, then less senior, then uniform random.
int pick_by_priority(const ScheduleState& S, const std::vector<int>& pool, std::mt19937_64& rng);

// Secondary people the filler should place on `day`, given what is still owed
// and the days left (ceil), limited by the rooms still open.
int day_secondary_goal(const ScheduleState& S, int day);

// Swap primaries out of secondary positions on `day` until the day reaches
// config.min_secondary_per_day. Returns the number of swaps.
int top_up_secondary(ScheduleState& S, int day, std::mt19937_64& rng);

// Fill every open room, day by day and room by room.
FillReport fill_rooms(ScheduleState& S, std::mt19937_64& rng, bool verbose = false);

}  // namespace roster
