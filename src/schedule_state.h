#pragma once
#include "types.h"
#include "config.h"
#include <unordered_map>
#include <string>
#include <vector>

namespace roster {

// Mutable per-run state. Owned by one run and passed by reference through
// pin placement, greedy filling and balancing; the validator only reads it.
struct ScheduleState {
  RosterConfig config;

  // People: primary population first (ids 0..P-1), then secondary.
  std::vector<Person>                  people;
  std::unordered_map<std::string, int> id_by_name;
  int primary_count = 0;

  // Per person
  std::vector<int>                     duty_count;
  std::vector<int>                     cap;          // primary ceiling or secondary target
  std::vector<std::vector<int>>        room_on_day;  // [person][day] -> room, -1 = free
  std::vector<std::vector<char>>       pinned;       // [person][day] -> protected

  // Matrix, index day * rooms + room
  std::vector<Slot>                    slots;

  ScheduleState(const std::vector<Person>& primary,
                const std::vector<Person>& secondary,
                const RosterConfig& cfg);

  int days() const { return config.days; }
  int rooms() const { return config.rooms; }
  int person_count() const { return (int)people.size(); }

  Slot&       slot(int day, int room)       { return slots[day * config.rooms + room]; }
  const Slot& slot(int day, int room) const { return slots[day * config.rooms + room]; }

  int find(const std::string& name) const;   // -1 when unknown

  // Seat two people in an empty slot; positions are resolved afterwards.
  void seat_pair(int day, int room, int a, int b);
  // Hand one occupant's seat to someone else (counts and history follow).
  void replace_occupant(int day, int room, int from, int to);
};

// ---------- pure queries over the tracker ----------
inline bool is_primary(const ScheduleState& S, int p) { return S.people[p].population == Population::Primary; }
inline bool is_secondary(const ScheduleState& S, int p) { return !is_primary(S, p); }
inline int  rank_of(const ScheduleState& S, int p) { return S.people[p].rank; }

inline bool is_assigned_on_day(const ScheduleState& S, int p, int day) { return S.room_on_day[p][day] >= 0; }
inline bool is_protected(const ScheduleState& S, int p, int day) { return S.pinned[p][day] != 0; }
inline bool under_cap(const ScheduleState& S, int p) { return S.duty_count[p] < S.cap[p]; }

bool was_in_room_yesterday(const ScheduleState& S, int p, int day, int room);
// Same room on the day before or the day after (pins can seat people ahead of the filler).
bool in_room_on_adjacent_day(const ScheduleState& S, int p, int day, int room);

// Free that day and no adjacent-day repeat of the room. Caps are not checked.
bool can_take_slot(const ScheduleState& S, int p, int day, int room);

int secondary_count_on_day(const ScheduleState& S, int day);
int open_rooms_on_day(const ScheduleState& S, int day);
// Sum over secondary people of the duties still missing to reach the target.
int remaining_secondary_demand(const ScheduleState& S);

// Ids in seniority order within one population.
std::vector<int> population_ids(const ScheduleState& S, Population pop);

}  // namespace roster
