#include "schedule_state.h"
#include "positions.h"
#include "errors.h"
#include <algorithm>

namespace roster {

ScheduleState::ScheduleState(const std::vector<Person>& primary,
                             const std::vector<Person>& secondary,
                             const RosterConfig& cfg)
    : config(cfg) {
  people.reserve(primary.size() + secondary.size());

  // Rank is input order within the population, whatever the caller filled in.
  auto add = [&](const std::vector<Person>& src, Population pop) {
    for (std::size_t i = 0; i < src.size(); ++i) {
      Person p = src[i];
      p.population = pop;
      p.rank = (int)i;
      if (p.name.empty()) throw ConfigError("Person names must not be empty");
      if (!id_by_name.emplace(p.name, (int)people.size()).second)
        throw ConfigError("Duplicate person name: " + p.name);
      people.push_back(std::move(p));
    }
  };
  add(primary, Population::Primary);
  add(secondary, Population::Secondary);
  primary_count = (int)primary.size();

  const int n = (int)people.size();
  duty_count.assign(n, 0);
  cap.assign(n, config.secondary_duty_target);
  for (int i = 0; i < primary_count && i < (int)config.primary_ceilings.size(); ++i)
    cap[i] = config.primary_ceilings[i];

  room_on_day.assign(n, std::vector<int>(config.days, -1));
  pinned.assign(n, std::vector<char>(config.days, 0));

  slots.resize(config.days * config.rooms);
  for (int d = 0; d < config.days; ++d)
    for (int r = 0; r < config.rooms; ++r) {
      Slot& s = slot(d, r);
      s.day = d;
      s.room = r;
    }
}

int ScheduleState::find(const std::string& name) const {
  auto it = id_by_name.find(name);
  return it == id_by_name.end() ? -1 : it->second;
}

void ScheduleState::seat_pair(int day, int room, int a, int b) {
  Slot& s = slot(day, room);
  s.primary = a;
  s.secondary = b;
  for (int p : {a, b}) {
    duty_count[p] += 1;
    room_on_day[p][day] = room;
  }
  resolve_positions(*this, s);
}

void ScheduleState::replace_occupant(int day, int room, int from, int to) {
  Slot& s = slot(day, room);
  if (s.primary == from) s.primary = to;
  else if (s.secondary == from) s.secondary = to;
  else return;

  duty_count[from] -= 1;
  room_on_day[from][day] = -1;
  duty_count[to] += 1;
  room_on_day[to][day] = room;
  resolve_positions(*this, s);
}

bool was_in_room_yesterday(const ScheduleState& S, int p, int day, int room) {
  return day > 0 && S.room_on_day[p][day - 1] == room;
}

bool in_room_on_adjacent_day(const ScheduleState& S, int p, int day, int room) {
  if (was_in_room_yesterday(S, p, day, room)) return true;
  return day + 1 < S.days() && S.room_on_day[p][day + 1] == room;
}

bool can_take_slot(const ScheduleState& S, int p, int day, int room) {
  return !is_assigned_on_day(S, p, day) && !in_room_on_adjacent_day(S, p, day, room);
}

int secondary_count_on_day(const ScheduleState& S, int day) {
  int c = 0;
  for (int r = 0; r < S.rooms(); ++r) {
    const Slot& s = S.slot(day, r);
    if (s.primary >= 0 && is_secondary(S, s.primary)) ++c;
    if (s.secondary >= 0 && is_secondary(S, s.secondary)) ++c;
  }
  return c;
}

int open_rooms_on_day(const ScheduleState& S, int day) {
  int c = 0;
  for (int r = 0; r < S.rooms(); ++r)
    if (!S.slot(day, r).filled()) ++c;
  return c;
}

int remaining_secondary_demand(const ScheduleState& S) {
  int need = 0;
  for (int p = S.primary_count; p < S.person_count(); ++p)
    need += std::max(0, S.config.secondary_duty_target - S.duty_count[p]);
  return need;
}

std::vector<int> population_ids(const ScheduleState& S, Population pop) {
  std::vector<int> ids;
  if (pop == Population::Primary) {
    for (int p = 0; p < S.primary_count; ++p) ids.push_back(p);
  } else {
    for (int p = S.primary_count; p < S.person_count(); ++p) ids.push_back(p);
  }
  return ids;
}

}  // namespace roster
