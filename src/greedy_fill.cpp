#include "greedy_fill.h"
#include "selection.h"
#include "utils.h"

#include <algorithm>
#include <iostream>
#include <tuple>

namespace roster {

bool eligible_for(const ScheduleState& S, int p, int day, int room, int exclude) {
  if (p == exclude) return false;
  if (!under_cap(S, p)) return false;
  return can_take_slot(S, p, day, room);
}

int pick_by_priority(const ScheduleState& S, const std::vector<int>& pool, std::mt19937_64& rng) {
  return pick_min_key(pool, [&](int p) {
    return std::make_pair(S.duty_count[p], -rank_of(S, p));
  }, rng);
}

int day_secondary_goal(const ScheduleState& S, int day) {
  const int remaining_days = S.days() - day;
  const int demand = remaining_secondary_demand(S);
  const int share = remaining_days > 0 ? (demand + remaining_days - 1) / remaining_days : demand;
  return secondary_count_on_day(S, day) + std::min(share, 2 * open_rooms_on_day(S, day));
}

// Candidate pools, tried in order until one is non-empty.
static std::vector<int> eligible_of(const ScheduleState& S, const std::vector<int>& ids,
                                    int day, int room, int exclude) {
  std::vector<int> pool;
  for (int p : ids)
    if (eligible_for(S, p, day, room, exclude)) pool.push_back(p);
  return pool;
}

static std::vector<int> all_ids(const ScheduleState& S) {
  std::vector<int> ids(S.person_count());
  for (int p = 0; p < S.person_count(); ++p) ids[p] = p;
  return ids;
}

// Last resort: ignore caps (never the room rule), least over cap first.
static int pick_relaxed(const ScheduleState& S, int day, int room, int exclude, std::mt19937_64& rng) {
  std::vector<int> pool;
  for (int p = 0; p < S.person_count(); ++p)
    if (p != exclude && can_take_slot(S, p, day, room)) pool.push_back(p);
  return pick_min_key(pool, [&](int p) {
    return std::make_tuple(S.duty_count[p] - S.cap[p], S.duty_count[p], -rank_of(S, p));
  }, rng);
}

static int pick_for_position(const ScheduleState& S, int day, int room, int exclude,
                             bool want_secondary, std::mt19937_64& rng, bool& relaxed) {
  relaxed = false;
  const std::vector<int> everyone = all_ids(S);
  const std::vector<int> preferred = population_ids(S, want_secondary ? Population::Secondary
                                                                      : Population::Primary);
  std::vector<int> pool = eligible_of(S, preferred, day, room, exclude);
  if (pool.empty()) pool = eligible_of(S, everyone, day, room, exclude);
  if (!pool.empty()) return pick_by_priority(S, pool, rng);

  relaxed = true;
  return pick_relaxed(S, day, room, exclude, rng);
}

// Everyone free today is barred from `room` by the room rule. Seat one of them
// (c) in another room r2 in place of an occupant o who may use `room`; o is
// then free and is returned as the pick.
static int pick_by_exchange(ScheduleState& S, int day, int room, int exclude, std::mt19937_64& rng) {
  struct Option { int c, r2, o; };
  std::vector<Option> options;
  for (int c = 0; c < S.person_count(); ++c) {
    if (c == exclude || is_assigned_on_day(S, c, day)) continue;
    for (int r2 = 0; r2 < S.rooms(); ++r2) {
      const Slot& s = S.slot(day, r2);
      if (r2 == room || !s.filled() || in_room_on_adjacent_day(S, c, day, r2)) continue;
      for (int o : {s.primary, s.secondary}) {
        if (is_protected(S, o, day) || in_room_on_adjacent_day(S, o, day, room)) continue;
        options.push_back({c, r2, o});
      }
    }
  }

  std::vector<int> idx(options.size());
  for (std::size_t i = 0; i < idx.size(); ++i) idx[i] = (int)i;
  const int k = pick_min_key(idx, [&](int i) {
    const int c = options[i].c;
    return std::make_tuple(S.duty_count[c] - S.cap[c], S.duty_count[c], -rank_of(S, c));
  }, rng);
  if (k < 0) return -1;

  const Option& opt = options[k];
  S.replace_occupant(day, opt.r2, opt.o, opt.c);
  return opt.o;
}

// Replace primaries sitting in secondary positions until the day's floor is met.
int top_up_secondary(ScheduleState& S, int day, std::mt19937_64& rng) {
  int swaps = 0;
  const std::vector<int> secondary = population_ids(S, Population::Secondary);
  for (int room = 0; room < S.rooms(); ++room) {
    if (secondary_count_on_day(S, day) >= S.config.min_secondary_per_day) break;
    Slot& s = S.slot(day, room);
    if (!s.filled()) continue;
    const int out = s.secondary;
    if (!is_primary(S, out) || is_protected(S, out, day)) continue;

    const int in = pick_by_priority(S, eligible_of(S, secondary, day, room, -1), rng);
    if (in < 0) continue;
    S.replace_occupant(day, room, out, in);
    ++swaps;
  }
  return swaps;
}

FillReport fill_rooms(ScheduleState& S, std::mt19937_64& rng, bool verbose) {
  FillReport rep;

  for (int day = 0; day < S.days(); ++day) {
    const int goal = day_secondary_goal(S, day);

    for (int room = 0; room < S.rooms(); ++room) {
      if (S.slot(day, room).filled()) continue;   // taken by a pin

      int need = goal - secondary_count_on_day(S, day);
      const int open = open_rooms_on_day(S, day);

      // First position: primary unless one secondary per open room cannot reach the goal.
      bool relaxed_a = false, relaxed_b = false;
      int a = pick_for_position(S, day, room, -1, need > open, rng, relaxed_a);
      if (a < 0 && (a = pick_by_exchange(S, day, room, -1, rng)) >= 0) ++rep.room_exchanges;
      if (a < 0) {
        rep.unfilled.push_back({day, room});
        continue;
      }
      if (is_secondary(S, a)) --need;

      // Second position: secondary while the day is behind its goal.
      int b = pick_for_position(S, day, room, a, need > 0, rng, relaxed_b);
      if (b < 0 && (b = pick_by_exchange(S, day, room, a, rng)) >= 0) ++rep.room_exchanges;
      if (b < 0) {
        rep.unfilled.push_back({day, room});
        continue;
      }

      S.seat_pair(day, room, a, b);
      rep.cap_relaxations += (int)relaxed_a + (int)relaxed_b;
    }

    rep.secondary_top_ups += top_up_secondary(S, day, rng);

    if (verbose) {
      std::cout << "[fill] " << day_label(day)
                << " secondary=" << secondary_count_on_day(S, day)
                << " goal=" << goal
                << " open=" << open_rooms_on_day(S, day) << "\n";
    }
  }

  if (verbose) {
    std::cout << "[fill] done cap_relaxations=" << rep.cap_relaxations
              << " secondary_top_ups=" << rep.secondary_top_ups
              << " room_exchanges=" << rep.room_exchanges
              << " unfilled=" << rep.unfilled.size() << "\n";
  }

  for (const auto& [day, room] : rep.unfilled) {
    std::cerr << "[fill] " << day_label(day) << " " << room_label(room)
              << " left unfilled - no eligible pair\n";
  }
  return rep;
}

}  // namespace roster
