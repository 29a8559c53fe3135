#include "pins.h"
#include "errors.h"
#include "selection.h"
#include "utils.h"

#include <algorithm>
#include <iostream>
#include <map>
#include <set>
#include <tuple>

namespace roster {

void validate_pins(const std::vector<PinRequest>& pins, const ScheduleState& S) {
  std::vector<std::string> issues;
  std::map<int, int> per_day;
  std::set<std::pair<std::string, int>> seen;

  for (const auto& pin : pins) {
    const std::string who = "'" + pin.person + "'";
    const bool day_ok = pin.day >= 0 && pin.day < S.days();
    if (S.find(pin.person) < 0)
      issues.push_back("Pinned person " + who + " is not in the primary or secondary list");
    if (!day_ok)
      issues.push_back("Pin for " + who + " has day " + std::to_string(pin.day + 1) +
                       ", expected 1.." + std::to_string(S.days()));
    if (!seen.insert({pin.person, pin.day}).second)
      issues.push_back("Duplicate pin for " + who + " on " + day_label(pin.day));
    else if (day_ok)
      per_day[pin.day] += 1;
  }
  for (const auto& [day, n] : per_day) {
    if (n > S.rooms())
      issues.push_back(day_label(day) + " has " + std::to_string(n) + " pinned people but only " +
                       std::to_string(S.rooms()) + " rooms");
  }
  if (!issues.empty()) throw PinValidationError(std::move(issues));
}

// Partner order: fewest duties, then the population still short of coverage,
// then the less senior.
static int pick_partner(const ScheduleState& S, int pinned_person, int day, int room,
                        std::mt19937_64& rng) {
  std::vector<int> pool;
  for (int p = 0; p < S.person_count(); ++p) {
    if (p == pinned_person) continue;
    if (is_protected(S, p, day)) continue;      // pinned that day, seated by its own pin
    if (!under_cap(S, p)) continue;
    if (!can_take_slot(S, p, day, room)) continue;
    pool.push_back(p);
  }
  const bool secondary_short = remaining_secondary_demand(S) > 0;
  return pick_min_key(pool, [&](int p) {
    const int coverage = (is_secondary(S, p) == secondary_short) ? 0 : 1;
    return std::make_tuple(S.duty_count[p], coverage, -rank_of(S, p));
  }, rng);
}

std::vector<PinOutcome> place_pins(ScheduleState& S,
                                   const std::vector<PinRequest>& pins,
                                   std::mt19937_64& rng,
                                   bool verbose) {
  validate_pins(pins, S);

  std::vector<PinRequest> ordered = pins;
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const PinRequest& a, const PinRequest& b) { return a.day < b.day; });

  // Protect every pinned day up front so partners never come from another pin.
  for (const auto& pin : ordered) S.pinned[S.find(pin.person)][pin.day] = 1;

  std::vector<PinOutcome> out;
  out.reserve(ordered.size());
  for (const auto& pin : ordered) {
    PinOutcome o;
    o.request = pin;
    const int who = S.find(pin.person);

    for (int room = 0; room < S.rooms() && !o.placed; ++room) {
      if (S.slot(pin.day, room).filled()) continue;
      if (!can_take_slot(S, who, pin.day, room)) continue;
      const int partner = pick_partner(S, who, pin.day, room, rng);
      if (partner < 0) continue;

      S.seat_pair(pin.day, room, who, partner);
      o.placed = true;
      o.room = room;
      o.partner = S.people[partner].name;
    }

    if (!o.placed) {
      S.pinned[who][pin.day] = 0;   // nothing to protect
      std::cerr << "[pins] could not place " << pin.person << " on " << day_label(pin.day)
                << " - no free room with an eligible partner\n";
    } else if (verbose) {
      std::cout << "[pins] " << pin.person << " -> " << day_label(pin.day) << " "
                << room_label(o.room) << " with " << o.partner << "\n";
    }
    out.push_back(std::move(o));
  }
  return out;
}

}  // namespace roster
