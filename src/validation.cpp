#include "validation.h"
#include "positions.h"
#include "utils.h"

#include <algorithm>
#include <map>
#include <sstream>

namespace roster {

const char* violation_label(ViolationKind k) {
  switch (k) {
    case ViolationKind::UnfilledSlot:       return "unfilled_slot";
    case ViolationKind::IdenticalOccupants: return "identical_occupants";
    case ViolationKind::DoubleBooked:       return "double_booked";
    case ViolationKind::ConsecutiveRoom:    return "consecutive_room";
    case ViolationKind::TotalMismatch:      return "total_mismatch";
    case ViolationKind::PositionOrder:      return "position_order";
    case ViolationKind::SecondaryTarget:    return "secondary_target";
    case ViolationKind::Seniority:          return "seniority";
    case ViolationKind::CeilingExceeded:    return "ceiling_exceeded";
    case ViolationKind::PinNotSatisfied:    return "pin_not_satisfied";
  }
  return "unknown";
}

bool is_hard(ViolationKind k) {
  switch (k) {
    case ViolationKind::UnfilledSlot:
    case ViolationKind::IdenticalOccupants:
    case ViolationKind::DoubleBooked:
    case ViolationKind::ConsecutiveRoom:
    case ViolationKind::TotalMismatch:
    case ViolationKind::PositionOrder:
      return true;
    default:
      return false;
  }
}

int count_hard(const std::vector<Violation>& v) {
  return (int)std::count_if(v.begin(), v.end(), [](const Violation& x) { return is_hard(x.kind); });
}

static Violation make(ViolationKind k, int day, int room, std::string person, std::string msg) {
  Violation v;
  v.kind = k;
  v.day = day;
  v.room = room;
  v.person = std::move(person);
  v.message = std::move(msg);
  return v;
}

std::vector<Violation> validate_roster(const ScheduleState& S,
                                       const std::vector<PinRequest>& pins) {
  std::vector<Violation> out;
  const int n = S.person_count();
  const auto& names = S.people;

  // Counts and day->room map straight from the matrix.
  std::vector<int> duties(n, 0);
  std::vector<std::vector<int>> room_of(n, std::vector<int>(S.days(), -1));

  for (int d = 0; d < S.days(); ++d) {
    for (int r = 0; r < S.rooms(); ++r) {
      const Slot& s = S.slot(d, r);
      const std::string where = day_label(d) + " " + room_label(r);
      if (!s.filled()) {
        out.push_back(make(ViolationKind::UnfilledSlot, d, r, "", where + " is not filled"));
      }
      if (s.primary >= 0 && s.primary == s.secondary) {
        out.push_back(make(ViolationKind::IdenticalOccupants, d, r, names[s.primary].name,
                           where + " has " + names[s.primary].name + " in both positions"));
        continue;
      }
      if (s.filled() && !takes_primary_position(S, s.primary, s.secondary)) {
        out.push_back(make(ViolationKind::PositionOrder, d, r, names[s.primary].name,
                           where + " seats " + names[s.primary].name + " ahead of " +
                           names[s.secondary].name));
      }
      for (int p : {s.primary, s.secondary}) {
        if (p < 0) continue;
        duties[p] += 1;
        if (room_of[p][d] >= 0) {
          out.push_back(make(ViolationKind::DoubleBooked, d, r, names[p].name,
                             names[p].name + " is in " + room_label(room_of[p][d]) + " and " +
                             room_label(r) + " on " + day_label(d)));
        } else {
          room_of[p][d] = r;
        }
      }
    }
  }

  for (int p = 0; p < n; ++p) {
    for (int d = 1; d < S.days(); ++d) {
      if (room_of[p][d] >= 0 && room_of[p][d] == room_of[p][d - 1]) {
        out.push_back(make(ViolationKind::ConsecutiveRoom, d, room_of[p][d], names[p].name,
                           names[p].name + " is in " + room_label(room_of[p][d]) + " on " +
                           day_label(d - 1) + " and " + day_label(d)));
      }
    }
  }

  int total = 0;
  for (int c : duties) total += c;
  if (total != S.config.total_positions) {
    std::ostringstream os;
    os << "Duties add up to " << total << ", expected " << S.config.total_positions;
    out.push_back(make(ViolationKind::TotalMismatch, -1, -1, "", os.str()));
  }

  for (int p = S.primary_count; p < n; ++p) {
    if (duties[p] != S.config.secondary_duty_target) {
      out.push_back(make(ViolationKind::SecondaryTarget, -1, -1, names[p].name,
                         names[p].name + " has " + std::to_string(duties[p]) + " duties, target " +
                         std::to_string(S.config.secondary_duty_target)));
    }
  }

  for (int i = 0; i < S.primary_count; ++i) {
    if (duties[i] > S.cap[i]) {
      out.push_back(make(ViolationKind::CeilingExceeded, -1, -1, names[i].name,
                         names[i].name + " has " + std::to_string(duties[i]) + " duties, ceiling " +
                         std::to_string(S.cap[i])));
    }
    for (int j = i + 1; j < S.primary_count; ++j) {
      if (duties[i] > duties[j]) {
        out.push_back(make(ViolationKind::Seniority, -1, -1, names[i].name,
                           names[i].name + " (" + std::to_string(duties[i]) + ") has more duties than junior " +
                           names[j].name + " (" + std::to_string(duties[j]) + ")"));
      }
    }
  }

  for (const auto& pin : pins) {
    const int p = S.find(pin.person);
    if (p < 0 || pin.day < 0 || pin.day >= S.days() || room_of[p][pin.day] < 0) {
      out.push_back(make(ViolationKind::PinNotSatisfied, pin.day, -1, pin.person,
                         pin.person + " is not assigned on " + day_label(pin.day)));
    }
  }
  return out;
}

}  // namespace roster
