// types.h
#pragma once
#include <vector>
#include <string>

namespace roster {

enum class Population { Primary, Secondary };

struct Person {
  std::string name;        // unique across both populations
  Population population;
  int rank = 0;            // 0 = most senior within its population
};

// Day-level placement obligation. Day is 0-based inside the engine.
struct PinRequest {
  std::string person;
  int day = 0;
};

// One room on one day. Person ids index ScheduleState::people, -1 = empty.
struct Slot {
  int day = 0;
  int room = 0;
  int primary = -1;
  int secondary = -1;
  bool filled() const { return primary >= 0 && secondary >= 0; }
  bool holds(int person) const { return primary == person || secondary == person; }
};

// ---------- output records ----------
struct Assignment {
  int day = 0;                 // 0-based
  int room = 0;                // 0-based
  std::string primary;         // empty when the slot could not be filled
  std::string secondary;
};

struct DutyTally {
  std::string name;
  int duties = 0;
};

struct PopulationStats {
  double average = 0.0;
  int min = 0;
  int max = 0;
};

}  // namespace roster
