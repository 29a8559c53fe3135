// roster_io.h
#pragma once
#include <iosfwd>
#include <string>
#include <vector>

#include "roster.h"
#include "utils.h"

namespace roster {

struct PeopleLists {
  std::vector<Person> primary;
  std::vector<Person> secondary;
};

// ---- JSON file helpers (throw std::runtime_error on IO failure) ----
json load_json(const std::string& path);
void save_json(const std::string& path, const json& j);

// Accepts {"primary": [...], "secondary": [...]} or an array of rows whose
// keys name the column ("Faculty"/"Primary", "Staff"/"Secondary", any case).
// Names are trimmed and blank cells skipped. Throws ConfigError.
PeopleLists parse_people(const json& j);
PeopleLists load_people(const std::string& path);

// [{"name": "...", "day": 1}, ...], days 1-based in the file, 0-based after.
std::vector<PinRequest> parse_pins(const json& j);
std::vector<PinRequest> load_pins(const std::string& path);

json result_to_json(const RosterResult& r);

// Spreadsheet-style grid: one column per day, two rows per room, then the
// duty counts of both populations.
void write_grid_csv(std::ostream& out, const RosterResult& r);
void save_grid_csv(const std::string& path, const RosterResult& r);

// Per-day tables and the duty listing, for the console.
void print_summary(std::ostream& out, const RosterResult& r);

}  // namespace roster
