#include "roster_io.h"
#include "errors.h"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <ostream>

namespace fs = std::filesystem;

namespace roster {

json load_json(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("Cannot open file: " + path);
  json j;
  in >> j;
  return j;
}

void save_json(const std::string& path, const json& j) {
  const fs::path parent = fs::path(path).parent_path();
  if (!parent.empty()) fs::create_directories(parent);
  std::ofstream out(path);
  if (!out) throw std::runtime_error("Cannot write file: " + path);
  out << std::setw(2) << j << "\n";
}

// ---------------- people ----------------

static void push_name(std::vector<Person>& dst, const json& cell, Population pop) {
  if (!cell.is_string()) return;
  const std::string name = trim(cell.get<std::string>());
  if (name.empty()) return;
  dst.push_back(Person{name, pop, (int)dst.size()});
}

static PeopleLists people_from_rows(const json& rows) {
  PeopleLists out;
  for (const auto& row : rows) {
    if (!row.is_object()) throw ConfigError("People rows must be objects");
    for (auto it = row.begin(); it != row.end(); ++it) {
      const std::string key = lower(trim(it.key()));
      if (key == "faculty" || key == "primary") push_name(out.primary, it.value(), Population::Primary);
      else if (key == "staff" || key == "secondary") push_name(out.secondary, it.value(), Population::Secondary);
    }
  }
  return out;
}

PeopleLists parse_people(const json& j) {
  PeopleLists out;
  if (j.is_array()) {
    out = people_from_rows(j);
  } else if (j.is_object()) {
    if (!j.contains("primary") || !j.contains("secondary"))
      throw ConfigError("People file needs \"primary\" and \"secondary\" lists");
    for (const auto& v : j.at("primary")) push_name(out.primary, v, Population::Primary);
    for (const auto& v : j.at("secondary")) push_name(out.secondary, v, Population::Secondary);
  } else {
    throw ConfigError("People file must be an object or an array of rows");
  }
  if (out.primary.empty()) throw ConfigError("No primary people found");
  if (out.secondary.empty()) throw ConfigError("No secondary people found");
  return out;
}

PeopleLists load_people(const std::string& path) { return parse_people(load_json(path)); }

// ---------------- pins ----------------

std::vector<PinRequest> parse_pins(const json& j) {
  if (!j.is_array()) throw ConfigError("Pins file must be an array");
  std::vector<PinRequest> out;
  for (const auto& e : j) {
    if (!e.is_object() || !e.contains("name") || !e.contains("day"))
      throw ConfigError("Each pin needs \"name\" and \"day\"");
    if (!e.at("name").is_string() || !e.at("day").is_number_integer())
      throw ConfigError("Pin \"name\" must be a string and \"day\" an integer");
    PinRequest p;
    p.person = trim(e.at("name").get<std::string>());
    p.day = e.at("day").get<int>() - 1;
    out.push_back(std::move(p));
  }
  return out;
}

std::vector<PinRequest> load_pins(const std::string& path) { return parse_pins(load_json(path)); }

// ---------------- result ----------------

static json tallies_to_json(const std::vector<DutyTally>& v) {
  json arr = json::array();
  for (const auto& t : v) arr.push_back({{"name", t.name}, {"duties", t.duties}});
  return arr;
}

static json stats_to_json(const PopulationStats& s) {
  return {{"average", s.average}, {"min", s.min}, {"max", s.max}};
}

json result_to_json(const RosterResult& r) {
  json out;

  json assignments = json::array();
  for (const auto& a : r.assignments) {
    assignments.push_back({{"day", a.day + 1},
                           {"room", a.room + 1},
                           {"primary", a.primary},
                           {"secondary", a.secondary}});
  }
  out["assignments"] = std::move(assignments);
  out["primary_duties"] = tallies_to_json(r.primary_duties);
  out["secondary_duties"] = tallies_to_json(r.secondary_duties);

  json findings = json::array();
  for (const auto& v : r.findings) {
    json f = {{"kind", violation_label(v.kind)}, {"hard", is_hard(v.kind)}, {"message", v.message}};
    if (v.day >= 0) f["day"] = v.day + 1;
    if (v.room >= 0) f["room"] = v.room + 1;
    if (!v.person.empty()) f["person"] = v.person;
    findings.push_back(std::move(f));
  }
  out["findings"] = std::move(findings);

  json pins = json::array();
  for (const auto& o : r.pins) {
    json p = {{"name", o.request.person}, {"day", o.request.day + 1}, {"placed", o.placed}};
    if (o.placed) {
      p["room"] = o.room + 1;
      p["partner"] = o.partner;
    }
    pins.push_back(std::move(p));
  }
  out["pins"] = std::move(pins);

  out["stats"] = {{"primary", stats_to_json(r.primary_stats)},
                  {"secondary", stats_to_json(r.secondary_stats)}};

  out["meta"] = {{"days", r.days},
                 {"rooms", r.rooms},
                 {"secondary_duty_target", r.config.secondary_duty_target},
                 {"primary_ceilings", r.config.primary_ceilings},
                 {"seed", r.seed},
                 {"trial", r.trial},
                 {"score", r.score},
                 {"balance_moves", r.balance.total()},
                 {"cap_relaxations", r.fill.cap_relaxations},
                 {"secondary_top_ups", r.fill.secondary_top_ups},
                 {"room_exchanges", r.fill.room_exchanges},
                 {"elapsed_ms", r.elapsed_ms}};
  return out;
}

// ---------------- CSV grid ----------------

static std::string csv_cell(const std::string& s) {
  if (s.find_first_of(",\"\n") == std::string::npos) return s;
  std::string q = "\"";
  for (char c : s) {
    if (c == '"') q += '"';
    q += c;
  }
  return q + "\"";
}

void write_grid_csv(std::ostream& out, const RosterResult& r) {
  out << "Date&Day/Classroom";
  for (int d = 0; d < r.days; ++d) out << "," << day_label(d);
  out << "\n";

  // assignments are day-major, room ascending
  auto at = [&](int d, int room) -> const Assignment& { return r.assignments[d * r.rooms + room]; };
  for (int room = 0; room < r.rooms; ++room) {
    out << room_label(room);
    for (int d = 0; d < r.days; ++d) out << "," << csv_cell(at(d, room).primary);
    out << "\n";
    for (int d = 0; d < r.days; ++d) out << "," << csv_cell(at(d, room).secondary);
    out << "\n";
  }

  out << "\nPrimary Duties\nName,Count\n";
  for (const auto& t : r.primary_duties) out << csv_cell(t.name) << "," << t.duties << "\n";
  out << "\nSecondary Duties\nName,Count\n";
  for (const auto& t : r.secondary_duties) out << csv_cell(t.name) << "," << t.duties << "\n";
}

void save_grid_csv(const std::string& path, const RosterResult& r) {
  const fs::path parent = fs::path(path).parent_path();
  if (!parent.empty()) fs::create_directories(parent);
  std::ofstream out(path);
  if (!out) throw std::runtime_error("Cannot write file: " + path);
  write_grid_csv(out, r);
}

// ---------------- console ----------------

void print_summary(std::ostream& out, const RosterResult& r) {
  for (int d = 0; d < r.days; ++d) {
    out << "\n" << day_label(d) << "\n";
    out << "  " << std::left << std::setw(10) << "Room" << std::setw(24) << "Primary" << "Secondary\n";
    for (int room = 0; room < r.rooms; ++room) {
      const Assignment& a = r.assignments[d * r.rooms + room];
      out << "  " << std::setw(10) << room_label(room)
          << std::setw(24) << (a.primary.empty() ? "-" : a.primary)
          << (a.secondary.empty() ? "-" : a.secondary) << "\n";
    }
  }
  out << std::right;

  auto listing = [&](const char* title, const std::vector<DutyTally>& v, const PopulationStats& st) {
    out << "\n" << title << " (avg " << std::fixed << std::setprecision(2) << st.average
        << ", min " << st.min << ", max " << st.max << ")\n";
    for (const auto& t : v) out << "  " << t.name << ": " << t.duties << "\n";
  };
  listing("Primary duties", r.primary_duties, r.primary_stats);
  listing("Secondary duties", r.secondary_duties, r.secondary_stats);

  if (!r.findings.empty()) {
    out << "\nFindings (" << r.findings.size() << ")\n";
    for (const auto& v : r.findings) out << "  [" << violation_label(v.kind) << "] " << v.message << "\n";
  }
}

}  // namespace roster
