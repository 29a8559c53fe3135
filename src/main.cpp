// main.cpp
#include <cstdlib>
#include <iostream>
#include <string>

#include "config.h"
#include "errors.h"
#include "roster.h"
#include "roster_io.h"
#include "utils.h"

using namespace roster;

// ---------------- Minimal CLI ----------------
struct Flags {
  std::string people_path;        // required
  std::string config_path;        // optional
  std::string pins_path;          // optional
  int days = -1;                  // -1 = from config
  int rooms = -1;
  unsigned long long seed = 0;
  bool seed_set = false;
  int trials = -1;
  std::string out_path;
  std::string csv_path;
  bool verbose = true;            // flipped by --quiet
};

static void print_usage() {
  std::cout <<
R"(Usage:
  roster --people people.json [--config config.json] [--pins pins.json] [options]

Required:
  --people PATH       {"primary": [...], "secondary": [...]} or rows with Faculty/Staff columns

Optional:
  --config PATH       JSON run config (DAYS, ROOMS, TRIALS, THREADS, RNG_BASE_SEED, ...)
  --pins PATH         [{"name": "...", "day": 1}, ...]
  --days N            Override DAYS (1..10)
  --rooms N           Override ROOMS (1..20)
  --seed N            Override RNG_BASE_SEED
  --trials N          Override TRIALS
  --out PATH          Override RESULT_OUT
  --csv PATH          Override CSV_OUT
  --quiet             Less logging
  --help
)";
}

static int to_int(const std::string& flag, const std::string& v) {
  try {
    std::size_t used = 0;
    const int n = std::stoi(v, &used);
    if (used == v.size()) return n;
  } catch (const std::exception&) {
  }
  std::cerr << "Invalid number for " << flag << ": " << v << "\n";
  std::exit(2);
}

static unsigned long long to_seed(const std::string& v) {
  try {
    return parse_seed(v);
  } catch (const ConfigError& e) {
    std::cerr << "Invalid value for --seed: " << e.what() << "\n";
    std::exit(2);
  }
}

static Flags parse_flags(int argc, char** argv) {
  Flags f;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto need = [&](const char* name) {
      if (i + 1 >= argc) { std::cerr << "Missing value for " << name << "\n"; std::exit(2); }
      return std::string(argv[++i]);
    };
    if (a == "--help" || a == "-h") { print_usage(); std::exit(0); }
    else if (a == "--people") f.people_path = need("--people");
    else if (a == "--config") f.config_path = need("--config");
    else if (a == "--pins")   f.pins_path = need("--pins");
    else if (a == "--days")   f.days = to_int(a, need("--days"));
    else if (a == "--rooms")  f.rooms = to_int(a, need("--rooms"));
    else if (a == "--seed")   { f.seed = to_seed(need("--seed")); f.seed_set = true; }
    else if (a == "--trials") f.trials = to_int(a, need("--trials"));
    else if (a == "--out")    f.out_path = need("--out");
    else if (a == "--csv")    f.csv_path = need("--csv");
    else if (a == "--quiet")  f.verbose = false;
    else { std::cerr << "Unknown flag: " << a << "\n"; print_usage(); std::exit(2); }
  }
  if (f.people_path.empty()) {
    std::cerr << "Missing required --people.\n"; print_usage(); std::exit(2);
  }
  return f;
}

// ---------------- Main ----------------
int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);
  const Flags flags = parse_flags(argc, argv);

  RosterInput input;
  RunConfig cfg;
  try {
    cfg = parse_run_config(flags.config_path.empty() ? json::object() : load_json(flags.config_path));
    PeopleLists people = load_people(flags.people_path);
    input.primary = std::move(people.primary);
    input.secondary = std::move(people.secondary);
    if (!flags.pins_path.empty()) input.pins = load_pins(flags.pins_path);
  } catch (const std::exception& e) {
    std::cerr << "Failed to load inputs: " << e.what() << "\n"; return 1;
  }

  if (flags.days >= 0)   cfg.days = flags.days;
  if (flags.rooms >= 0)  cfg.rooms = flags.rooms;
  if (flags.seed_set)    cfg.settings.seed = flags.seed;
  if (flags.trials >= 1) cfg.settings.trials = flags.trials;
  if (!flags.out_path.empty()) cfg.result_out = flags.out_path;
  if (!flags.csv_path.empty()) cfg.csv_out = flags.csv_path;
  cfg.settings.verbose = cfg.settings.verbose && flags.verbose;
  input.days = cfg.days;
  input.rooms = cfg.rooms;

  if (flags.verbose) {
    std::cout << "Exam duty roster\n";
    std::cout << "Config: days=" << cfg.days << " rooms=" << cfg.rooms
              << " primary=" << input.primary.size()
              << " secondary=" << input.secondary.size()
              << " pins=" << input.pins.size()
              << " trials=" << cfg.settings.trials
              << " threads=" << cfg.settings.threads
              << " seed=" << cfg.settings.seed << "\n";
  }

  RosterResult result;
  try {
    result = run_trials(input, cfg.settings);
  } catch (const PinValidationError& e) {
    std::cerr << "Pin validation failed:\n";
    for (const auto& issue : e.issues) std::cerr << "  - " << issue << "\n";
    return 3;
  } catch (const std::exception& e) {
    std::cerr << "Generation failed: " << e.what() << "\n"; return 3;
  }

  try {
    save_json(cfg.result_out, result_to_json(result));
    if (!cfg.csv_out.empty()) save_grid_csv(cfg.csv_out, result);
  } catch (const std::exception& e) {
    std::cerr << "Failed to write result: " << e.what() << "\n"; return 4;
  }

  if (flags.verbose) {
    print_summary(std::cout, result);
    std::cout << "\nResult written to " << cfg.result_out << "\n";
    if (!cfg.csv_out.empty()) std::cout << "Grid written to " << cfg.csv_out << "\n";
  }
  return 0;
}
