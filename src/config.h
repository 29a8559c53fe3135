// config.h
#pragma once
#include <vector>
#include <string>
#include <nlohmann/json.hpp>

namespace roster {

// Supported grid bounds (inclusive).
constexpr int kMinDays = 1;
constexpr int kMaxDays = 10;
constexpr int kMinRooms = 1;
constexpr int kMaxRooms = 20;

// Numbers derived once per run from population sizes and the grid.
struct RosterConfig {
  int days = 0;
  int rooms = 0;
  int total_positions = 0;          // days * rooms * 2
  int secondary_duty_target = 0;    // exact per secondary person
  int total_secondary_duties = 0;
  int total_primary_duties = 0;
  int min_secondary_per_day = 0;    // soft floor steering the filler
  std::vector<int> primary_ceilings; // indexed by primary rank, non-decreasing
};

// Throws ConfigError, or CapacityError when the secondary target does not fit.
RosterConfig resolve_config(int primary_count, int secondary_count, int days, int rooms);

// Knobs of one generation run (and of the trial pool around it).
struct GenerationSettings {
  unsigned long long seed = 12345;
  int swap_budget = 100;        // moves per balancing phase
  int balance_rounds = 3;
  int chain_depth = 3;          // intermediaries a single move may route through
  bool smoothing = true;
  bool verbose = false;

  int trials = 1;
  int threads = 1;
};

// Run configuration file: grid plus settings plus output paths.
struct RunConfig {
  int days = 6;
  int rooms = 11;
  GenerationSettings settings;
  std::string result_out = "roster.json";
  std::string csv_out;
};

RunConfig parse_run_config(const nlohmann::json& j);

// Full unsigned 64-bit range; ConfigError on anything but digits.
unsigned long long parse_seed(const std::string& v);

}  // namespace roster
