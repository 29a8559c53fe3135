#include "config.h"
#include "errors.h"

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <thread>

namespace roster {

RosterConfig resolve_config(int primary_count, int secondary_count, int days, int rooms) {
  if (days < kMinDays || days > kMaxDays)
    throw ConfigError("Number of days must be between " + std::to_string(kMinDays) +
                      " and " + std::to_string(kMaxDays) + " (got " + std::to_string(days) + ")");
  if (rooms < kMinRooms || rooms > kMaxRooms)
    throw ConfigError("Number of rooms must be between " + std::to_string(kMinRooms) +
                      " and " + std::to_string(kMaxRooms) + " (got " + std::to_string(rooms) + ")");
  if (primary_count <= 0)
    throw ConfigError("At least one primary person is required");
  if (secondary_count <= 0)
    throw ConfigError("At least one secondary person is required");

  RosterConfig c;
  c.days = days;
  c.rooms = rooms;
  c.total_positions = days * rooms * 2;
  c.secondary_duty_target = std::max(1, days - 1);
  c.total_secondary_duties = secondary_count * c.secondary_duty_target;
  c.total_primary_duties = c.total_positions - c.total_secondary_duties;

  if (c.total_primary_duties < 0)
    throw CapacityError(std::to_string(secondary_count) + " secondary people need " +
                        std::to_string(c.total_secondary_duties) + " duties but the grid only has " +
                        std::to_string(c.total_positions) + " positions");

  // Too few people for one day, or ceilings above `days`, are left to the
  // filler and the validator: they show up as unfilled slots and excess.
  // Equal split, remainder to the most junior first: ceilings never decrease with rank.
  const int base = c.total_primary_duties / primary_count;
  const int extra = c.total_primary_duties % primary_count;
  c.primary_ceilings.assign(primary_count, base);
  for (int i = 0; i < extra; ++i) c.primary_ceilings[primary_count - 1 - i] += 1;

  c.min_secondary_per_day = c.total_secondary_duties / days;
  return c;
}

unsigned long long parse_seed(const std::string& v) {
  // stoull would wrap "-1" and skip leading blanks
  if (v.empty() || !std::all_of(v.begin(), v.end(), [](unsigned char c) { return std::isdigit(c); }))
    throw ConfigError("Seed must be a non-negative integer (got \"" + v + "\")");
  try {
    return std::stoull(v);
  } catch (const std::out_of_range&) {
    throw ConfigError("Seed out of range: " + v);
  }
}

RunConfig parse_run_config(const nlohmann::json& j) {
  const unsigned def_threads_u = std::max(1u, std::thread::hardware_concurrency());
  const int def_threads = (def_threads_u > static_cast<unsigned>(std::numeric_limits<int>::max()))
      ? std::numeric_limits<int>::max()
      : static_cast<int>(def_threads_u);

  RunConfig rc;
  rc.days                     = j.value("DAYS", 6);
  rc.rooms                    = j.value("ROOMS", 11);
  rc.settings.trials          = std::max(1, j.value("TRIALS", 1));
  rc.settings.threads         = std::max(1, j.value("THREADS", def_threads));
  rc.settings.seed            = j.value("RNG_BASE_SEED", 12345ULL);
  rc.settings.swap_budget     = std::max(0, j.value("SWAP_BUDGET", 100));
  rc.settings.balance_rounds  = std::max(0, j.value("BALANCE_ROUNDS", 3));
  rc.settings.chain_depth     = std::max(1, j.value("CHAIN_DEPTH", 3));
  rc.settings.smoothing       = j.value("SMOOTHING", true);
  rc.settings.verbose         = j.value("LOG_PROGRESS", true);
  rc.result_out               = j.value("RESULT_OUT", std::string("roster.json"));
  rc.csv_out                  = j.value("CSV_OUT", std::string());
  return rc;
}

}  // namespace roster
