#include "roster.h"
#include "schedule_state.h"
#include "utils.h"

#include <algorithm>
#include <atomic>
#include <future>
#include <iostream>
#include <mutex>
#include <random>

namespace roster {

std::vector<Person> make_people(const std::vector<std::string>& names, Population pop) {
  std::vector<Person> out;
  out.reserve(names.size());
  for (std::size_t i = 0; i < names.size(); ++i) out.push_back(Person{names[i], pop, (int)i});
  return out;
}

PopulationStats compute_stats(const std::vector<DutyTally>& tallies) {
  PopulationStats st;
  if (tallies.empty()) return st;
  int sum = 0;
  st.min = tallies.front().duties;
  st.max = tallies.front().duties;
  for (const auto& t : tallies) {
    sum += t.duties;
    st.min = std::min(st.min, t.duties);
    st.max = std::max(st.max, t.duties);
  }
  st.average = (double)sum / tallies.size();
  return st;
}

static std::vector<DutyTally> tallies_of(const ScheduleState& S, Population pop) {
  std::vector<DutyTally> out;
  for (int p : population_ids(S, pop)) out.push_back(DutyTally{S.people[p].name, S.duty_count[p]});
  // stable: equal counts keep seniority order
  std::stable_sort(out.begin(), out.end(),
                   [](const DutyTally& a, const DutyTally& b) { return a.duties > b.duties; });
  return out;
}

static std::vector<Assignment> assignments_of(const ScheduleState& S) {
  std::vector<Assignment> out;
  out.reserve(S.slots.size());
  for (int d = 0; d < S.days(); ++d) {
    for (int r = 0; r < S.rooms(); ++r) {
      const Slot& s = S.slot(d, r);
      Assignment a;
      a.day = d;
      a.room = r;
      if (s.primary >= 0) a.primary = S.people[s.primary].name;
      if (s.secondary >= 0) a.secondary = S.people[s.secondary].name;
      out.push_back(std::move(a));
    }
  }
  return out;
}

RosterResult generate_roster(const RosterInput& in, const GenerationSettings& settings) {
  const auto t0 = NowMillis();
  const bool verbose = settings.verbose;

  const RosterConfig cfg = resolve_config((int)in.primary.size(), (int)in.secondary.size(),
                                          in.days, in.rooms);
  if (verbose) {
    std::cout << "[config] days=" << cfg.days << " rooms=" << cfg.rooms
              << " positions=" << cfg.total_positions
              << " secondary_target=" << cfg.secondary_duty_target
              << " primary_duties=" << cfg.total_primary_duties << " ceilings=";
    for (int c : cfg.primary_ceilings) std::cout << c << " ";
    std::cout << "\n";
  }

  ScheduleState S(in.primary, in.secondary, cfg);
  std::mt19937_64 rng(settings.seed);

  RosterResult res;
  res.days = cfg.days;
  res.rooms = cfg.rooms;
  res.config = cfg;
  res.seed = settings.seed;

  res.pins = place_pins(S, in.pins, rng, verbose);
  res.fill = fill_rooms(S, rng, verbose);

  BalanceConfig bc;
  bc.swap_budget = settings.swap_budget;
  bc.chain_depth = settings.chain_depth;
  bc.smoothing = settings.smoothing;
  bc.verbose = verbose;
  for (int round = 0; round < settings.balance_rounds; ++round) {
    const BalanceStats st = balance_round(S, bc);
    res.balance.target_moves += st.target_moves;
    res.balance.seniority_moves += st.seniority_moves;
    res.balance.smoothing_moves += st.smoothing_moves;
    if (verbose) std::cout << "[balance] round " << round + 1 << " moves=" << st.total() << "\n";
    if (st.total() == 0) break;
  }

  res.findings = validate_roster(S, in.pins);
  const int unsatisfied = (int)std::count_if(res.pins.begin(), res.pins.end(),
                                             [](const PinOutcome& o) { return !o.placed; });
  res.cost = evaluate(S, unsatisfied);
  res.score = res.cost.total();

  res.assignments = assignments_of(S);
  res.primary_duties = tallies_of(S, Population::Primary);
  res.secondary_duties = tallies_of(S, Population::Secondary);
  res.primary_stats = compute_stats(res.primary_duties);
  res.secondary_stats = compute_stats(res.secondary_duties);

  if (verbose) {
    std::cout << "[validate] findings=" << res.findings.size()
              << " hard=" << count_hard(res.findings)
              << " score=" << res.score << "\n";
  }
  res.elapsed_ms = NowMillis() - t0;
  return res;
}

RosterResult generate_roster(const std::vector<std::string>& primary,
                             const std::vector<std::string>& secondary,
                             int days, int rooms,
                             const std::vector<PinRequest>& pins,
                             const GenerationSettings& settings) {
  RosterInput in;
  in.primary = make_people(primary, Population::Primary);
  in.secondary = make_people(secondary, Population::Secondary);
  in.days = days;
  in.rooms = rooms;
  in.pins = pins;
  return generate_roster(in, settings);
}

RosterResult run_trials(const RosterInput& in, const GenerationSettings& settings) {
  const int trials = std::max(1, settings.trials);
  if (trials == 1) return generate_roster(in, settings);

  // Fatal input problems surface once, here, rather than once per worker.
  {
    const RosterConfig cfg = resolve_config((int)in.primary.size(), (int)in.secondary.size(),
                                            in.days, in.rooms);
    ScheduleState check(in.primary, in.secondary, cfg);
    validate_pins(in.pins, check);
  }

  std::atomic<int> next_idx{0};
  std::mutex io_mu;
  std::vector<std::future<void>> pool;
  std::vector<RosterResult> results(trials);

  const int max_threads = std::max(1, std::min(settings.threads, trials));
  for (int t = 0; t < max_threads; ++t) {
    pool.emplace_back(std::async(std::launch::async, [&]() {
      for (;;) {
        const int i = next_idx.fetch_add(1);
        if (i >= trials) break;

        GenerationSettings s = settings;
        s.seed = settings.seed + (unsigned long long)i;
        s.verbose = false;

        RosterResult r = generate_roster(in, s);
        r.trial = i;
        if (settings.verbose) {
          std::lock_guard<std::mutex> lk(io_mu);
          std::cout << "[trials] trial " << i << " seed=" << s.seed
                    << " score=" << r.score << " (" << r.elapsed_ms << " ms)\n";
        }
        results[i] = std::move(r);
      }
    }));
  }
  // rethrows the first worker exception
  for (auto& fut : pool) fut.get();

  int best = 0;
  for (int i = 1; i < trials; ++i)
    if (results[i].score < results[best].score) best = i;

  if (settings.verbose) {
    std::cout << "[trials] best trial " << best << " score=" << results[best].score << "\n";
  }
  return std::move(results[best]);
}

}  // namespace roster
