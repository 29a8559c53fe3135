// balancer.cpp
#include "balancer.h"
#include "penalties.h"

#include <algorithm>
#include <deque>
#include <iostream>
#include <utility>

namespace roster {

bool can_move(const ScheduleState& S, const Move& m) {
  if (m.from < 0 || m.to < 0 || m.from == m.to) return false;
  if (!S.slot(m.day, m.room).holds(m.from)) return false;
  if (is_protected(S, m.from, m.day)) return false;
  if (m.via_room < 0) return can_take_slot(S, m.to, m.day, m.room);

  if (m.via_room == m.room || m.shifted < 0 || m.shifted == m.from) return false;
  if (!S.slot(m.day, m.via_room).holds(m.shifted)) return false;
  if (is_protected(S, m.shifted, m.day)) return false;
  if (in_room_on_adjacent_day(S, m.shifted, m.day, m.room)) return false;
  return can_take_slot(S, m.to, m.day, m.via_room);
}

Move find_exchange(const ScheduleState& S, int day, int room, int from, int to) {
  Move m{day, room, from, to};
  if (to < 0 || is_assigned_on_day(S, to, day)) return m;
  for (int r2 = 0; r2 < S.rooms(); ++r2) {
    if (r2 == room) continue;
    const Slot& s = S.slot(day, r2);
    if (!s.filled()) continue;
    for (int z : {s.primary, s.secondary}) {
      const Move x{day, room, from, to, r2, z};
      if (can_move(S, x)) return x;
    }
  }
  return m;
}

static void apply_move(ScheduleState& S, const Move& m) {
  if (m.via_room < 0) {
    S.replace_occupant(m.day, m.room, m.from, m.to);
    return;
  }
  S.replace_occupant(m.day, m.via_room, m.shifted, m.to);
  S.replace_occupant(m.day, m.room, m.from, m.shifted);
}

std::vector<Move> find_chain(const ScheduleState& S, int source,
                             const std::function<bool(int)>& is_sink, int max_depth) {
  const int n = S.person_count();
  std::vector<int> depth(n, -1);
  std::vector<Move> via(n);
  std::deque<int> q;
  depth[source] = 0;
  q.push_back(source);

  while (!q.empty()) {
    const int x = q.front();
    q.pop_front();
    if (depth[x] >= max_depth) continue;

    for (int d = 0; d < S.days(); ++d) {
      const int r = S.room_on_day[x][d];
      if (r < 0 || is_protected(S, x, d)) continue;   // nothing this day that may move

      for (int y = 0; y < n; ++y) {
        if (depth[y] >= 0) continue;
        Move m{d, r, x, y};
        if (!can_move(S, m)) {
          m = find_exchange(S, d, r, x, y);
          if (m.via_room < 0) continue;
        }
        depth[y] = depth[x] + 1;
        via[y] = m;
        if (is_sink(y)) {
          std::vector<Move> chain;
          for (int cur = y; cur != source; cur = via[cur].from) chain.push_back(via[cur]);
          std::reverse(chain.begin(), chain.end());
          return chain;
        }
        q.push_back(y);
      }
    }
  }
  return {};
}

bool apply_chain(ScheduleState& S, const std::vector<Move>& chain) {
  // an exchange relocates a third person, which can invalidate a later link
  ScheduleState next = S;
  for (const Move& m : chain) {
    if (!can_move(next, m)) return false;
    apply_move(next, m);
  }
  S = std::move(next);
  return true;
}

// ---------- phase 1: secondary targets ----------

static bool give_away_secondary(ScheduleState& S, int x, int depth) {
  const int current = seniority_violation_count(S);
  const std::vector<std::function<bool(int)>> tiers = {
    [&](int y) { return is_primary(S, y) && under_cap(S, y); },
    [&](int y) { return under_cap(S, y); },
    // everyone is at cap: let a primary go over, as long as seniority holds
    [&](int y) {
      return is_primary(S, y) && seniority_violation_count(S, y, S.duty_count[y] + 1) <= current;
    },
  };
  for (const auto& sink : tiers) {
    std::vector<Move> chain = find_chain(S, x, sink, depth);
    if (chain.empty() || !apply_chain(S, chain)) continue;
    return true;
  }
  return false;
}

static bool receive_secondary(ScheduleState& S, int x, int depth) {
  // Givers: anyone above cap first, then primaries closest to their cap
  // (senior first on ties).
  std::vector<int> givers;
  for (int p = 0; p < S.person_count(); ++p)
    if (p != x && (is_primary(S, p) || S.duty_count[p] > S.cap[p])) givers.push_back(p);
  std::stable_sort(givers.begin(), givers.end(), [&](int a, int b) {
    const bool oa = S.duty_count[a] > S.cap[a], ob = S.duty_count[b] > S.cap[b];
    if (oa != ob) return oa;
    const int sa = S.duty_count[a] - S.cap[a], sb = S.duty_count[b] - S.cap[b];
    if (sa != sb) return sa > sb;
    return rank_of(S, a) < rank_of(S, b);
  });

  for (int g : givers) {
    if (S.duty_count[g] == 0) continue;
    std::vector<Move> chain = find_chain(S, g, [x](int y) { return y == x; }, depth);
    if (chain.empty() || !apply_chain(S, chain)) continue;
    return true;
  }
  return false;
}

int correct_secondary_targets(ScheduleState& S, const BalanceConfig& cfg) {
  const int target = S.config.secondary_duty_target;
  int moves = 0;
  while (moves < cfg.swap_budget) {
    bool progress = false;
    for (int x = S.primary_count; x < S.person_count() && moves < cfg.swap_budget; ++x) {
      if (S.duty_count[x] > target && give_away_secondary(S, x, cfg.chain_depth)) {
        ++moves;
        progress = true;
      } else if (S.duty_count[x] < target && receive_secondary(S, x, cfg.chain_depth)) {
        ++moves;
        progress = true;
      }
    }
    if (!progress) break;
  }
  return moves;
}

// ---------- phase 2: seniority ----------

int correct_seniority(ScheduleState& S, const BalanceConfig& cfg) {
  int moves = 0;
  while (moves < cfg.swap_budget) {
    const int current = seniority_violation_count(S);
    if (current == 0) break;

    bool applied = false;
    for (const auto& [senior, junior] : seniority_violations(S)) {
      const int after = seniority_violation_count(S, senior, S.duty_count[senior] - 1,
                                                  junior, S.duty_count[junior] + 1);
      if (after >= current) continue;
      const int j = junior;
      std::vector<Move> chain = find_chain(S, senior, [j](int y) { return y == j; }, cfg.chain_depth);
      if (chain.empty() || !apply_chain(S, chain)) continue;
      applied = true;
      break;
    }
    if (!applied) break;
    ++moves;
  }
  return moves;
}

// ---------- phase 3: primary smoothing ----------

static double primary_mean(const ScheduleState& S) {
  if (S.primary_count == 0) return 0.0;
  int sum = 0;
  for (int p = 0; p < S.primary_count; ++p) sum += S.duty_count[p];
  return (double)sum / S.primary_count;
}

int smooth_primary(ScheduleState& S, const BalanceConfig& cfg) {
  int moves = 0;
  while (moves < cfg.swap_budget) {
    const double mean = primary_mean(S);
    const int current = seniority_violation_count(S);

    std::vector<int> order = population_ids(S, Population::Primary);
    std::stable_sort(order.begin(), order.end(), [&](int a, int b) {
      return S.duty_count[a] - S.cap[a] > S.duty_count[b] - S.cap[b];
    });

    bool applied = false;
    for (int x : order) {
      const int cx = S.duty_count[x];
      const bool over_cap = cx > S.cap[x];
      if (!over_cap && cx <= mean) continue;

      auto sink = [&](int y) {
        if (!is_primary(S, y) || !under_cap(S, y)) return false;
        const int cy = S.duty_count[y];
        if (!over_cap && (cy >= mean || cx - cy < 2)) return false;
        return seniority_violation_count(S, x, cx - 1, y, cy + 1) <= current;
      };
      std::vector<Move> chain = find_chain(S, x, sink, cfg.chain_depth);
      if (chain.empty() || !apply_chain(S, chain)) continue;
      applied = true;
      break;
    }
    if (!applied) break;
    ++moves;
  }
  return moves;
}

BalanceStats balance_round(ScheduleState& S, const BalanceConfig& cfg) {
  BalanceStats st;

  st.target_moves = correct_secondary_targets(S, cfg);
  if (cfg.verbose) {
    std::cout << "[balance] targets moves=" << st.target_moves
              << " deviation=" << secondary_target_deviation(S) << "\n";
  }

  st.seniority_moves = correct_seniority(S, cfg);
  if (cfg.verbose) {
    std::cout << "[balance] seniority moves=" << st.seniority_moves
              << " violations=" << seniority_violation_count(S) << "\n";
  }

  if (cfg.smoothing) {
    st.smoothing_moves = smooth_primary(S, cfg);
    if (cfg.verbose) {
      std::cout << "[balance] smoothing moves=" << st.smoothing_moves
                << " ceiling_excess=" << primary_ceiling_excess(S) << "\n";
    }
  }
  return st;
}

}  // namespace roster
