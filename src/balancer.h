// balancer.h
#pragma once
#include "schedule_state.h"
#include <functional>
#include <vector>

namespace roster {

struct BalanceConfig {
  int swap_budget = 100;   // moves per phase
  int chain_depth = 3;     // longest giver -> ... -> receiver chain
  bool smoothing = true;
  bool verbose = false;
};

// One seat handed from one person to another. With via_room set, `to` is
// barred from `room` by the room rule and sits in via_room instead, while that
// room's occupant `shifted` crosses over into `room` (same day, same count).
struct Move {
  int day = 0;
  int room = 0;
  int from = -1;
  int to = -1;
  int via_room = -1;
  int shifted = -1;
};

struct BalanceStats {
  int target_moves = 0;
  int seniority_moves = 0;
  int smoothing_moves = 0;
  int total() const { return target_moves + seniority_moves + smoothing_moves; }
};

// The shared legality rule: the seat holds `from`, `from` is not protected on
// that day, `to` is free that day and not in that room on an adjacent day.
// For an exchange the room rule is checked for `to` in via_room and for
// `shifted` in `room`, and `shifted` must not be protected either.
// Caps are the caller's business.
bool can_move(const ScheduleState& S, const Move& m);

// Legal exchange handing (day, room) from `from` to `to`; via_room < 0 if none.
Move find_exchange(const ScheduleState& S, int day, int room, int from, int to);

// Shortest chain of legal moves from `source` to the first person accepted by
// `is_sink`. Intermediaries gain one seat and give another, so only the two
// ends change duty counts. Empty when none exists within max_depth moves.
std::vector<Move> find_chain(const ScheduleState& S, int source,
                             const std::function<bool(int)>& is_sink, int max_depth);

// Applies the chain only if every move is still legal once the earlier ones
// have been made; returns false and leaves S untouched otherwise.
bool apply_chain(ScheduleState& S, const std::vector<Move>& chain);

// ---- phases, each bounded by cfg.swap_budget ----
int correct_secondary_targets(ScheduleState& S, const BalanceConfig& cfg);
int correct_seniority(ScheduleState& S, const BalanceConfig& cfg);
int smooth_primary(ScheduleState& S, const BalanceConfig& cfg);

// One round: targets, seniority, then (optionally) smoothing.
BalanceStats balance_round(ScheduleState& S, const BalanceConfig& cfg);

}  // namespace roster
