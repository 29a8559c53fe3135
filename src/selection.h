// selection.h
#pragma once
#include <vector>
#include <random>

namespace roster {

// Uniform pick among the pool members sharing the smallest key; -1 on empty pool.
// Key must be totally ordered (ints, tuples of ints).
template <class KeyFn, class Rng>
int pick_min_key(const std::vector<int>& pool, KeyFn key, Rng& rng) {
  if (pool.empty()) return -1;
  std::vector<int> ties;
  auto best = key(pool.front());
  for (int p : pool) {
    auto k = key(p);
    if (k < best) { best = k; ties.clear(); }
    if (!(best < k)) ties.push_back(p);
  }
  if (ties.size() == 1) return ties.front();
  std::uniform_int_distribution<std::size_t> pick(0, ties.size() - 1);
  return ties[pick(rng)];
}

}  // namespace roster
