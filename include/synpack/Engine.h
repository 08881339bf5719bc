// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "synpack/Config.h"
#include "synpack/Solution.h"

namespace synpack {

struct SolverOptions {
  double synergy_slack_fraction = 0.3; // see SolverSpec
  bool greedy_incumbent = false;
  bool exact_skip_bound = false;
  std::uint64_t max_nodes = 0;         // 0 = unlimited
  std::function<bool()> should_stop;   // polled before every branch attempt
  bool debug = false;                  // enable lightweight debug logs
};

// Copies the solver block of a loaded config.
SolverOptions OptionsFromConfig(const Config& cfg);

struct SearchStats {
  std::uint64_t nodes = 0;              // nodes entered, leaves included
  std::uint64_t leaves = 0;
  std::uint64_t pruned = 0;             // nodes cut by bound <= incumbent
  std::uint64_t skipped_unassigned = 0; // "leave out" branches not worth trying
  std::uint64_t incumbent_updates = 0;
  int max_depth = 0;
  bool stopped_early = false;           // budget or should_stop ended the search
};

struct SearchResult {
  std::vector<int> order;        // sorted position -> input item index
  std::vector<int> best_assign;  // sorted order; container index or -1
  double best_total = 0.0;       // base value + synergy of best_assign
  SearchStats stats;
};

// Depth-first branch-and-bound over items in value/weight order. Each item is
// tried in every container that still fits it (most remaining capacity
// first), then left out. A node is cut when
//   placed value + fractional bound of the rest + synergy slack <= incumbent.
// The "left out" branch runs only while node bound - item value > incumbent,
// or, with exact_skip_bound, while the bound recomputed without the item is.
// With synergy_slack_fraction >= 1 and exact_skip_bound the search is exact.
// Runs on an explicit stack, so depth is not limited by the call stack.
// Returns false when cfg does not validate.
bool SolveBranchAndBound(const Config& cfg, const SolverOptions& opt, SearchResult* out, std::string* err);

// Validate, search, aggregate and time. `stats` is optional.
bool Solve(const Config& cfg, const SolverOptions& opt, Solution* out, std::string* err,
           SearchStats* stats = nullptr);

} // namespace synpack
