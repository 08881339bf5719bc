// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include "synpack/Engine.h"
#include "synpack/Bound.h"
#include "synpack/Preprocess.h"
#include "synpack/Synergy.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <string>

namespace synpack {

namespace {

enum class Phase { kEnter, kBranch, kDone };

struct Frame {
  int cursor = 0;
  Phase phase = Phase::kEnter;
  double bound = 0.0;
  std::vector<int> eligible;   // containers that fit items[cursor], most room first
  size_t next = 0;             // next entry of `eligible` to try
  // state before the placement currently being explored; restored verbatim
  double saved_used = 0.0;
  double saved_acc = 0.0;
};

double assignment_total(const std::vector<Item>& items, const std::vector<CompiledSynergy>& compiled,
                        const std::vector<int>& assign, int K, std::vector<double>* scratch) {
  scratch->assign(K, 0.0);
  for (size_t i = 0; i < items.size(); ++i) if (assign[i] >= 0) (*scratch)[assign[i]] += items[i].value;
  double total = 0.0;
  for (int k = 0; k < K; ++k) total += (*scratch)[k] + ContainerSynergyBonus(compiled, assign, k);
  return total;
}

std::vector<int> eligible_containers(const std::vector<double>& caps, const std::vector<double>& used, double w) {
  std::vector<int> out;
  // test the sum itself: BuildSolution reports exactly this value as total_weight
  for (int k = 0; k < (int)caps.size(); ++k) if (used[k] + w <= caps[k]) out.push_back(k);
  std::stable_sort(out.begin(), out.end(), [&](int a, int b){ return caps[a] - used[a] > caps[b] - used[b]; });
  return out;
}

} // namespace

SolverOptions OptionsFromConfig(const Config& cfg) {
  SolverOptions opt;
  opt.synergy_slack_fraction = cfg.solver.synergy_slack_fraction;
  opt.greedy_incumbent = cfg.solver.greedy_incumbent;
  opt.exact_skip_bound = cfg.solver.exact_skip_bound;
  opt.max_nodes = cfg.solver.max_nodes;
  opt.debug = cfg.solver.debug;
  return opt;
}

bool SolveBranchAndBound(const Config& cfg, const SolverOptions& opt, SearchResult* out, std::string* err) {
  if (!out) { if (err) *err = "out is null"; return false; }
  if (!ValidateConfig(cfg, err)) return false;
  if (!std::isfinite(opt.synergy_slack_fraction) || opt.synergy_slack_fraction < 0.0) {
    if (err) *err = "synergy_slack_fraction must be >= 0"; return false;
  }

  const int N = (int)cfg.items.size();
  const int K = (int)cfg.capacities.size();
  const std::vector<double>& caps = cfg.capacities;
  const std::vector<int> order = OrderByRatio(cfg.items);
  const std::vector<Item> items = PermuteItems(cfg.items, order);
  const auto compiled = CompileSynergies(cfg.synergies, items);
  const double slack = SynergySlack(cfg.synergies, opt.synergy_slack_fraction);

  SearchStats stats;
  std::vector<int> assign(N, -1);
  std::vector<double> used(K, 0.0);
  std::vector<double> scratch;
  double acc = 0.0; // base value of the items placed on the current path

  std::vector<int> best_assign(N, -1);
  double best_total = 0.0;
  if (opt.greedy_incumbent) {
    std::vector<int> g = GreedyAssign(items, caps);
    const double gt = assignment_total(items, compiled, g, K, &scratch);
    if (gt > best_total) { best_assign = std::move(g); best_total = gt; }
    if (opt.debug) std::cout << "[greedy] incumbent=" << gt << "\n";
  }

  auto keep_going = [&]() {
    if ((opt.max_nodes > 0 && stats.nodes >= opt.max_nodes) || (opt.should_stop && opt.should_stop())) {
      stats.stopped_early = true;
      return false;
    }
    return true;
  };

  std::vector<Frame> stack;
  stack.reserve((size_t)N + 1);
  stack.emplace_back();
  while (!stack.empty()) {
    Frame& f = stack.back();
    const int c = f.cursor;

    if (f.phase == Phase::kEnter) {
      ++stats.nodes;
      stats.max_depth = std::max(stats.max_depth, c);
      if (c == N) {
        ++stats.leaves;
        const double total = assignment_total(items, compiled, assign, K, &scratch);
        if (total > best_total) {
          best_total = total; best_assign = assign; ++stats.incumbent_updates;
          if (opt.debug) std::cout << "[bnb] incumbent=" << total << " nodes=" << stats.nodes << "\n";
        }
        stack.pop_back();
        continue;
      }
      f.bound = acc + FractionalBound(items, c, PooledRemaining(caps, used)) + slack;
      if (f.bound <= best_total) { ++stats.pruned; stack.pop_back(); continue; }
      f.eligible = eligible_containers(caps, used, items[c].weight);
      f.phase = Phase::kBranch;
      continue;
    }

    if (f.phase == Phase::kBranch) {
      if (f.next > 0) {
        used[f.eligible[f.next - 1]] = f.saved_used;
        acc = f.saved_acc;
        assign[c] = -1;
      }
      if (f.next < f.eligible.size()) {
        if (!keep_going()) break;
        const int k = f.eligible[f.next++];
        f.saved_used = used[k]; f.saved_acc = acc;
        used[k] += items[c].weight; acc += items[c].value; assign[c] = k;
        Frame child; child.cursor = c + 1;
        stack.push_back(std::move(child));
        continue;
      }
      // Leaving the item out is only worth it while the bound without it still beats the incumbent.
      f.phase = Phase::kDone;
      const double skip_bound = opt.exact_skip_bound
          ? acc + FractionalBound(items, c + 1, PooledRemaining(caps, used)) + slack
          : f.bound - items[c].value;
      if (skip_bound > best_total) {
        if (!keep_going()) break;
        assign[c] = -1;
        Frame child; child.cursor = c + 1;
        stack.push_back(std::move(child));
      } else {
        ++stats.skipped_unassigned;
      }
      continue;
    }

    stack.pop_back();
  }

  if (opt.debug) {
    std::cout << "[bnb] best=" << best_total << " nodes=" << stats.nodes << " leaves=" << stats.leaves
              << " pruned=" << stats.pruned << " skipped=" << stats.skipped_unassigned
              << " depth=" << stats.max_depth << (stats.stopped_early ? " stopped_early" : "") << "\n";
  }

  out->order = order;
  out->best_assign = std::move(best_assign);
  out->best_total = best_total;
  out->stats = stats;
  return true;
}

bool Solve(const Config& cfg, const SolverOptions& opt, Solution* out, std::string* err, SearchStats* stats) {
  if (!out) { if (err) *err = "out is null"; return false; }
  auto start = std::chrono::high_resolution_clock::now();

  SearchResult sr;
  if (!SolveBranchAndBound(cfg, opt, &sr, err)) return false;
  Solution sol;
  if (!BuildSolution(cfg, sr.order, sr.best_assign, &sol, err)) return false;

  auto end = std::chrono::high_resolution_clock::now();
  sol.runtime_ms = std::chrono::duration<double, std::milli>(end - start).count();
  if (opt.debug) {
    std::cout << "[aggregate] containers=" << sol.containers.size() << " total=" << sol.total_value
              << " universe_digits=" << sol.universe_count.size() << " time=" << sol.runtime_ms << "ms\n";
  }
  if (stats) *stats = sr.stats;
  *out = std::move(sol);
  return true;
}

} // namespace synpack
