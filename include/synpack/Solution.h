// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <vector>

#include "synpack/Config.h"

namespace synpack {

// Per-container summary of a packing.
struct ContainerResult {
  std::vector<Item> items;          // in input order
  std::vector<int> item_indices;    // positions in Config::items
  double total_weight = 0.0;
  double total_value = 0.0;         // base values + synergy_bonus
  double synergy_bonus = 0.0;
  double capacity = 0.0;
};

struct Solution {
  std::vector<ContainerResult> containers;
  double total_value = 0.0;
  std::string universe_count;       // (K+1)^N, exact decimal
  double runtime_ms = 0.0;          // filled by Solve(), not by BuildSolution()
  std::vector<int> assignment;      // input item index -> container, -1 = unassigned
  std::vector<int> order;           // search order; container weights are summed in it
};

// Turn a search assignment back into per-container results.
// `order[s]` is the input index of the item at sorted position s and
// `sorted_assign[s]` its container (-1 when left out). Container weights
// are summed in sorted order, the order the search loaded them in, so the
// reported weight is the one the search checked against the capacity.
// Fails when the assignment is malformed or the result would break a
// packing invariant.
bool BuildSolution(const Config& cfg, const std::vector<int>& order,
                   const std::vector<int>& sorted_assign, Solution* out, std::string* err);

// Re-derives every aggregate of `sol` from cfg and reports the first
// mismatch: duplicate item, container contents that disagree with the
// assignment, weight over capacity (exact <=, summed along sol.order), or
// totals that do not add up.
bool CheckSolution(const Config& cfg, const Solution& sol, std::string* err);

// (containers + 1) ^ items as an exact decimal string.
std::string UniverseCount(int containers, int items);

// "1234567" -> "1,234,567"
std::string FormatThousands(const std::string& decimal);

} // namespace synpack
