// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <vector>

#include "synpack/Config.h"

namespace synpack {

struct EvalResult {
  double base_value = 0.0;                    // sum of packed item values
  double synergy = 0.0;                       // sum of per-container synergy bonuses
  double total = 0.0;                         // base_value + synergy
  bool feasible = true;                       // no container over capacity
  std::vector<double> container_weights;      // size K
  std::vector<double> container_values;       // size K, base + synergy
  std::vector<double> capacity_violations;    // size K, max(0, weight - capacity)
};

struct CandidateAssign {
  // size == N items; -1 means unassigned, otherwise [0..K-1]
  std::vector<int> assign;
};

// Score a candidate against cfg.items (original order) and cfg.capacities.
// Fails on size mismatch or out-of-range container index; over-capacity
// candidates evaluate normally with feasible == false.
bool EvaluateAssignment(const Config& cfg, const CandidateAssign& cand, EvalResult* out, std::string* err);

} // namespace synpack
