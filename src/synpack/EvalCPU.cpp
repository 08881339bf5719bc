// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include "synpack/Eval.h"

#include <algorithm>

#include "synpack/Synergy.h"

namespace synpack {

static bool check_candidate(const Config& cfg, const CandidateAssign& cand, std::string* err) {
  if (cand.assign.size() != cfg.items.size()) { if (err) *err = "candidate size mismatch"; return false; }
  const int K = (int)cfg.capacities.size();
  for (int a : cand.assign) {
    if (a < -1 || a >= K) { if (err) *err = "assignment out of range"; return false; }
  }
  return true;
}

bool EvaluateAssignment(const Config& cfg, const CandidateAssign& cand, EvalResult* out, std::string* err) {
  if (!out) { if (err) *err = "out is null"; return false; }
  if (!check_candidate(cfg, cand, err)) return false;
  const int n = (int)cfg.items.size();
  const int K = (int)cfg.capacities.size();

  *out = EvalResult();
  out->container_weights.assign(K, 0.0);
  out->container_values.assign(K, 0.0);
  out->capacity_violations.assign(K, 0.0);
  for (int i = 0; i < n; ++i) {
    int a = cand.assign[i];
    if (a < 0) continue;
    out->container_weights[a] += cfg.items[i].weight;
    out->container_values[a] += cfg.items[i].value;
    out->base_value += cfg.items[i].value;
  }

  auto compiled = CompileSynergies(cfg.synergies, cfg.items);
  for (int k = 0; k < K; ++k) {
    const double bonus = ContainerSynergyBonus(compiled, cand.assign, k);
    out->container_values[k] += bonus;
    out->synergy += bonus;
    const double viol = std::max(0.0, out->container_weights[k] - cfg.capacities[k]);
    out->capacity_violations[k] = viol;
    if (viol > 0.0) out->feasible = false;
  }
  out->total = out->base_value + out->synergy;
  return true;
}

} // namespace synpack
