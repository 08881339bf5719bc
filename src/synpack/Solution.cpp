// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include "synpack/Solution.h"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <set>
#include <sstream>

#include "synpack/Synergy.h"

namespace {

bool set_error(std::string* err, const std::string& msg) {
  if (err) *err = msg;
  return false;
}

} // namespace

namespace synpack {

bool BuildSolution(const Config& cfg, const std::vector<int>& order,
                   const std::vector<int>& sorted_assign, Solution* out, std::string* err) {
  if (!out) return set_error(err, "out is null");
  const int N = (int)cfg.items.size();
  const int K = (int)cfg.capacities.size();
  if ((int)order.size() != N || (int)sorted_assign.size() != N) {
    return set_error(err, "assignment size does not match item count");
  }

  Solution sol;
  sol.assignment.assign(N, -1);
  std::vector<char> seen(N, 0);
  for (int s = 0; s < N; ++s) {
    const int orig = order[s];
    if (orig < 0 || orig >= N || seen[orig]) return set_error(err, "order is not a permutation of the items");
    seen[orig] = 1;
    const int a = sorted_assign[s];
    if (a < -1 || a >= K) return set_error(err, "assignment out of range");
    sol.assignment[orig] = a;
  }

  sol.order = order;
  sol.containers.resize(K);
  for (int k = 0; k < K; ++k) sol.containers[k].capacity = cfg.capacities[k];
  for (int i = 0; i < N; ++i) {
    const int a = sol.assignment[i];
    if (a < 0) continue;
    sol.containers[a].items.push_back(cfg.items[i]);
    sol.containers[a].item_indices.push_back(i);
  }
  for (int s = 0; s < N; ++s) {
    if (sorted_assign[s] >= 0) sol.containers[sorted_assign[s]].total_weight += cfg.items[order[s]].weight;
  }

  for (auto& c : sol.containers) {
    double base = 0.0;
    for (const auto& it : c.items) base += it.value;
    c.synergy_bonus = SynergyBonus(cfg.synergies, c.items);
    c.total_value = base + c.synergy_bonus;
    sol.total_value += c.total_value;
  }
  sol.universe_count = UniverseCount(K, N);

  if (!CheckSolution(cfg, sol, err)) return false;
  *out = std::move(sol);
  return true;
}

bool CheckSolution(const Config& cfg, const Solution& sol, std::string* err) {
  const int N = (int)cfg.items.size();
  const int K = (int)cfg.capacities.size();
  if ((int)sol.containers.size() != K) return set_error(err, "container count mismatch");
  if ((int)sol.assignment.size() != N || (int)sol.order.size() != N) {
    return set_error(err, "assignment or order does not match item count");
  }

  // weights in search order, the way the search loaded each container
  std::vector<double> weights(K, 0.0);
  std::vector<int> counts(K, 0);
  std::vector<char> seen(N, 0);
  for (int s = 0; s < N; ++s) {
    const int i = sol.order[s];
    if (i < 0 || i >= N || seen[i]) return set_error(err, "order is not a permutation of the items");
    seen[i] = 1;
    const int a = sol.assignment[i];
    if (a < -1 || a >= K) return set_error(err, "assignment out of range");
    if (a < 0) continue;
    weights[a] += cfg.items[i].weight;
    ++counts[a];
  }

  std::set<int> ids;
  double total = 0.0;
  for (int k = 0; k < K; ++k) {
    const auto& c = sol.containers[k];
    double base = 0.0;
    for (const auto& it : c.items) {
      if (!ids.insert(it.id).second) {
        std::ostringstream oss; oss << "item " << it.id << " packed more than once";
        return set_error(err, oss.str());
      }
      base += it.value;
    }
    if ((int)c.items.size() != counts[k]) {
      std::ostringstream oss; oss << "container " << k << " holds " << c.items.size() << " items but "
                                  << counts[k] << " are assigned to it";
      return set_error(err, oss.str());
    }
    if (!(weights[k] <= cfg.capacities[k])) {
      std::ostringstream oss; oss << std::setprecision(17) << "container " << k << " holds " << weights[k]
                                  << " over capacity " << cfg.capacities[k];
      return set_error(err, oss.str());
    }
    if (c.total_weight != weights[k]) {
      std::ostringstream oss; oss << std::setprecision(17) << "container " << k << " weight " << c.total_weight
                                  << " != " << weights[k];
      return set_error(err, oss.str());
    }
    const double expected = base + SynergyBonus(cfg.synergies, c.items);
    if (expected != c.total_value) {
      std::ostringstream oss; oss << "container " << k << " total " << c.total_value << " != " << expected;
      return set_error(err, oss.str());
    }
    total += c.total_value;
  }
  if (total != sol.total_value) {
    std::ostringstream oss; oss << "solution total " << sol.total_value << " != sum of containers " << total;
    return set_error(err, oss.str());
  }
  return true;
}

std::string UniverseCount(int containers, int items) {
  // little-endian limbs in base 1e9
  const std::uint32_t kBase = 1000000000u;
  const std::uint64_t mult = (std::uint64_t)std::max(0, containers) + 1u;
  std::vector<std::uint32_t> limbs(1, 1u);
  for (int i = 0; i < items; ++i) {
    std::uint64_t carry = 0;
    for (auto& l : limbs) {
      const std::uint64_t cur = (std::uint64_t)l * mult + carry;
      l = (std::uint32_t)(cur % kBase);
      carry = cur / kBase;
    }
    while (carry) { limbs.push_back((std::uint32_t)(carry % kBase)); carry /= kBase; }
  }
  std::string out = std::to_string(limbs.back());
  char buf[16];
  for (int i = (int)limbs.size() - 2; i >= 0; --i) {
    std::snprintf(buf, sizeof(buf), "%09u", (unsigned)limbs[i]);
    out += buf;
  }
  return out;
}

std::string FormatThousands(const std::string& decimal) {
  std::string out;
  const int n = (int)decimal.size();
  out.reserve(n + n / 3);
  for (int i = 0; i < n; ++i) {
    if (i > 0 && (n - i) % 3 == 0) out += ',';
    out += decimal[i];
  }
  return out;
}

} // namespace synpack
