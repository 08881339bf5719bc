// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include "synpack/Preprocess.h"

#include <algorithm>
#include <numeric>

namespace synpack {

std::vector<int> OrderByRatio(const std::vector<Item>& items) {
  const int N = (int)items.size();
  std::vector<int> order(N); std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](int i, int j){
    return items[i].value / items[i].weight > items[j].value / items[j].weight;
  });
  return order;
}

std::vector<Item> PermuteItems(const std::vector<Item>& items, const std::vector<int>& order) {
  std::vector<Item> out; out.reserve(order.size());
  for (int idx : order) out.push_back(items[idx]);
  return out;
}

std::vector<int> GreedyAssign(const std::vector<Item>& items, const std::vector<double>& capacities) {
  const int K = (int)capacities.size();
  std::vector<int> assign(items.size(), -1);
  std::vector<double> used(K, 0.0);
  for (size_t i = 0; i < items.size(); ++i) {
    int best = -1; double bestRemaining = -1.0;
    for (int k = 0; k < K; ++k) {
      const double remaining = capacities[k] - used[k];
      if (used[k] + items[i].weight <= capacities[k] && remaining > bestRemaining) { best = k; bestRemaining = remaining; }
    }
    if (best >= 0) { assign[i] = best; used[best] += items[i].weight; }
  }
  return assign;
}

} // namespace synpack
