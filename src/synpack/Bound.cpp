// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include "synpack/Bound.h"

#include <algorithm>

namespace synpack {

double PooledRemaining(const std::vector<double>& capacities, const std::vector<double>& used) {
  double s = 0.0;
  for (size_t k = 0; k < capacities.size(); ++k) s += std::max(0.0, capacities[k] - used[k]);
  return s;
}

double FractionalBound(const std::vector<Item>& items, int cursor, double pooled) {
  double bound = 0.0;
  double rem = pooled;
  for (int i = std::max(0, cursor); i < (int)items.size() && rem > 0.0; ++i) {
    const Item& it = items[i];
    if (it.weight <= rem) {
      bound += it.value;
      rem -= it.weight;
    } else {
      bound += it.value * (rem / it.weight);
      break;
    }
  }
  return bound;
}

} // namespace synpack
