// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#pragma once

#include <vector>

#include "synpack/Config.h"

namespace synpack {

// Sum over containers of max(0, capacity - used). Collapses the
// per-container limits into one number for the relaxation below.
double PooledRemaining(const std::vector<double>& capacities, const std::vector<double>& used);

// Dantzig bound over items[cursor..N) (already sorted by value/weight
// descending) for a single knapsack of size `pooled`: whole items while they
// fit, a fractional share of the first one that does not, then stop.
double FractionalBound(const std::vector<Item>& items, int cursor, double pooled);

} // namespace synpack
