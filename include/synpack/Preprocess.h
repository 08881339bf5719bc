// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#pragma once

#include <vector>

#include "synpack/Config.h"

namespace synpack {

// Processing order for the search: item positions sorted by value/weight
// descending. Stable, so equal ratios keep input order.
std::vector<int> OrderByRatio(const std::vector<Item>& items);

// items[order[0]], items[order[1]], ...
std::vector<Item> PermuteItems(const std::vector<Item>& items, const std::vector<int>& order);

// Greedy packing over items in the given order: each item goes to the
// container with the most remaining capacity that still fits it (lowest
// index on ties), or stays unassigned (-1).
std::vector<int> GreedyAssign(const std::vector<Item>& items, const std::vector<double>& capacities);

} // namespace synpack
