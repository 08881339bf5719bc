// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <vector>

#include "synpack/Config.h"

namespace synpack {

// Sum of the bonuses of every rule whose names are all present in `names`.
// Each rule contributes at most once, however often a name repeats.
double SynergyBonus(const std::vector<SynergyRule>& rules, const std::vector<std::string>& names);
double SynergyBonus(const std::vector<SynergyRule>& rules, const std::vector<Item>& items);

double TotalSynergyBonus(const std::vector<SynergyRule>& rules);

// Constant allowance added to every node bound: fraction * TotalSynergyBonus.
double SynergySlack(const std::vector<SynergyRule>& rules, double fraction);

// Rule set shipped with the packing playground.
std::vector<SynergyRule> DefaultSynergyRules();

// A rule resolved against one item list. `members` holds positions into that
// list; a rule naming an item the list does not contain can never fire.
struct CompiledSynergy {
  std::vector<int> members;
  double bonus = 0.0;
  bool satisfiable = true;
};

std::vector<CompiledSynergy> CompileSynergies(const std::vector<SynergyRule>& rules,
                                              const std::vector<Item>& items);

// Bonus earned by `container` under `assign` (assign[i] == container index of item i, or -1).
double ContainerSynergyBonus(const std::vector<CompiledSynergy>& compiled,
                             const std::vector<int>& assign, int container);

} // namespace synpack
