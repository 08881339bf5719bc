// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include "synpack/Synergy.h"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace synpack {

double SynergyBonus(const std::vector<SynergyRule>& rules, const std::vector<std::string>& names) {
  if (rules.empty() || names.empty()) return 0.0;
  std::unordered_set<std::string> present(names.begin(), names.end());
  double bonus = 0.0;
  for (const auto& rule : rules) {
    if (rule.items.empty()) continue;
    bool all = true;
    for (const auto& n : rule.items) {
      if (!present.count(n)) { all = false; break; }
    }
    if (all) bonus += rule.bonus;
  }
  return bonus;
}

double SynergyBonus(const std::vector<SynergyRule>& rules, const std::vector<Item>& items) {
  std::vector<std::string> names; names.reserve(items.size());
  for (const auto& it : items) names.push_back(it.name);
  return SynergyBonus(rules, names);
}

double TotalSynergyBonus(const std::vector<SynergyRule>& rules) {
  double s = 0.0; for (const auto& r : rules) s += r.bonus; return s;
}

double SynergySlack(const std::vector<SynergyRule>& rules, double fraction) {
  return TotalSynergyBonus(rules) * fraction;
}

std::vector<SynergyRule> DefaultSynergyRules() {
  return {
    {{"Laptop", "Charger"}, 200.0},
    {{"Camera", "Tripod"}, 150.0},
    {{"Phone", "Power Bank"}, 100.0},
    {{"Tent", "Sleeping Bag"}, 300.0},
    {{"Stove", "Lantern"}, 150.0},
    {{"Camera", "Memory Card"}, 100.0},
    {{"Drone", "Batteries"}, 200.0},
    {{"Laptop", "Mouse", "Keyboard"}, 400.0},
    {{"Phone", "Charger", "Power Bank"}, 250.0},
  };
}

std::vector<CompiledSynergy> CompileSynergies(const std::vector<SynergyRule>& rules,
                                              const std::vector<Item>& items) {
  std::unordered_map<std::string, int> pos;
  for (int i = 0; i < (int)items.size(); ++i) pos.emplace(items[i].name, i);

  std::vector<CompiledSynergy> out; out.reserve(rules.size());
  for (const auto& r : rules) {
    CompiledSynergy cs; cs.bonus = r.bonus;
    cs.satisfiable = !r.items.empty();
    for (const auto& n : r.items) {
      auto it = pos.find(n);
      if (it == pos.end()) { cs.satisfiable = false; break; }
      cs.members.push_back(it->second);
    }
    std::sort(cs.members.begin(), cs.members.end());
    cs.members.erase(std::unique(cs.members.begin(), cs.members.end()), cs.members.end());
    out.push_back(std::move(cs));
  }
  return out;
}

double ContainerSynergyBonus(const std::vector<CompiledSynergy>& compiled,
                             const std::vector<int>& assign, int container) {
  double bonus = 0.0;
  for (const auto& cs : compiled) {
    if (!cs.satisfiable) continue;
    bool all = true;
    for (int m : cs.members) {
      if (assign[m] != container) { all = false; break; }
    }
    if (all) bonus += cs.bonus;
  }
  return bonus;
}

} // namespace synpack
