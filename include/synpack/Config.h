// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace synpack {

struct Item {
  int id = 0;                        // unique per problem
  std::string name;                  // synergy matching key, unique per problem
  double weight = 0.0;               // > 0
  double value = 0.0;                // > 0
  std::string category = "Other";    // descriptive only
};

// Bonus awarded once per container when every named item is packed there.
struct SynergyRule {
  std::vector<std::string> items;
  double bonus = 0.0;
};

struct SolverSpec {
  double synergy_slack_fraction = 0.3; // share of total rule bonus added to every node bound
  bool greedy_incumbent = false;       // seed the incumbent with the greedy packing
  bool exact_skip_bound = false;       // re-bound the "leave out" branch instead of bound - value
  std::uint64_t max_nodes = 0;         // 0 = unlimited
  bool debug = false;
};

struct Config {
  int version = 1;                       // schema version
  std::vector<Item> items;
  std::vector<double> capacities;        // one entry per container
  std::vector<SynergyRule> synergies;
  SolverSpec solver;
};

// Loaders parse with picojson and run ValidateConfig before returning.
bool LoadConfigFromJsonString(const std::string& json, Config* out, std::string* err);
bool LoadConfigFromFile(const std::string& path, Config* out, std::string* err);

// Structural validations independent of parsing backend.
bool ValidateConfig(const Config& cfg, std::string* err);

} // namespace synpack
