// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include "synpack/Config.h"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

#include <picojson.h>

#include "synpack/Synergy.h"

namespace synpack {

static bool get_string(const picojson::object& o, const char* key, std::string* out) {
  auto it = o.find(key); if (it == o.end()) return false; if (!it->second.is<std::string>()) return false; *out = it->second.get<std::string>(); return true;
}
// Integral and within int range; anything else is left untouched and reported as false.
static bool get_int(const picojson::object& o, const char* key, int* out) {
  auto it = o.find(key); if (it == o.end()) return false; if (!it->second.is<double>()) return false;
  const double d = it->second.get<double>();
  if (std::floor(d) != d || d < (double)std::numeric_limits<int>::min() || d > (double)std::numeric_limits<int>::max()) return false;
  *out = (int)d; return true;
}
static bool get_double(const picojson::object& o, const char* key, double* out) {
  auto it = o.find(key); if (it == o.end()) return false; if (!it->second.is<double>()) return false; *out = it->second.get<double>(); return true;
}
static bool get_bool(const picojson::object& o, const char* key, bool* out) {
  auto it = o.find(key); if (it == o.end()) return false;
  if (it->second.is<bool>()) { *out = it->second.get<bool>(); return true; }
  if (it->second.is<double>()) { *out = it->second.get<double>() != 0.0; return true; }
  return false;
}

static bool parse_items(const picojson::object& root, std::vector<Item>* items, std::string* err) {
  auto it = root.find("items");
  if (it == root.end()) { if (err) *err = "missing 'items'"; return false; }
  if (!it->second.is<picojson::array>()) { if (err) *err = "'items' must be an array"; return false; }
  const auto& arr = it->second.get<picojson::array>();
  items->clear(); items->reserve(arr.size());
  for (std::size_t i = 0; i < arr.size(); ++i) {
    if (!arr[i].is<picojson::object>()) { if (err) *err = "item entry " + std::to_string(i) + " not an object"; return false; }
    const auto& io = arr[i].get<picojson::object>();
    Item item;
    item.id = (int)i;
    if (io.count("id") && !get_int(io, "id", &item.id)) { if (err) *err = "items[" + std::to_string(i) + "].id must be an integer in int range"; return false; }
    if (!get_string(io, "name", &item.name)) { if (err) *err = "items[" + std::to_string(i) + "].name missing or invalid"; return false; }
    if (!get_double(io, "weight", &item.weight)) { if (err) *err = "items[" + std::to_string(i) + "].weight missing or invalid"; return false; }
    if (!get_double(io, "value", &item.value)) { if (err) *err = "items[" + std::to_string(i) + "].value missing or invalid"; return false; }
    (void)get_string(io, "category", &item.category);
    items->push_back(std::move(item));
  }
  return true;
}

// Accepts "containers": [{"capacity": c}, ...] or [c, ...], or "capacities": [c, ...].
static bool parse_containers(const picojson::object& root, std::vector<double>* caps, std::string* err) {
  caps->clear();
  const char* key = "containers";
  auto it = root.find(key);
  if (it == root.end()) { key = "capacities"; it = root.find(key); }
  if (it == root.end()) return true; // empty; rejected by ValidateConfig
  if (!it->second.is<picojson::array>()) { if (err) *err = std::string("'") + key + "' must be an array"; return false; }
  const auto& arr = it->second.get<picojson::array>();
  caps->reserve(arr.size());
  for (std::size_t i = 0; i < arr.size(); ++i) {
    double cap = 0.0;
    if (arr[i].is<double>()) {
      cap = arr[i].get<double>();
    } else if (arr[i].is<picojson::object>()) {
      if (!get_double(arr[i].get<picojson::object>(), "capacity", &cap)) {
        if (err) *err = std::string(key) + "[" + std::to_string(i) + "].capacity missing or invalid"; return false;
      }
    } else {
      if (err) *err = std::string(key) + "[" + std::to_string(i) + "] must be a number or object"; return false;
    }
    caps->push_back(cap);
  }
  return true;
}

static bool parse_synergies(const picojson::object& root, std::vector<SynergyRule>* rules, std::string* err) {
  rules->clear();
  auto it = root.find("synergies");
  if (it == root.end() || it->second.is<picojson::null>()) return true;
  if (it->second.is<std::string>()) {
    if (it->second.get<std::string>() == "default") { *rules = DefaultSynergyRules(); return true; }
    if (err) *err = "synergies: unknown preset '" + it->second.get<std::string>() + "'";
    return false;
  }
  if (!it->second.is<picojson::array>()) { if (err) *err = "'synergies' must be an array or \"default\""; return false; }
  const auto& arr = it->second.get<picojson::array>();
  rules->reserve(arr.size());
  for (std::size_t i = 0; i < arr.size(); ++i) {
    if (!arr[i].is<picojson::object>()) { if (err) *err = "synergy entry " + std::to_string(i) + " not an object"; return false; }
    const auto& so = arr[i].get<picojson::object>();
    SynergyRule rule;
    auto names = so.find("items");
    if (names == so.end() || !names->second.is<picojson::array>()) { if (err) *err = "synergies[" + std::to_string(i) + "].items missing or invalid"; return false; }
    for (const auto& n : names->second.get<picojson::array>()) {
      if (!n.is<std::string>()) { if (err) *err = "synergies[" + std::to_string(i) + "].items must be strings"; return false; }
      rule.items.push_back(n.get<std::string>());
    }
    if (!get_double(so, "bonus", &rule.bonus)) { if (err) *err = "synergies[" + std::to_string(i) + "].bonus missing or invalid"; return false; }
    rules->push_back(std::move(rule));
  }
  return true;
}

static bool parse_solver(const picojson::object& root, SolverSpec* solver, std::string* err) {
  auto it = root.find("solver");
  if (it == root.end()) return true;
  if (!it->second.is<picojson::object>()) { if (err) *err = "'solver' must be an object"; return false; }
  const auto& obj = it->second.get<picojson::object>();
  (void)get_double(obj, "synergy_slack_fraction", &solver->synergy_slack_fraction);
  (void)get_bool(obj, "greedy_incumbent", &solver->greedy_incumbent);
  (void)get_bool(obj, "exact_skip_bound", &solver->exact_skip_bound);
  (void)get_bool(obj, "debug", &solver->debug);
  double nodes = 0.0;
  if (get_double(obj, "max_nodes", &nodes)) {
    if (nodes < 0) { if (err) *err = "solver.max_nodes must be >= 0"; return false; }
    // 2^64 is the first double past the uint64 range
    if (std::floor(nodes) != nodes || nodes >= 18446744073709551616.0) { if (err) *err = "solver.max_nodes must be an integer below 2^64"; return false; }
    solver->max_nodes = (std::uint64_t)nodes;
  }
  return true;
}

static bool parse_root(const picojson::object& root, Config* out, std::string* err) {
  Config cfg;
  int version = 1;
  if (root.count("version") && !get_int(root, "version", &version)) { if (err) *err = "'version' must be an integer"; return false; }
  cfg.version = version;
  if (!parse_items(root, &cfg.items, err)) return false;
  if (!parse_containers(root, &cfg.capacities, err)) return false;
  if (!parse_synergies(root, &cfg.synergies, err)) return false;
  if (!parse_solver(root, &cfg.solver, err)) return false;

  if (!ValidateConfig(cfg, err)) return false;
  *out = std::move(cfg);
  return true;
}

bool LoadConfigFromJsonString(const std::string& json, Config* out, std::string* err) {
  if (!out) { if (err) *err = "out is null"; return false; }
  picojson::value v; std::string perr = picojson::parse(v, json);
  if (!perr.empty()) { if (err) *err = perr; return false; }
  if (!v.is<picojson::object>()) { if (err) *err = "invalid JSON root"; return false; }
  return parse_root(v.get<picojson::object>(), out, err);
}

bool LoadConfigFromFile(const std::string& path, Config* out, std::string* err) {
  if (!out) { if (err) *err = "out is null"; return false; }
  std::ifstream in(path);
  if (!in) { if (err) *err = "failed to read file: " + path; return false; }
  std::ostringstream ss; ss << in.rdbuf();
  return LoadConfigFromJsonString(ss.str(), out, err);
}

} // namespace synpack
