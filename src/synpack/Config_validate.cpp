// Config_validate.cpp - Validation logic for synpack::Config
#include "synpack/Config.h"
#include <cmath>
#include <set>
#include <sstream>

namespace synpack {

bool ValidateConfig(const Config& cfg, std::string* err) {
  // A zero-slot search is a configuration error, not an empty result
  if (cfg.capacities.empty()) {
    if (err) *err = "no containers provided (at least one capacity is required)";
    return false;
  }

  for (size_t k = 0; k < cfg.capacities.size(); ++k) {
    const double cap = cfg.capacities[k];
    if (!std::isfinite(cap) || cap <= 0.0) {
      if (err) {
        std::ostringstream oss;
        oss << "container " << k << " has capacity " << cap << " (must be > 0)";
        *err = oss.str();
      }
      return false;
    }
  }

  // Items: empty list is valid; weights and values divide the bound, so they must be positive
  std::set<int> ids;
  std::set<std::string> names;
  for (size_t i = 0; i < cfg.items.size(); ++i) {
    const Item& it = cfg.items[i];
    if (!std::isfinite(it.weight) || it.weight <= 0.0) {
      if (err) {
        std::ostringstream oss;
        oss << "item '" << it.name << "' (index " << i << ") has weight " << it.weight << " (must be > 0)";
        *err = oss.str();
      }
      return false;
    }
    if (!std::isfinite(it.value) || it.value <= 0.0) {
      if (err) {
        std::ostringstream oss;
        oss << "item '" << it.name << "' (index " << i << ") has value " << it.value << " (must be > 0)";
        *err = oss.str();
      }
      return false;
    }
    if (!ids.insert(it.id).second) {
      if (err) {
        std::ostringstream oss;
        oss << "duplicate item id " << it.id;
        *err = oss.str();
      }
      return false;
    }
    if (!names.insert(it.name).second) {
      if (err) *err = "duplicate item name '" + it.name + "'";
      return false;
    }
  }

  for (size_t r = 0; r < cfg.synergies.size(); ++r) {
    const SynergyRule& rule = cfg.synergies[r];
    if (rule.items.empty()) {
      if (err) {
        std::ostringstream oss;
        oss << "synergy rule " << r << " names no items";
        *err = oss.str();
      }
      return false;
    }
    if (!std::isfinite(rule.bonus) || rule.bonus < 0.0) {
      if (err) {
        std::ostringstream oss;
        oss << "synergy rule " << r << " has bonus " << rule.bonus << " (must be >= 0)";
        *err = oss.str();
      }
      return false;
    }
  }

  const double slack = cfg.solver.synergy_slack_fraction;
  if (!std::isfinite(slack) || slack < 0.0) {
    if (err) *err = "solver.synergy_slack_fraction must be >= 0";
    return false;
  }

  return true;
}

} // namespace synpack
