#include "synpack/SolutionWriter.h"

#include <fstream>
#include <iomanip>
#include <string>

#include <picojson.h>

namespace synpack {

// RFC 4180 field: wrapped in quotes, embedded quotes doubled
static std::string csv_quote(const std::string& field) {
  std::string out = "\"";
  for (char ch : field) {
    if (ch == '"') out += '"';
    out += ch;
  }
  out += '"';
  return out;
}

static picojson::value item_json(const Item& it) {
  picojson::object o;
  o["id"] = picojson::value((double)it.id);
  o["name"] = picojson::value(it.name);
  o["weight"] = picojson::value(it.weight);
  o["value"] = picojson::value(it.value);
  o["category"] = picojson::value(it.category);
  return picojson::value(o);
}

std::string WriteSolutionJson(const Config& cfg, const Solution& sol, bool pretty) {
  picojson::array containers;
  for (const auto& c : sol.containers) {
    picojson::array items;
    for (const auto& it : c.items) items.push_back(item_json(it));
    picojson::object co;
    co["items"] = picojson::value(items);
    co["totalWeight"] = picojson::value(c.total_weight);
    co["totalValue"] = picojson::value(c.total_value);
    co["synergyBonus"] = picojson::value(c.synergy_bonus);
    co["capacity"] = picojson::value(c.capacity);
    containers.push_back(picojson::value(co));
  }

  // assignment keyed by item id so consumers need not know input positions
  picojson::array assignment;
  for (size_t i = 0; i < sol.assignment.size() && i < cfg.items.size(); ++i) {
    picojson::object ao;
    ao["id"] = picojson::value((double)cfg.items[i].id);
    ao["container"] = picojson::value((double)sol.assignment[i]);
    assignment.push_back(picojson::value(ao));
  }

  picojson::object root;
  root["containers"] = picojson::value(containers);
  root["totalValue"] = picojson::value(sol.total_value);
  root["universeCount"] = picojson::value(sol.universe_count);
  root["runtimeMs"] = picojson::value(sol.runtime_ms);
  root["assignment"] = picojson::value(assignment);
  return picojson::value(root).serialize(pretty);
}

bool WriteSolutionCsv(const Solution& sol, const std::string& filename, std::string* err) {
  std::ofstream out(filename);
  if (!out) { if (err) *err = "failed to open output: " + filename; return false; }
  out << "ID,Items,Weight,Capacity,Synergy,Value\n";
  for (size_t k = 0; k < sol.containers.size(); ++k) {
    const auto& c = sol.containers[k];
    std::string names;
    for (size_t j = 0; j < c.items.size(); ++j) {
      if (j) names += ";";
      names += c.items[j].name;
    }
    out << (k + 1) << "," << csv_quote(names) << "," << std::fixed << std::setprecision(2) << c.total_weight << ","
        << c.capacity << "," << c.synergy_bonus << "," << c.total_value << "\n";
  }
  out.close();
  if (!out) { if (err) *err = "failed to write output: " + filename; return false; }
  return true;
}

} // namespace synpack
