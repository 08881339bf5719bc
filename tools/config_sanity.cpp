#include <iostream>
#include <string>
#include "synpack/Config.h"
#include "synpack/Solution.h"
#include "synpack/Synergy.h"

int main(int argc, char** argv) {
  std::string path = argc > 1 ? argv[1] : std::string("docs/example_packing.json");
  synpack::Config cfg; std::string err;
  if (!synpack::LoadConfigFromFile(path, &cfg, &err)) {
    std::cerr << "Failed to load config: " << err << "\n";
    return 1;
  }
  std::cout << "Loaded config v" << cfg.version << ", items=" << cfg.items.size()
            << ", containers=" << cfg.capacities.size() << ", synergies=" << cfg.synergies.size() << "\n";
  std::cout << "capacities=[";
  for (size_t i = 0; i < cfg.capacities.size(); ++i) {
    if (i) std::cout << ",";
    std::cout << cfg.capacities[i];
  }
  std::cout << "] slack=" << synpack::SynergySlack(cfg.synergies, cfg.solver.synergy_slack_fraction)
            << " greedy_incumbent=" << (cfg.solver.greedy_incumbent ? "true" : "false") << "\n";
  std::cout << "universes=" << synpack::FormatThousands(
      synpack::UniverseCount((int)cfg.capacities.size(), (int)cfg.items.size())) << "\n";
  return 0;
}
