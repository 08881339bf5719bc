#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

// Synthetic multi-container JSON generator
// Usage: gen_synth_assign <count> [containers=3] [capacity=10] [output_path]
// Writes a synpack config with named items drawn from a fixed catalogue and
// the default synergy rules. Items fall into three tiers:
//   30% high   value ~ U[1500,2500), weight ~ U{1,2}
//   40% medium value ~ U[500,1500),  weight ~ U{1,3}
//   30% low    value ~ U[50,500),    weight ~ U{1,5}

struct CatalogueEntry { const char* name; const char* category; };

static const CatalogueEntry kCatalogue[] = {
  {"Laptop", "Electronics"}, {"Camera", "Electronics"}, {"Headphones", "Electronics"},
  {"Drone", "Electronics"}, {"iPad", "Electronics"}, {"Charger", "Electronics"},
  {"Power Bank", "Electronics"}, {"Tablet", "Electronics"}, {"Phone", "Electronics"},
  {"Speaker", "Electronics"}, {"Watch", "Electronics"}, {"GPS", "Electronics"},
  {"Keyboard", "Electronics"}, {"Mouse", "Electronics"}, {"Projector", "Electronics"},
  {"Jacket", "Clothing"}, {"Shoes", "Clothing"}, {"Backpack", "Clothing"},
  {"Water Bottle", "Food"}, {"Snacks", "Food"},
  {"Tent", "Tools"}, {"Sleeping Bag", "Tools"}, {"Stove", "Tools"}, {"Lantern", "Tools"},
  {"Water Filter", "Tools"}, {"Compass", "Tools"}, {"Map", "Tools"}, {"Flashlight", "Tools"},
  {"Rope", "Tools"}, {"Tripod", "Tools"}, {"Binoculars", "Tools"},
  {"Book", "Accessories"}, {"Notebook", "Accessories"}, {"Sunglasses", "Accessories"},
  {"First Aid", "Accessories"}, {"Batteries", "Accessories"}, {"Memory Card", "Accessories"},
};

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <count> [containers=3] [capacity=10] [output_path]\n";
    return 1;
  }
  int count = std::atoi(argv[1]);
  if (count <= 0) {
    std::cerr << "count must be > 0\n"; return 1;
  }
  int containers = argc >= 3 ? std::atoi(argv[2]) : 3;
  if (containers <= 0) {
    std::cerr << "containers must be > 0\n"; return 1;
  }
  double capacity = argc >= 4 ? std::atof(argv[3]) : 10.0;
  if (capacity <= 0.0) {
    std::cerr << "capacity must be > 0\n"; return 1;
  }
  std::string out_path;
  if (argc >= 5) {
    out_path = argv[4];
  } else {
    out_path = "data/synth_assign_" + std::to_string(count) + "x" + std::to_string(containers) + ".json";
  }

  std::mt19937 rng(42);
  const int catalogue_size = (int)(sizeof(kCatalogue) / sizeof(kCatalogue[0]));
  std::vector<int> picks(catalogue_size);
  for (int i = 0; i < catalogue_size; ++i) picks[i] = i;
  std::shuffle(picks.begin(), picks.end(), rng);

  std::uniform_real_distribution<double> tier(0.0, 1.0);
  std::ofstream out(out_path);
  if (!out) { std::cerr << "Failed to open output: " << out_path << "\n"; return 1; }
  out << "{\n";
  out << "  \"version\": 1,\n";
  out << "  \"items\": [\n";
  for (int i = 0; i < count; ++i) {
    const CatalogueEntry& e = kCatalogue[picks[i % catalogue_size]];
    std::string name = e.name;
    if (i >= catalogue_size) name += " #" + std::to_string(i / catalogue_size);
    int weight = 0, value = 0;
    const double t = tier(rng);
    if (t < 0.3) {
      weight = std::uniform_int_distribution<int>(1, 2)(rng);
      value = std::uniform_int_distribution<int>(1500, 2499)(rng);
    } else if (t < 0.7) {
      weight = std::uniform_int_distribution<int>(1, 3)(rng);
      value = std::uniform_int_distribution<int>(500, 1499)(rng);
    } else {
      weight = std::uniform_int_distribution<int>(1, 5)(rng);
      value = std::uniform_int_distribution<int>(50, 499)(rng);
    }
    out << "    { \"id\": " << i << ", \"name\": \"" << name << "\", \"weight\": " << weight
        << ", \"value\": " << value << ", \"category\": \"" << e.category << "\" }";
    if (i + 1 != count) out << ",";
    out << "\n";
  }
  out << "  ],\n";
  out << "  \"containers\": [";
  for (int k = 0; k < containers; ++k) {
    if (k) out << ", ";
    out << "{ \"capacity\": " << capacity << " }";
  }
  out << "],\n";
  out << "  \"synergies\": \"default\",\n";
  out << "  \"solver\": { \"synergy_slack_fraction\": 0.3, \"greedy_incumbent\": true }\n";
  out << "}\n";
  out.close();
  std::cout << "Wrote " << out_path << " (count=" << count << ", containers=" << containers
            << ", capacity=" << capacity << ")\n";
  return 0;
}
