#include "synpack/Config.h"
#include "synpack/Engine.h"
#include "synpack/InputModule.h"
#include "synpack/Solution.h"
#include "synpack/SolutionWriter.h"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

static int usage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " <config.json> [solution.json] [--items items.csv] [--csv out.csv] [--debug]\n";
    return 1;
}

int main(int argc, char *argv[])
{
    std::string config_path, json_out, csv_out, items_csv;
    bool debug = false;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--debug") debug = true;
        else if (a == "--csv" && i + 1 < argc) csv_out = argv[++i];
        else if (a == "--items" && i + 1 < argc) items_csv = argv[++i];
        else if (!a.empty() && a[0] == '-') return usage(argv[0]);
        else if (config_path.empty()) config_path = a;
        else if (json_out.empty()) json_out = a;
        else return usage(argv[0]);
    }
    if (config_path.empty()) return usage(argv[0]);

    synpack::Config cfg;
    std::string err;
    if (!synpack::LoadConfigFromFile(config_path, &cfg, &err))
    {
        std::cerr << "Failed to load config: " << err << "\n";
        return 1;
    }
    if (!items_csv.empty())
    {
        if (!synpack::LoadItemsFromCsv(items_csv, &cfg.items, &err))
        {
            std::cerr << "Failed to load items: " << err << "\n";
            return 1;
        }
    }
    std::cout << "Loaded items: " << cfg.items.size() << ", containers: " << cfg.capacities.size()
              << ", synergy rules: " << cfg.synergies.size() << std::endl;

    synpack::SolverOptions opt = synpack::OptionsFromConfig(cfg);
    opt.debug = opt.debug || debug;

    synpack::Solution sol;
    synpack::SearchStats stats;
    if (!synpack::Solve(cfg, opt, &sol, &err, &stats))
    {
        std::cerr << "Solve failed: " << err << "\n";
        return 1;
    }

    for (size_t k = 0; k < sol.containers.size(); ++k)
    {
        const auto &c = sol.containers[k];
        std::cout << "📦 Container " << (k + 1) << ": " << std::fixed << std::setprecision(2)
                  << c.total_weight << "/" << c.capacity << " weight, value " << c.total_value;
        if (c.synergy_bonus > 0.0) std::cout << " (synergy +" << c.synergy_bonus << ")";
        std::cout << "\n   ";
        for (const auto &it : c.items) std::cout << it.name << " ";
        std::cout << "\n";
    }

    // Summary
    std::cout << "✅ Total value: " << std::fixed << std::setprecision(2) << sol.total_value << std::endl;
    std::cout << "🌌 Universes: " << synpack::FormatThousands(sol.universe_count) << std::endl;
    std::cout << "🔎 Nodes: " << stats.nodes << ", pruned: " << stats.pruned
              << (stats.stopped_early ? " (stopped early)" : "") << std::endl;
    std::cout << "⏱  Runtime: " << std::setprecision(3) << sol.runtime_ms << " ms" << std::endl;

    if (!json_out.empty())
    {
        std::ofstream out(json_out);
        if (!out)
        {
            std::cerr << "Failed to open output: " << json_out << "\n";
            return 1;
        }
        out << synpack::WriteSolutionJson(cfg, sol) << "\n";
        std::cout << "📄 Wrote " << json_out << std::endl;
    }
    if (!csv_out.empty())
    {
        if (!synpack::WriteSolutionCsv(sol, csv_out, &err))
        {
            std::cerr << err << "\n";
            return 1;
        }
        std::cout << "📄 Wrote " << csv_out << std::endl;
    }

    return 0;
}
