// test_branch_and_bound.cpp - Search behaviour of synpack::SolveBranchAndBound / Solve
#include <catch2/catch_all.hpp>
#include "synpack/Engine.h"
#include "synpack/Eval.h"
#include "synpack/Synergy.h"
#include <algorithm>
#include <random>
#include <string>
#include <vector>

using namespace synpack;

// Helper to build an item with a unique name derived from its id
Item makeItem(int id, double weight, double value, const std::string& name = "") {
    Item it;
    it.id = id;
    it.name = name.empty() ? "item" + std::to_string(id) : name;
    it.weight = weight;
    it.value = value;
    return it;
}

Config makeConfig(const std::vector<Item>& items, const std::vector<double>& caps,
                  const std::vector<SynergyRule>& rules = {}) {
    Config cfg;
    cfg.items = items;
    cfg.capacities = caps;
    cfg.synergies = rules;
    return cfg;
}

// Slack covering every bonus plus a re-bounded "leave out" branch: never cuts an optimum
SolverOptions exactOptions() {
    SolverOptions opt;
    opt.synergy_slack_fraction = 1.0;
    opt.exact_skip_bound = true;
    return opt;
}

// Exhaustive (K+1)^N enumeration, feasible candidates only
double bruteForceBest(const Config& cfg) {
    const int N = (int)cfg.items.size();
    const int K = (int)cfg.capacities.size();
    CandidateAssign cand;
    cand.assign.assign(N, -1);
    double best = 0.0;
    while (true) {
        EvalResult r;
        std::string err;
        if (!EvaluateAssignment(cfg, cand, &r, &err)) FAIL("EvaluateAssignment failed: " << err);
        if (r.feasible && r.total > best) best = r.total;
        int i = 0;
        while (i < N && cand.assign[i] == K - 1) { cand.assign[i] = -1; ++i; }
        if (i == N) break;
        ++cand.assign[i];
    }
    return best;
}

Config randomConfig(std::mt19937& rng, bool withSynergy) {
    std::uniform_int_distribution<int> nDist(0, 6), kDist(1, 3), wDist(1, 6), vDist(1, 40), cDist(1, 10);
    const int N = nDist(rng);
    const int K = kDist(rng);
    std::vector<Item> items;
    for (int i = 0; i < N; ++i) items.push_back(makeItem(i, wDist(rng), vDist(rng)));
    std::vector<double> caps;
    for (int k = 0; k < K; ++k) caps.push_back(cDist(rng));
    std::vector<SynergyRule> rules;
    if (withSynergy && N >= 2) {
        std::uniform_int_distribution<int> rDist(1, 3), bDist(0, 50), pick(0, N - 1);
        const int R = rDist(rng);
        for (int r = 0; r < R; ++r) {
            SynergyRule rule;
            const int size = std::min(N, rDist(rng));
            for (int m = 0; m < size; ++m) rule.items.push_back("item" + std::to_string(pick(rng)));
            rule.bonus = bDist(rng);
            rules.push_back(rule);
        }
    }
    return makeConfig(items, caps, rules);
}

TEST_CASE("BranchAndBound: Reference scenarios", "[synpack][bnb]") {
    std::string err;
    SolverOptions opt;

    SECTION("Best pair fills a single container") {
        Config cfg = makeConfig({makeItem(1, 2, 100), makeItem(2, 3, 200), makeItem(3, 1, 50)}, {5});
        Solution sol;
        REQUIRE(Solve(cfg, opt, &sol, &err));
        REQUIRE(sol.total_value == 300.0);
        REQUIRE(sol.containers.size() == 1);
        REQUIRE(sol.containers[0].total_weight == 5.0);
        REQUIRE(sol.containers[0].items.size() == 2);
        REQUIRE(sol.containers[0].items[0].id == 1);
        REQUIRE(sol.containers[0].items[1].id == 2);
        REQUIRE(sol.assignment == std::vector<int>{0, 0, -1});
    }

    SECTION("Synergy bonus is awarded when both items share a container") {
        Config cfg = makeConfig({makeItem(1, 2, 2000, "Laptop"), makeItem(2, 1, 50, "Charger")}, {5},
                                {{{"Laptop", "Charger"}, 200.0}});
        Solution sol;
        REQUIRE(Solve(cfg, opt, &sol, &err));
        REQUIRE(sol.total_value == 2250.0);
        REQUIRE(sol.containers[0].synergy_bonus == 200.0);
        REQUIRE(sol.containers[0].total_value == 2250.0);
    }

    SECTION("No containers is rejected before searching") {
        Config cfg = makeConfig({makeItem(1, 2, 100)}, {});
        Solution sol;
        REQUIRE_FALSE(Solve(cfg, opt, &sol, &err));
        REQUIRE_THAT(err, Catch::Matchers::ContainsSubstring("no containers"));
    }

    SECTION("Item heavier than every container stays out") {
        Config cfg = makeConfig({makeItem(1, 10, 100)}, {5});
        Solution sol;
        REQUIRE(Solve(cfg, opt, &sol, &err));
        REQUIRE(sol.total_value == 0.0);
        REQUIRE(sol.containers.size() == 1);
        REQUIRE(sol.containers[0].items.empty());
        REQUIRE(sol.containers[0].total_weight == 0.0);
        REQUIRE(sol.assignment == std::vector<int>{-1});
        REQUIRE(sol.universe_count == "2");
    }

    SECTION("Empty item list yields empty containers") {
        Config cfg = makeConfig({}, {4, 7});
        Solution sol;
        SearchStats stats;
        REQUIRE(Solve(cfg, opt, &sol, &err, &stats));
        REQUIRE(sol.total_value == 0.0);
        REQUIRE(sol.containers.size() == 2);
        REQUIRE(sol.containers[1].capacity == 7.0);
        REQUIRE(sol.universe_count == "1");
        REQUIRE(stats.nodes == 1);
        REQUIRE(stats.leaves == 1);
    }
}

TEST_CASE("BranchAndBound: Search result layout", "[synpack][bnb]") {
    std::string err;
    Config cfg = makeConfig({makeItem(1, 2, 100), makeItem(2, 3, 200), makeItem(3, 1, 50)}, {5});
    SearchResult sr;
    REQUIRE(SolveBranchAndBound(cfg, SolverOptions(), &sr, &err));

    // ratios 50, 66.7, 50: stable sort keeps item 1 ahead of item 3
    REQUIRE(sr.order == std::vector<int>{1, 0, 2});
    REQUIRE(sr.best_assign == std::vector<int>{0, 0, -1});
    REQUIRE(sr.best_total == 300.0);
    REQUIRE(sr.stats.leaves >= 1);
    REQUIRE(sr.stats.max_depth == 3);
    REQUIRE_FALSE(sr.stats.stopped_early);
}

TEST_CASE("BranchAndBound: Exact mode matches exhaustive enumeration", "[synpack][bnb][brute]") {
    std::mt19937 rng(20251017);
    std::string err;

    SECTION("Plain multi-knapsack") {
        for (int trial = 0; trial < 120; ++trial) {
            Config cfg = randomConfig(rng, false);
            SearchResult sr;
            REQUIRE(SolveBranchAndBound(cfg, exactOptions(), &sr, &err));
            INFO("trial " << trial);
            REQUIRE(sr.best_total == Catch::Approx(bruteForceBest(cfg)));
        }
    }

    SECTION("With synergy rules") {
        for (int trial = 0; trial < 120; ++trial) {
            Config cfg = randomConfig(rng, true);
            SearchResult sr;
            REQUIRE(SolveBranchAndBound(cfg, exactOptions(), &sr, &err));
            INFO("trial " << trial);
            REQUIRE(sr.best_total == Catch::Approx(bruteForceBest(cfg)));
        }
    }

    SECTION("Default options never exceed the optimum") {
        for (int trial = 0; trial < 120; ++trial) {
            Config cfg = randomConfig(rng, true);
            Solution sol;
            REQUIRE(Solve(cfg, SolverOptions(), &sol, &err));
            INFO("trial " << trial);
            REQUIRE(sol.total_value <= bruteForceBest(cfg) + 1e-9);
            REQUIRE(CheckSolution(cfg, sol, &err));
        }
    }
}

TEST_CASE("BranchAndBound: Leave-out test is a heuristic by default", "[synpack][bnb]") {
    // Keeping X (ratio 15) blocks both 39-value items; the cheap skip test never revisits that choice.
    std::string err;
    Config cfg = makeConfig({makeItem(1, 2, 30), makeItem(2, 4, 56), makeItem(3, 3, 39), makeItem(4, 3, 39)},
                            {3, 3});

    SECTION("bound - value skip test") {
        SearchResult sr;
        REQUIRE(SolveBranchAndBound(cfg, SolverOptions(), &sr, &err));
        REQUIRE(sr.best_total == 69.0);
        REQUIRE(sr.stats.skipped_unassigned > 0);
    }

    SECTION("Re-bounded skip test finds the optimum") {
        SolverOptions opt;
        opt.exact_skip_bound = true;
        Solution sol;
        REQUIRE(Solve(cfg, opt, &sol, &err));
        REQUIRE(sol.total_value == 78.0);
        REQUIRE(sol.assignment == std::vector<int>{-1, -1, 0, 1});
        REQUIRE(bruteForceBest(cfg) == 78.0);
    }
}

TEST_CASE("BranchAndBound: Determinism", "[synpack][bnb]") {
    std::mt19937 rng(7);
    std::string err;
    for (int trial = 0; trial < 20; ++trial) {
        Config cfg = randomConfig(rng, true);
        SearchResult a, b;
        REQUIRE(SolveBranchAndBound(cfg, SolverOptions(), &a, &err));
        REQUIRE(SolveBranchAndBound(cfg, SolverOptions(), &b, &err));
        REQUIRE(a.best_assign == b.best_assign);
        REQUIRE(a.best_total == b.best_total);
        REQUIRE(a.stats.nodes == b.stats.nodes);
        REQUIRE(a.stats.pruned == b.stats.pruned);
    }
}

TEST_CASE("BranchAndBound: Monotonicity in exact mode", "[synpack][bnb]") {
    std::mt19937 rng(99);
    std::string err;

    SECTION("Adding an item never lowers the optimum") {
        for (int trial = 0; trial < 40; ++trial) {
            Config cfg = randomConfig(rng, true);
            SearchResult before, after;
            REQUIRE(SolveBranchAndBound(cfg, exactOptions(), &before, &err));
            cfg.items.push_back(makeItem(100, 2, 15));
            REQUIRE(SolveBranchAndBound(cfg, exactOptions(), &after, &err));
            REQUIRE(after.best_total >= before.best_total);
        }
    }

    SECTION("Growing a container never lowers the optimum") {
        for (int trial = 0; trial < 40; ++trial) {
            Config cfg = randomConfig(rng, true);
            SearchResult before, after;
            REQUIRE(SolveBranchAndBound(cfg, exactOptions(), &before, &err));
            cfg.capacities[0] += 3;
            REQUIRE(SolveBranchAndBound(cfg, exactOptions(), &after, &err));
            REQUIRE(after.best_total >= before.best_total);
        }
    }

    SECTION("Adding a container never lowers the optimum") {
        std::uniform_int_distribution<int> capDist(1, 10);
        for (int trial = 0; trial < 40; ++trial) {
            Config cfg = randomConfig(rng, true);
            SearchResult before, after;
            REQUIRE(SolveBranchAndBound(cfg, exactOptions(), &before, &err));
            cfg.capacities.push_back(capDist(rng));
            REQUIRE(SolveBranchAndBound(cfg, exactOptions(), &after, &err));
            INFO("trial " << trial << " containers " << cfg.capacities.size());
            REQUIRE(after.best_total >= before.best_total);
            REQUIRE(after.best_total == Catch::Approx(bruteForceBest(cfg)));
        }
    }
}

TEST_CASE("BranchAndBound: Fractional weights stay within capacity", "[synpack][bnb][capacity]") {
    std::string err;

    SECTION("Loads that only fit when summed in search order") {
        // 0.4 + 0.2 + 0.3 rounds above 0.9; the search order 0.2, 0.3, 0.4 lands on 0.9 exactly
        Config cfg = makeConfig({makeItem(1, 0.4, 20), makeItem(2, 0.2, 24), makeItem(3, 0.3, 29)}, {0.9});
        Solution sol;
        REQUIRE(Solve(cfg, SolverOptions(), &sol, &err));
        REQUIRE(sol.total_value == 73.0);
        REQUIRE(sol.containers[0].items.size() == 3);
        REQUIRE(sol.containers[0].total_weight <= sol.containers[0].capacity);
        REQUIRE(sol.order == std::vector<int>{1, 2, 0});
    }

    SECTION("Random tenths never report an overfull container") {
        std::mt19937 rng(515);
        std::uniform_int_distribution<int> nDist(1, 7), kDist(1, 3), wDist(1, 9), vDist(1, 40), cDist(3, 25);
        for (int trial = 0; trial < 300; ++trial) {
            std::vector<Item> items;
            const int N = nDist(rng);
            for (int i = 0; i < N; ++i) items.push_back(makeItem(i, wDist(rng) * 0.1, vDist(rng)));
            std::vector<double> caps;
            const int K = kDist(rng);
            for (int k = 0; k < K; ++k) caps.push_back(cDist(rng) * 0.1);
            Config cfg = makeConfig(items, caps);

            SolverOptions opt;
            opt.greedy_incumbent = (trial % 2) == 1;
            Solution sol;
            INFO("trial " << trial);
            REQUIRE(Solve(cfg, opt, &sol, &err));
            for (const auto& c : sol.containers) REQUIRE(c.total_weight <= c.capacity);
            REQUIRE(CheckSolution(cfg, sol, &err));
        }
    }
}

TEST_CASE("BranchAndBound: Greedy incumbent", "[synpack][bnb][greedy]") {
    std::mt19937 rng(1234);
    std::string err;

    for (int trial = 0; trial < 40; ++trial) {
        Config cfg = randomConfig(rng, true);
        SolverOptions plain = exactOptions();
        SolverOptions seeded = exactOptions();
        seeded.greedy_incumbent = true;
        SearchResult a, b;
        REQUIRE(SolveBranchAndBound(cfg, plain, &a, &err));
        REQUIRE(SolveBranchAndBound(cfg, seeded, &b, &err));
        REQUIRE(b.best_total == Catch::Approx(a.best_total));
    }

    SECTION("Seeded result survives a stopped search") {
        Config cfg = makeConfig({makeItem(1, 2, 30), makeItem(2, 4, 56), makeItem(3, 3, 39), makeItem(4, 3, 39)},
                                {3, 3});
        SolverOptions opt;
        opt.greedy_incumbent = true;
        opt.max_nodes = 1;
        SearchResult sr;
        REQUIRE(SolveBranchAndBound(cfg, opt, &sr, &err));
        REQUIRE(sr.stats.stopped_early);
        REQUIRE(sr.stats.nodes == 1);
        // greedy: 30 -> container 0, 56 fits nowhere, 39 -> container 1, last 39 fits nowhere
        REQUIRE(sr.best_total == 69.0);
        REQUIRE(sr.best_assign == std::vector<int>{0, -1, 1, -1});
    }

    SECTION("Seeded optimum prunes the root") {
        Config cfg = makeConfig({makeItem(1, 2, 100), makeItem(2, 3, 200), makeItem(3, 1, 50)}, {5});
        SolverOptions opt;
        opt.greedy_incumbent = true;
        SearchResult sr;
        REQUIRE(SolveBranchAndBound(cfg, opt, &sr, &err));
        REQUIRE(sr.best_total == 300.0);
        REQUIRE(sr.stats.nodes == 1);
        REQUIRE(sr.stats.pruned == 1);
        REQUIRE(sr.stats.incumbent_updates == 0);
    }
}

TEST_CASE("BranchAndBound: Cancellation", "[synpack][bnb]") {
    std::string err;
    Config cfg = makeConfig({makeItem(1, 2, 100), makeItem(2, 3, 200), makeItem(3, 1, 50)}, {5});

    SECTION("Node budget stops the search") {
        SolverOptions opt;
        opt.max_nodes = 1;
        Solution sol;
        SearchStats stats;
        REQUIRE(Solve(cfg, opt, &sol, &err, &stats));
        REQUIRE(stats.stopped_early);
        REQUIRE(stats.nodes == 1);
        REQUIRE(sol.total_value == 0.0);
        REQUIRE(CheckSolution(cfg, sol, &err));
    }

    SECTION("should_stop callback stops the search") {
        SolverOptions opt;
        int polls = 0;
        opt.should_stop = [&polls]() { return ++polls > 2; };
        SearchResult sr;
        REQUIRE(SolveBranchAndBound(cfg, opt, &sr, &err));
        REQUIRE(sr.stats.stopped_early);
        REQUIRE(polls == 3);
        REQUIRE(sr.stats.nodes == 3);
    }

    SECTION("Unlimited budget runs to completion") {
        SolverOptions opt;
        opt.should_stop = []() { return false; };
        SearchResult sr;
        REQUIRE(SolveBranchAndBound(cfg, opt, &sr, &err));
        REQUIRE_FALSE(sr.stats.stopped_early);
        REQUIRE(sr.best_total == 300.0);
    }
}

TEST_CASE("BranchAndBound: Deep inputs do not recurse", "[synpack][bnb][stress]") {
    const int N = 5000;
    std::vector<Item> items;
    for (int i = 0; i < N; ++i) items.push_back(makeItem(i, 1, 1));
    Config cfg = makeConfig(items, {(double)N});
    std::string err;
    SearchResult sr;
    REQUIRE(SolveBranchAndBound(cfg, SolverOptions(), &sr, &err));
    REQUIRE(sr.best_total == (double)N);
    REQUIRE(sr.stats.max_depth == N);
    REQUIRE(sr.stats.nodes == (std::uint64_t)N + 1);
}

TEST_CASE("BranchAndBound: Options", "[synpack][bnb]") {
    std::string err;
    Config cfg = makeConfig({makeItem(1, 2, 100)}, {5});

    SECTION("Negative slack fraction is rejected") {
        SolverOptions opt;
        opt.synergy_slack_fraction = -0.5;
        SearchResult sr;
        REQUIRE_FALSE(SolveBranchAndBound(cfg, opt, &sr, &err));
        REQUIRE_THAT(err, Catch::Matchers::ContainsSubstring("synergy_slack_fraction"));
    }

    SECTION("OptionsFromConfig copies the solver block") {
        cfg.solver.synergy_slack_fraction = 0.75;
        cfg.solver.greedy_incumbent = true;
        cfg.solver.exact_skip_bound = true;
        cfg.solver.max_nodes = 42;
        SolverOptions opt = OptionsFromConfig(cfg);
        REQUIRE(opt.synergy_slack_fraction == 0.75);
        REQUIRE(opt.greedy_incumbent);
        REQUIRE(opt.exact_skip_bound);
        REQUIRE(opt.max_nodes == 42);
        REQUIRE_FALSE(opt.debug);
    }

    SECTION("Null output is an error") {
        REQUIRE_FALSE(SolveBranchAndBound(cfg, SolverOptions(), nullptr, &err));
        REQUIRE_FALSE(err.empty());
    }
}
