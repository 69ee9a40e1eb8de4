#include <chrono>
#include <iostream>
#include <limits>
#include <vector>

#include "Collector.h"
#include "ForestSimulator.h"
#include "Model.h"
#include "Skyline.h"

using namespace treesim;

int main() {
    // --- 1) Skyline: three intervals ---
    const std::vector<double> la = {0.4, 0.5, 0.6};
    const std::vector<double> psi = {0.1, 0.2, 0.3};
    const std::vector<double> p = {0.5, 0.6, 0.7};
    const std::vector<double> times = {2.0, 5.0, 10.0};

    std::vector<Model> models;
    for (size_t i = 0; i < la.size(); ++i)
        models.emplace_back(RateModel(la[i], psi[i], p[i]), Notification(0.5, 1.0, 2));
    const Skyline skyline(models, times);

    // --- 2) Collectors ---
    std::vector<std::unique_ptr<DataCollector>> collectors;
    collectors.push_back(std::make_unique<AttemptCollector>());
    collectors.push_back(std::make_unique<ActiveSetSizeCollector>(5.0));
    const DataCollectorGroup collGroup(collectors);

    // --- 3) Run: trees, then forests ---
    const int N_RUNS = 200;
    RngEngine rng(420);
    long tips = 0;
    auto start = std::chrono::high_resolution_clock::now();

    ForestSimulator trees(skyline, 500, 1000, std::numeric_limits<double>::infinity(), CriterionGroup(), collGroup);
    for (int i = 0; i < N_RUNS; ++i)
        tips += trees.run(rng).summary.tips;

    ForestSimulator forests(skyline, 500, 1000, 20.0, CriterionGroup(), collGroup);
    for (int i = 0; i < N_RUNS; ++i)
        tips += forests.run(rng).summary.tips;

    auto stop = std::chrono::high_resolution_clock::now();
    auto runtime = std::chrono::duration<double>(stop - start).count();
    std::cout << "Runtime: " << runtime << " seconds" << std::endl;

    const auto& attempts = dynamic_cast<const AttemptCollector&>(*forests.collectors().at(0));
    std::cout << "Sampled tips: " << tips << ", forest attempts: " << attempts.total() << std::endl;
    return 0;
}
