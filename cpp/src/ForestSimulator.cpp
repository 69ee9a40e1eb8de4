#include "ForestSimulator.h"

#include <cmath>
#include <limits>

#include "Errors.h"

using namespace treesim;

ForestSimulator::ForestSimulator(const Skyline& skyline,
                                 const int minTips,
                                 const int maxTips,
                                 const double T,
                                 const CriterionGroup& criteria,
                                 const DataCollectorGroup& collectors,
                                 const int64_t maxAttempts)
    : skyline_(skyline),
      minTips_(minTips),
      maxTips_(maxTips),
      T_(T),
      collectors_(collectors),
      maxAttempts_(maxAttempts),
      lttIndex_(0),
      engine_(skyline) {
    if (minTips_ < 1)
        throw InvalidParameter("ForestSimulator: min tips must be positive, got " + std::to_string(minTips_));
    if (maxTips_ < minTips_)
        throw InvalidParameter("ForestSimulator: max tips (" + std::to_string(maxTips_) +
                               ") must not be below min tips (" + std::to_string(minTips_) + ")");
    if (std::isnan(T_) || T_ < 0.0)
        throw InvalidParameter("ForestSimulator: total time T must be non-negative");
    if (maxAttempts_ < 0)
        throw InvalidParameter("ForestSimulator: max attempts must be >= 0");

    if (T_ == 0.0)
        throw DegenerateProcess("ForestSimulator: nothing can be sampled within T=0");
    if (!skyline_.canSample(T_))
        throw DegenerateProcess("ForestSimulator: no interval starting before T has both a positive removal rate "
                                "and sampling probability, min tips is unreachable");

    criteria_.add(TipCountCriterion(minTips_, maxTips_));
    if (criteria.size() > 0) criteria_.add(criteria);

    collectors_.add(std::make_unique<LttCollector>());
    lttIndex_ = collectors_.size() - 1;
}


GenerationResult ForestSimulator::run(RngEngine& rng) {
    treesSimulated_ = 0;
    for (int64_t attempt = 1;; ++attempt) {
        criteria_.reset();
        collectors_.reset();

        Forest forest;
        TrajectoryResult result = std::isinf(T_) ? processTree(forest, rng) : processForest(forest, rng);

        ForestSummary summary = forest.summary();
        if (result == TrajectoryResult::ACCEPTED) {
            collectors_.recordSummary(summary);
            if (!criteria_.finalPassed(summary)) result = TrajectoryResult::REJECTED_BY_CRITERION;
        }
        collectors_.save(result);
        if (result != TrajectoryResult::ACCEPTED) continue;

        const auto& ltt = dynamic_cast<const LttCollector&>(*collectors_.at(lttIndex_));
        GenerationResult out;
        out.forest = std::move(forest);
        out.summary = summary;
        out.ltt = ltt.last();
        out.attempts = attempt;
        return out;
    }
}

TrajectoryResult ForestSimulator::processTree(Forest& forest, RngEngine& rng) {
    const int target = rng.uniformInt(minTips_, maxTips_);
    TreeSimulation simulation = simulateTree(rng, std::numeric_limits<double>::infinity(), target);
    if (simulation.result != TrajectoryResult::ACCEPTED) return simulation.result;

    forest.append(std::move(simulation.tree), simulation.counts);
    forest.setTime(simulation.endTime);
    return TrajectoryResult::ACCEPTED;
}

TrajectoryResult ForestSimulator::processForest(Forest& forest, RngEngine& rng) {
    // every tree of the forest starts at time 0 and is cut at T
    while (forest.totalTips() < minTips_) {
        TreeSimulation simulation = simulateTree(rng, T_, 0);
        if (simulation.result != TrajectoryResult::ACCEPTED) return simulation.result;

        forest.append(std::move(simulation.tree), simulation.counts);
    }
    forest.setTime(T_);
    return TrajectoryResult::ACCEPTED;
}

TreeSimulation ForestSimulator::simulateTree(RngEngine& rng, const double horizon, const int targetTips) {
    // hidden trees count too, so a forest that keeps coming up empty still ends
    if (maxAttempts_ > 0 && treesSimulated_ >= maxAttempts_)
        throw SimulationExhausted("ForestSimulator: no acceptable forest after " + std::to_string(maxAttempts_) +
                                  " simulated trees");
    ++treesSimulated_;
    return engine_.simulate(rng, horizon, targetTips, criteria_, collectors_, 0.0);
}


Skyline treesim::makeSkyline(const std::vector<Model>& models,
                             const std::vector<double>& skylineTimes,
                             const int maxNotifiedContacts) {
    if (maxNotifiedContacts < 0)
        throw InvalidParameter("makeSkyline: max notified contacts must be >= 0, got " +
                               std::to_string(maxNotifiedContacts));
    return Skyline(models, skylineTimes).withMaxNotifiedContacts(maxNotifiedContacts);
}

GenerationResult treesim::generate(const std::vector<Model>& models,
                                   const int minTips,
                                   const int maxTips,
                                   const double T,
                                   const std::vector<double>& skylineTimes,
                                   const int maxNotifiedContacts,
                                   RngEngine& rng,
                                   const CriterionGroup& criteria,
                                   const DataCollectorGroup& collectors,
                                   const int64_t maxAttempts) {
    ForestSimulator simulator(makeSkyline(models, skylineTimes, maxNotifiedContacts), minTips, maxTips, T, criteria, collectors, maxAttempts);
    return simulator.run(rng);
}
