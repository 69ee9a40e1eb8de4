#pragma once
/**
 * @file ForestSimulator.h
 * @brief Retry loop that assembles forests within tip bounds, and the generate() entry point.
 */
#include "Collector.h"
#include "Criterion.h"
#include "EventEngine.h"
#include "Forest.h"
#include "RngEngine.h"
#include "Skyline.h"
#include "TrajectoryResult.h"

#include <cstdint>
#include <vector>

namespace treesim {
    /**
     * @brief An accepted forest with its summary and lineages-through-time curve.
     */
    struct GenerationResult {
        Forest forest;
        ForestSummary summary;
        LttCurve ltt; /**< all infected lineages, observed or not */
        int64_t attempts = 0; /**< attempts used, the accepted one included */
    };

    /**
     * @brief Repeats tree simulations until a forest satisfies the tip bounds and every criterion.
     *
     * With an infinite T a single tree is grown until a tip count drawn uniformly from [minTips, maxTips] is
     * sampled. With a finite T independent trees, each started at time 0 and cut at T, are added until the
     * forest holds at least minTips sampled tips. Any violation discards the whole attempt.
     */
    class ForestSimulator {
    public:
        /**
         * @param skyline      models per interval
         * @param minTips      lower bound on sampled tips, >= 1
         * @param maxTips      upper bound on sampled tips, >= minTips
         * @param T            total simulation time, >= 0 or inf
         * @param criteria     extra acceptance criteria, cloned
         * @param collectors   observers, cloned; an LttCollector is appended
         * @param maxAttempts  give up after this many simulated trees (0 = retry forever)
         * @throws InvalidParameter on out-of-range bounds or T
         * @throws DegenerateProcess when no sampled tip can be produced before T
         */
        ForestSimulator(const Skyline& skyline,
                        int minTips,
                        int maxTips,
                        double T,
                        const CriterionGroup& criteria = CriterionGroup(),
                        const DataCollectorGroup& collectors = DataCollectorGroup(),
                        int64_t maxAttempts = 0);

        /**
         * @brief Run attempts until one is accepted.
         * @throws SimulationExhausted if maxAttempts is set and reached
         */
        GenerationResult run(RngEngine& rng);

        /** @brief Access the collectors after `run()`; the last one is the LttCollector. */
        const DataCollectorGroup& collectors() const { return collectors_; }

    private:
        // Configuration
        const Skyline skyline_;
        const int minTips_, maxTips_;
        const double T_;
        CriterionGroup criteria_;
        DataCollectorGroup collectors_;
        const int64_t maxAttempts_;
        size_t lttIndex_;

        EventEngine engine_;
        int64_t treesSimulated_ = 0;

        TreeSimulation simulateTree(RngEngine& rng, double horizon, int targetTips);

        TrajectoryResult processTree(Forest& forest, RngEngine& rng);

        TrajectoryResult processForest(Forest& forest, RngEngine& rng);
    };

    /**
     * @brief Build a skyline whose notifying models all use maxNotifiedContacts.
     * @throws InvalidParameter if maxNotifiedContacts is negative
     * @throws ConfigurationMismatch on mismatched or unordered lists
     */
    Skyline makeSkyline(const std::vector<Model>& models, const std::vector<double>& skylineTimes,
                        int maxNotifiedContacts);

    /**
     * @brief Generate a forest from parallel lists of models and interval end times.
     *
     * maxNotifiedContacts replaces the notification cap of every notifying model.
     */
    GenerationResult generate(const std::vector<Model>& models,
                              int minTips,
                              int maxTips,
                              double T,
                              const std::vector<double>& skylineTimes,
                              int maxNotifiedContacts,
                              RngEngine& rng,
                              const CriterionGroup& criteria = CriterionGroup(),
                              const DataCollectorGroup& collectors = DataCollectorGroup(),
                              int64_t maxAttempts = 0);
}
