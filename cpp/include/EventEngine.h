#pragma once
/**
 * @file EventEngine.h
 * @brief Continuous-time simulation of one transmission tree under a skyline model.
 */
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <queue>
#include <vector>

#include "Collector.h"
#include "Criterion.h"
#include "Forest.h"
#include "RngEngine.h"
#include "Skyline.h"
#include "TrajectoryResult.h"
#include "Tree.h"

namespace treesim {
    /**
     * @brief Outcome of one tree simulation.
     */
    struct TreeSimulation {
        TrajectoryResult result = TrajectoryResult::ACCEPTED;
        Tree tree; /**< unsampled removals already pruned */
        EventCounts counts;
        double endTime = 0.0; /**< horizon, or the time the tip target was reached */
    };

    /**
     * @brief Races competing exponential clocks per lineage, in global time order.
     *
     * Every living lineage owns exactly one pending event (birth, removal, interval switch or horizon).
     * Crossing a skyline boundary restarts the lineage's race under the new interval's rates. A sampling event that
     * triggers notification spawns maxNotifiedContacts new NOTIFIED_ALIVE lineages, removed at the notified rate.
     */
    class EventEngine {
    public:
        /**
         * @param skyline  models per interval; notification caps are read from the models
         */
        explicit EventEngine(const Skyline& skyline);

        /**
         * @brief Simulate one tree whose root lineage starts at startTime.
         * @param rng         random source, advanced in place
         * @param horizon     lineages alive at this time are pruned (may be inf)
         * @param targetTips  stop as soon as this many tips are sampled (0: no target)
         * @param criteria    sees every sample, may reject early
         * @param collectors  sees every lineage creation and termination
         * @param startTime   root start time
         */
        TreeSimulation simulate(RngEngine& rng, double horizon, int targetTips, CriterionGroup& criteria,
                                DataCollector& collectors, double startTime = 0.0);

        /** @brief Same, without criteria or collectors. */
        TreeSimulation simulate(RngEngine& rng, double horizon, int targetTips = 0);

        const Skyline& skyline() const noexcept { return skyline_; }

    private:
        enum class EventKind : int { BIRTH, REMOVAL, INTERVAL_SWITCH, HORIZON };

        struct PendingEvent {
            double time;
            uint64_t sequence; /**< FIFO among equal times */
            size_t lineage;
            uint64_t version; /**< stale once the lineage is rescheduled */
            EventKind kind;

            bool operator>(const PendingEvent& other) const noexcept {
                return time > other.time || (time == other.time && sequence > other.sequence);
            }
        };

        /**
         * @brief Mutable per-lineage state, owned by the engine for the duration of one tree.
         */
        struct LineageState {
            TreeNode* node; /**< current (open) edge */
            size_t interval;
            double birthTime;
            bool alive = true;
            bool notified = false;
            double notifiedAt = TreeNode::NEVER;
            int notifier = -1; /**< lineage that notified this one, non-owning */
            int transmissions = 0;
            uint64_t version = 0;
        };

        const Skyline skyline_;

        // per-simulation state
        std::vector<LineageState> lineages_;
        std::priority_queue<PendingEvent, std::vector<PendingEvent>, std::greater<PendingEvent>> heap_;
        uint64_t sequence_ = 0;
        int nextNodeId_ = 0;
        double horizon_ = std::numeric_limits<double>::infinity();
        EventCounts counts_;

        size_t addLineage(TreeNode* node, size_t interval, double t, DataCollector& collectors);
        TreeNode* openEdge(TreeNode* parent, size_t lineage, double t, size_t interval);
        void schedule(size_t lineage, double t, RngEngine& rng);
        void terminate(size_t lineage, double t, LineageStatus status, DataCollector& collectors);
        void transmit(size_t lineage, double t, RngEngine& rng, DataCollector& collectors);
        void notifyContacts(size_t lineage, double t, RngEngine& rng, DataCollector& collectors);
        void pruneAlive(double t, DataCollector& collectors);
    };
}
