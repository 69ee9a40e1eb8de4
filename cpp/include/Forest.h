#pragma once
/**
 * @file Forest.h
 * @brief Accepted trees plus the aggregate counters reported alongside them.
 */
#include <utility>
#include <vector>

#include "Tree.h"

namespace treesim {
    /** @brief (time, number of lineages) points of a step function, time-ordered. */
    using LttCurve = std::vector<std::pair<double, int>>;

    /**
     * @brief Per-tree event counts reported by the event engine.
     */
    struct EventCounts {
        int sampled = 0;
        int unsampled = 0; /**< removals that were not sampled */
        int notified = 0; /**< lineages that received a notification */
        int lineages = 0; /**< individuals created, root included */
    };

    /**
     * @brief Summary of a forest, as logged and as seen by acceptance criteria.
     */
    struct ForestSummary {
        int tips = 0; /**< sampled tips over all trees */
        int unsampled = 0; /**< unsampled removals over all trees */
        int hiddenTrees = 0; /**< simulated trees without a single sampled tip */
        int notified = 0;
        int trees = 0; /**< stored (observed) trees */
        double time = 0.0; /**< realized simulated time */
    };

    /**
     * @brief An ordered sequence of observed trees; only grows by appending whole trees.
     */
    class Forest {
    public:
        Forest() = default;
        Forest(Forest&&) noexcept = default;
        Forest& operator=(Forest&&) noexcept = default;

        /**
         * @brief Account for one finished tree. Trees without a sampled tip are counted as hidden and dropped.
         * @param tree    the pruned tree (may be empty)
         * @param counts  its event counts
         */
        void append(Tree tree, const EventCounts& counts);

        void setTime(double time) noexcept { time_ = time; }

        const std::vector<Tree>& trees() const noexcept { return trees_; }
        size_t size() const noexcept { return trees_.size(); }
        int totalTips() const noexcept { return tips_; }
        int unsampled() const noexcept { return unsampled_; }
        int hiddenTrees() const noexcept { return hiddenTrees_; }
        double time() const noexcept { return time_; }

        ForestSummary summary() const noexcept;

    private:
        std::vector<Tree> trees_;
        int tips_ = 0;
        int unsampled_ = 0;
        int hiddenTrees_ = 0;
        int notified_ = 0;
        double time_ = 0.0;
    };

    /**
     * @brief Replay +1/-1 events into a step curve; events at equal times are merged.
     * @param events  (time, delta) pairs in any order
     */
    LttCurve lttFromEvents(std::vector<std::pair<double, int>> events);

    /** @brief Value of a step curve at time t (0 before its first point). */
    int lttAt(const LttCurve& curve, double t) noexcept;

    /**
     * @brief Lineages-through-time of the reconstructed forest: edges ancestral to at least one sampled tip.
     */
    LttCurve observedLtt(const Forest& forest);
}
