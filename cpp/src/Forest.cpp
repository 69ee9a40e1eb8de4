#include "Forest.h"

#include <algorithm>
#include <iterator>

using namespace treesim;

void Forest::append(Tree tree, const EventCounts& counts) {
    tips_ += counts.sampled;
    unsampled_ += counts.unsampled;
    notified_ += counts.notified;
    if (counts.sampled == 0 || tree.empty()) {
        hiddenTrees_++;
        return;
    }
    trees_.push_back(std::move(tree));
}

ForestSummary Forest::summary() const noexcept {
    ForestSummary s;
    s.tips = tips_;
    s.unsampled = unsampled_;
    s.hiddenTrees = hiddenTrees_;
    s.notified = notified_;
    s.trees = static_cast<int>(trees_.size());
    s.time = time_;
    return s;
}

LttCurve treesim::lttFromEvents(std::vector<std::pair<double, int>> events) {
    std::sort(events.begin(), events.end(), [](auto const& a, auto const& b) { return a.first < b.first; });

    LttCurve curve;
    int current = 0;
    for (size_t i = 0; i < events.size();) {
        const double t = events[i].first;
        for (; i < events.size() && events[i].first == t; ++i)
            current += events[i].second;
        curve.emplace_back(t, current);
    }
    return curve;
}

int treesim::lttAt(const LttCurve& curve, const double t) noexcept {
    const auto it = std::upper_bound(curve.begin(), curve.end(), t,
                                     [](const double value, auto const& point) { return value < point.first; });
    if (it == curve.begin()) return 0;
    return std::prev(it)->second;
}

namespace {
    // post-order: collect the edges carrying a sampled tip below them
    bool collectObserved(const TreeNode& node, std::vector<std::pair<double, int>>& events) {
        bool observed = node.isTip() && node.status == LineageStatus::SAMPLED;
        for (const auto& child : node.children)
            observed = collectObserved(*child, events) || observed;
        if (observed) {
            events.emplace_back(node.startTime, +1);
            events.emplace_back(node.endTime, -1);
        }
        return observed;
    }
}

LttCurve treesim::observedLtt(const Forest& forest) {
    std::vector<std::pair<double, int>> events;
    for (const auto& tree : forest.trees())
        if (!tree.empty()) collectObserved(*tree.root(), events);
    return lttFromEvents(std::move(events));
}
