#include "EventEngine.h"

#include <algorithm>
#include <cmath>

using namespace treesim;

EventEngine::EventEngine(const Skyline& skyline) : skyline_(skyline) {}


TreeSimulation EventEngine::simulate(RngEngine& rng, const double horizon, const int targetTips) {
    CriterionGroup criteria;
    DataCollectorGroup collectors;
    return simulate(rng, horizon, targetTips, criteria, collectors);
}

TreeSimulation EventEngine::simulate(RngEngine& rng, const double horizon, const int targetTips,
                                     CriterionGroup& criteria, DataCollector& collectors, const double startTime) {
    lineages_.clear();
    heap_ = decltype(heap_)();
    sequence_ = 0;
    nextNodeId_ = 0;
    horizon_ = horizon;
    counts_ = EventCounts{};

    TreeSimulation out;

    const size_t rootInterval = skyline_.intervalAt(startTime);
    auto root = std::make_unique<TreeNode>(nextNodeId_++, 0, startTime, rootInterval, nullptr);
    schedule(addLineage(root.get(), rootInterval, startTime, collectors), startTime, rng);

    double now = startTime;
    bool targetReached = false;

    while (!heap_.empty() && !targetReached) {
        const PendingEvent event = heap_.top();
        heap_.pop();

        const LineageState& lineage = lineages_[event.lineage];
        if (!lineage.alive || event.version != lineage.version) continue;
        now = event.time;

        switch (event.kind) {
        case EventKind::INTERVAL_SWITCH:
            lineages_[event.lineage].interval = skyline_.intervalAt(now);
            schedule(event.lineage, now, rng);
            break;

        case EventKind::HORIZON:
            terminate(event.lineage, now, LineageStatus::PRUNED_AT_TIME_LIMIT, collectors);
            break;

        case EventKind::BIRTH:
            transmit(event.lineage, now, rng, collectors);
            break;

        case EventKind::REMOVAL: {
            const Model& model = skyline_.model(lineage.interval);
            const bool notified = lineage.notified;

            // notified contacts are always observed when removed
            if (!notified && !rng.bernoulli(model.samplingProbability())) {
                terminate(event.lineage, now, LineageStatus::REMOVED_UNSAMPLED, collectors);
                break;
            }

            terminate(event.lineage, now, LineageStatus::SAMPLED, collectors);
            criteria.registerSample(now);
            if (criteria.earlyReject()) {
                out.result = TrajectoryResult::EARLY_REJECTED;
                out.counts = counts_;
                out.endTime = now;
                return out;
            }

            targetReached = targetTips > 0 && counts_.sampled >= targetTips;
            if (!targetReached && !notified && model.notifies() && rng.bernoulli(model.notificationProbability()))
                notifyContacts(event.lineage, now, rng, collectors);
            break;
        }
        }
    }

    if (targetTips > 0 && !targetReached)
        out.result = TrajectoryResult::EXTINCT;

    // lineages still alive here are stalled (no rate left) or outlived the tip target
    pruneAlive(now, collectors);

    out.endTime = targetTips > 0 || std::isinf(horizon) ? now : horizon;
    out.counts = counts_;
    out.tree = Tree(pruneUnsampled(std::move(root)), startTime);
    return out;
}


size_t EventEngine::addLineage(TreeNode* node, const size_t interval, const double t, DataCollector& collectors) {
    lineages_.push_back(LineageState{node, interval, t});
    counts_.lineages++;
    collectors.registerLineage(t);
    return lineages_.size() - 1;
}

TreeNode* EventEngine::openEdge(TreeNode* parent, const size_t lineage, const double t, const size_t interval) {
    auto edge = std::make_unique<TreeNode>(nextNodeId_++, static_cast<int>(lineage), t, interval, parent);
    TreeNode* raw = edge.get();
    parent->children.push_back(std::move(edge));
    return raw;
}


void EventEngine::schedule(const size_t lineage, const double t, RngEngine& rng) {
    LineageState& state = lineages_[lineage];
    state.version++;

    const Model& model = skyline_.model(state.interval);
    const double birthWait = rng.exponential(model.birthRate());
    const double removalWait = rng.exponential(model.removalRate(state.notified));

    EventKind kind = birthWait < removalWait ? EventKind::BIRTH : EventKind::REMOVAL;
    double when = t + std::min(birthWait, removalWait);

    // the race never outlives the interval: it restarts at the boundary under the next model
    const double nextSwitch = skyline_.nextSwitch(t);
    const double limit = std::min(nextSwitch, horizon_);
    if (when >= limit) {
        when = limit;
        kind = nextSwitch < horizon_ ? EventKind::INTERVAL_SWITCH : EventKind::HORIZON;
    }

    // no rate left and no boundary ahead: the lineage stays as it is
    if (std::isinf(when)) return;

    heap_.push(PendingEvent{when, sequence_++, lineage, state.version, kind});
}

void EventEngine::terminate(const size_t lineage, const double t, const LineageStatus status,
                            DataCollector& collectors) {
    LineageState& state = lineages_[lineage];
    state.alive = false;
    state.version++;
    state.node->endTime = t;
    state.node->status = status;

    if (status == LineageStatus::SAMPLED) counts_.sampled++;
    else if (status == LineageStatus::REMOVED_UNSAMPLED) counts_.unsampled++;

    collectors.registerTermination(t, status);
}

void EventEngine::transmit(const size_t lineage, const double t, RngEngine& rng, DataCollector& collectors) {
    const size_t interval = lineages_[lineage].interval;
    const int recipients = skyline_.model(interval).recipients().draw(rng);

    TreeNode* branching = lineages_[lineage].node;
    branching->endTime = t;
    branching->status = LineageStatus::BRANCHED;

    // the donor goes on along a fresh edge, keeping its notification state
    TreeNode* donor = openEdge(branching, lineage, t, interval);
    donor->notified = branching->notified;
    donor->notifiedAt = branching->notifiedAt;
    donor->notifierId = branching->notifierId;
    if (donor->notified) donor->status = LineageStatus::NOTIFIED_ALIVE;
    lineages_[lineage].node = donor;
    lineages_[lineage].transmissions += recipients;

    for (int i = 0; i < recipients; ++i) {
        TreeNode* edge = openEdge(branching, lineages_.size(), t, interval);
        schedule(addLineage(edge, interval, t, collectors), t, rng);
    }

    schedule(lineage, t, rng);
}

void EventEngine::notifyContacts(const size_t lineage, const double t, RngEngine& rng, DataCollector& collectors) {
    const size_t interval = lineages_[lineage].interval;
    const int contacts = skyline_.model(interval).maxNotifiedContacts();

    // the sampled edge becomes a branching point: a zero-length sampled tip plus one edge per contact
    TreeNode* branching = lineages_[lineage].node;
    branching->status = LineageStatus::BRANCHED;
    TreeNode* tip = openEdge(branching, lineage, t, interval);
    tip->endTime = t;
    tip->status = LineageStatus::SAMPLED;
    lineages_[lineage].node = tip;

    for (int i = 0; i < contacts; ++i) {
        TreeNode* edge = openEdge(branching, lineages_.size(), t, interval);
        edge->status = LineageStatus::NOTIFIED_ALIVE;
        edge->notified = true;
        edge->notifiedAt = t;
        edge->notifierId = tip->id;

        const size_t contact = addLineage(edge, interval, t, collectors);
        lineages_[contact].notified = true;
        lineages_[contact].notifiedAt = t;
        lineages_[contact].notifier = static_cast<int>(lineage);
        counts_.notified++;
        schedule(contact, t, rng);
    }
}

void EventEngine::pruneAlive(const double t, DataCollector& collectors) {
    for (size_t i = 0; i < lineages_.size(); ++i)
        if (lineages_[i].alive)
            terminate(i, t, LineageStatus::PRUNED_AT_TIME_LIMIT, collectors);
}
