#include "Collector.h"
#include <cassert>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <numeric>
#include <ostream>
#include <sstream>

using namespace treesim;

//LttCollector
void LttCollector::registerLineage(const double startTime) {
    events_.emplace_back(startTime, +1);
}

void LttCollector::registerTermination(const double endTime, const LineageStatus status) {
    // pruned lineages are still alive at the end of the attempt
    if (status == LineageStatus::PRUNED_AT_TIME_LIMIT) return;
    events_.emplace_back(endTime, -1);
}

void LttCollector::save(const TrajectoryResult trajectoryResult) {
    if (trajectoryResult == TrajectoryResult::ACCEPTED)
        curves_.push_back(lttFromEvents(events_));

    reset();
}

void LttCollector::merge(const DataCollector& other) {
    const auto& o = dynamic_cast<const LttCollector&>(other);

    curves_.reserve(curves_.size() + o.curves_.size());
    curves_.insert(curves_.end(), o.curves_.begin(), o.curves_.end());
}


//ActiveSetSizeCollector
ActiveSetSizeCollector::ActiveSetSizeCollector(const double collectionTime):
    collectionTime_(collectionTime) {}

void ActiveSetSizeCollector::merge(const DataCollector& other) {
    const auto& o = dynamic_cast<const ActiveSetSizeCollector&>(other);

    activeSetSizes_.reserve(activeSetSizes_.size() + o.activeSetSizes_.size());
    activeSetSizes_.insert(activeSetSizes_.end(), o.activeSetSizes_.begin(), o.activeSetSizes_.end());
}

void ActiveSetSizeCollector::reset() {
    currentActiveSetSize = 0;
}

void ActiveSetSizeCollector::registerLineage(const double startTime) {
    if (startTime <= collectionTime_)
        currentActiveSetSize += 1;
}

void ActiveSetSizeCollector::registerTermination(const double endTime, const LineageStatus status) {
    if (status != LineageStatus::PRUNED_AT_TIME_LIMIT && endTime <= collectionTime_)
        currentActiveSetSize -= 1;
}

void ActiveSetSizeCollector::save(const TrajectoryResult trajectoryResult) {
    if (trajectoryResult == TrajectoryResult::ACCEPTED)
        activeSetSizes_.push_back(currentActiveSetSize);

    reset();
}


//AttemptCollector
void AttemptCollector::save(const TrajectoryResult trajectoryResult) {
    counts_[static_cast<size_t>(trajectoryResult)] += 1;
}

void AttemptCollector::merge(const DataCollector& other) {
    const auto& o = dynamic_cast<const AttemptCollector&>(other);
    for (size_t i = 0; i < counts_.size(); ++i)
        counts_[i] += o.counts_[i];
}

long AttemptCollector::total() const noexcept {
    return std::accumulate(counts_.begin(), counts_.end(), 0L);
}


//ProgressLogger
ProgressLogger::ProgressLogger(std::ostream& out, const bool verbose): out_(&out), verbose_(verbose) {}

void ProgressLogger::reset() {
    attempt_++;
    sampled_ = 0;
    summary_ = ForestSummary{};
}

void ProgressLogger::registerTermination(double, const LineageStatus status) {
    if (status == LineageStatus::SAMPLED) sampled_++;
}

void ProgressLogger::recordSummary(const ForestSummary& summary) {
    summary_ = summary;
}

void ProgressLogger::save(const TrajectoryResult trajectoryResult) {
    std::ostringstream msg;
    if (trajectoryResult == TrajectoryResult::ACCEPTED) {
        msg << "attempt " << attempt_ << " accepted: " << summary_.tips << " tips in " << summary_.trees
            << " tree(s), " << summary_.hiddenTrees << " hidden tree(s), " << summary_.unsampled
            << " unsampled removals, T=" << summary_.time;
        log(msg.str());
        return;
    }
    if (!verbose_) return;
    msg << "attempt " << attempt_ << " " << toString(trajectoryResult) << " after " << sampled_ << " sampled tips";
    log(msg.str());
}

void ProgressLogger::log(const std::string& message) const {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    *out_ << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << ": " << message << '\n';
}


//DataCollectorGroup
DataCollectorGroup::DataCollectorGroup(const std::vector<std::unique_ptr<DataCollector>>& collectors) {
    collectors_.reserve(collectors.size());
    for (const auto& collector : collectors)
        collectors_.emplace_back(collector->clone());
}

DataCollectorGroup::DataCollectorGroup(const std::vector<std::shared_ptr<DataCollector>>& collectors) {
    collectors_.reserve(collectors.size());
    for (const auto& collector : collectors)
        collectors_.emplace_back(collector->clone());
}

DataCollectorGroup::DataCollectorGroup(const DataCollectorGroup& other) {
    collectors_.reserve(other.collectors_.size());
    for (const auto& collector : other.collectors_)
        collectors_.emplace_back(collector->clone());
}


void DataCollectorGroup::merge(const DataCollector& other) {
    const auto& o = dynamic_cast<const DataCollectorGroup&>(other);
    assert(o.collectors_.size() == collectors_.size());
    for (size_t i = 0; i < collectors_.size(); ++i)
        collectors_[i]->merge(*o.collectors_[i]);
}
