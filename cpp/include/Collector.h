#pragma once
/**
 * @file Collector.h
 * @brief Observers injected into the generator: data collection and progress logging.
 */
#include <array>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "Forest.h"
#include "TrajectoryResult.h"
#include "Tree.h"

namespace treesim {
    /**
     * @brief Base interface for streaming & final data collection.
     *
     * One attempt is framed by reset() ... save(result); in between, the engine streams lineage events.
     */
    class DataCollector {
    public:
        virtual ~DataCollector() = default;

        /** @brief reset the per‑attempt temporary state */
        virtual void reset() = 0;

        /**
         * @brief record a new lineage (a root or a transmission recipient)
         * @param startTime  time the lineage was created
         */
        virtual void registerLineage(double startTime) = 0;

        /**
         * @brief record the end of a lineage
         * @param endTime  time of the terminating event
         * @param status   SAMPLED, REMOVED_UNSAMPLED or PRUNED_AT_TIME_LIMIT
         */
        virtual void registerTermination(double endTime, LineageStatus status) = 0;

        /**
         * @brief record the summary of a completed attempt, before save()
         * @param summary  forest summary of the attempt
         */
        virtual void recordSummary(const ForestSummary& summary) = 0;

        /**
         * @brief commit per‑attempt data into long‑term storage
         * @param trajectoryResult  attempt outcome
         */
        virtual void save(TrajectoryResult trajectoryResult) = 0;

        /**
         * @brief merge another collector’s results into this one
         * @param other  same type collector to absorb
         */
        virtual void merge(const DataCollector& other) = 0;

        /** @brief clone a fresh instance of this collector type */
        virtual std::unique_ptr<DataCollector> clone() const = 0;
    };

    /**
     * @brief Lineages‑through‑time of every accepted attempt: all infected individuals, observed or not.
     */
    class LttCollector final : public DataCollector {
    public:
        LttCollector() = default;
        LttCollector(const LttCollector& other) = default;

        std::unique_ptr<DataCollector> clone() const override { return std::make_unique<LttCollector>(*this); }

        void reset() override { events_.clear(); }
        void registerLineage(double startTime) override;
        void registerTermination(double endTime, LineageStatus status) override;
        void recordSummary(const ForestSummary&) override {}
        void merge(const DataCollector& other) override;
        void save(TrajectoryResult trajectoryResult) override;

        /**
         * @brief Access the curves of accepted attempts, oldest first.
         */
        const std::vector<LttCurve>& curves() const noexcept { return curves_; }

        /** @brief Curve of the most recent accepted attempt (empty if none). */
        LttCurve last() const { return curves_.empty() ? LttCurve{} : curves_.back(); }

    private:
        std::vector<std::pair<double, int>> events_; // per attempt
        std::vector<LttCurve> curves_;
    };


    /**
     * @brief Collects the number of lineages alive at a fixed time point.
     */
    class ActiveSetSizeCollector final : public DataCollector {
    public:
        /**
         * @brief Construct an active set size collector.
         * @param collectionTime time point at which to measure active set size
         */
        explicit ActiveSetSizeCollector(double collectionTime);

        /**
         * @brief Copy constructor.
         * @param other the other ActiveSetSizeCollector to copy
         */
        ActiveSetSizeCollector(const ActiveSetSizeCollector& other) = default;

        std::unique_ptr<DataCollector> clone() const override {
            return std::make_unique<ActiveSetSizeCollector>(*this);
        }

        void reset() override;
        void registerLineage(double startTime) override;
        void registerTermination(double endTime, LineageStatus status) override;
        void recordSummary(const ForestSummary&) override {}
        void merge(const DataCollector& other) override;
        void save(TrajectoryResult trajectoryResult) override;

        /**
         * @brief Access collected active set sizes.
         * @return one size per accepted attempt
         */
        std::vector<int> activeSetSizes() const noexcept { return activeSetSizes_; }

    private:
        int currentActiveSetSize = 0;
        double collectionTime_;
        std::vector<int> activeSetSizes_;
    };


    /**
     * @brief Counts attempts per outcome.
     */
    class AttemptCollector final : public DataCollector {
    public:
        AttemptCollector() = default;
        AttemptCollector(const AttemptCollector& other) = default;

        std::unique_ptr<DataCollector> clone() const override { return std::make_unique<AttemptCollector>(*this); }

        void reset() override {}
        void registerLineage(double) override {}
        void registerTermination(double, LineageStatus) override {}
        void recordSummary(const ForestSummary&) override {}
        void merge(const DataCollector& other) override;
        void save(TrajectoryResult trajectoryResult) override;

        /** @brief Attempts that ended with the given result. */
        long count(TrajectoryResult result) const noexcept { return counts_[static_cast<size_t>(result)]; }

        /** @brief All attempts so far. */
        long total() const noexcept;

    private:
        std::array<long, 4> counts_{};
    };


    /**
     * @brief Writes timestamped progress lines for every attempt to an output stream.
     *
     * Accepted attempts are always reported; rejections only when verbose.
     */
    class ProgressLogger final : public DataCollector {
    public:
        /**
         * @param out      destination stream, must outlive the logger and its clones
         * @param verbose  also report every rejected attempt
         */
        explicit ProgressLogger(std::ostream& out, bool verbose = false);
        ProgressLogger(const ProgressLogger& other) = default;

        std::unique_ptr<DataCollector> clone() const override { return std::make_unique<ProgressLogger>(*this); }

        void reset() override;
        void registerLineage(double) override {}
        void registerTermination(double, LineageStatus status) override;
        void recordSummary(const ForestSummary& summary) override;
        void merge(const DataCollector&) override {}
        void save(TrajectoryResult trajectoryResult) override;

    private:
        std::ostream* out_;
        bool verbose_;
        long attempt_ = 0;
        int sampled_ = 0; // per attempt
        ForestSummary summary_{};

        void log(const std::string& message) const;
    };


    /**
     * @brief Grouping of multiple DataCollector instances.
     *
     * Internally owns unique_ptr<DataCollector> clones.
     */
    class DataCollectorGroup final : public DataCollector {
    public:
        DataCollectorGroup() = default;

        /**
         * @brief Construct by cloning each supplied DataCollector.
         * @param collectors  original collectors to clone
         */
        explicit DataCollectorGroup(const std::vector<std::unique_ptr<DataCollector>>& collectors);

        /**
         * @brief Construct by cloning from shared_ptr collectors.
         * @param collectors  original collectors to clone
         */
        explicit DataCollectorGroup(const std::vector<std::shared_ptr<DataCollector>>& collectors);


        /**
         * @brief Copy constructor.
         * @param other the other DataCollectorGroup to copy
         */
        DataCollectorGroup(const DataCollectorGroup& other);

        std::unique_ptr<DataCollector> clone() const override { return std::make_unique<DataCollectorGroup>(*this); }

        void reset() override {
            for (const auto& c : collectors_) c->reset();
        }

        void registerLineage(const double startTime) override {
            for (const auto& c : collectors_) c->registerLineage(startTime);
        }

        void registerTermination(const double endTime, const LineageStatus status) override {
            for (const auto& c : collectors_) c->registerTermination(endTime, status);
        }

        void recordSummary(const ForestSummary& summary) override {
            for (const auto& c : collectors_) c->recordSummary(summary);
        }

        void merge(const DataCollector& other) override;

        void save(const TrajectoryResult trajectoryResult) override {
            for (const auto& c : collectors_) c->save(trajectoryResult);
        }

        /** @brief Append a collector, taking ownership. */
        void add(std::unique_ptr<DataCollector> collector) { collectors_.push_back(std::move(collector)); }

        /** @brief Number of collectors in this group. */
        size_t size() const { return collectors_.size(); }

        /**
         * @brief Access a specific collector.
         * @param i  index [0...size())
         */
        const std::unique_ptr<DataCollector>& at(const size_t i) const { return collectors_.at(i); }

    private:
        std::vector<std::unique_ptr<DataCollector>> collectors_;
    };
}
