#pragma once
/**
 * @file Criterion.h
 * @brief Acceptance/rejection criteria interfaces and composites.
 */
#include <memory>
#include <vector>

#include "CompiledExpression.h"
#include "Forest.h"

namespace treesim {
    /**
     * @brief Base interface for acceptance criteria.
     *
     * One instance follows one forest attempt: it sees every sample of every tree in the attempt.
     */
    class Criterion {
    public:
        virtual ~Criterion() = default;

        /** @brief record a sampled tip at time t */
        virtual void registerSample(double t) noexcept = 0;

        /** @brief early‑stop if true → reject immediately */
        virtual bool earlyReject() const noexcept = 0;

        /** @brief final acceptance check once the attempt is complete */
        virtual bool finalPassed(const ForestSummary& summary) const noexcept = 0;

        /** @brief reset internal state before reusing */
        virtual void reset() noexcept = 0;

        /** @brief clone for per‑generator isolation */
        virtual std::unique_ptr<Criterion> clone() const noexcept = 0;
    };

    /**
     * @brief Require minTips ≤ sampled tips ≤ maxTips; rejects as soon as maxTips is exceeded.
     */
    class TipCountCriterion final : public Criterion {
    public:
        TipCountCriterion(int minTips, int maxTips);

        void registerSample(double) noexcept override { count_++; }
        bool earlyReject() const noexcept override { return count_ > maxTips_; }
        bool finalPassed(const ForestSummary&) const noexcept override;
        void reset() noexcept override { count_ = 0; }

        std::unique_ptr<Criterion> clone() const noexcept override;

        int count() const noexcept { return count_; }

    private:
        int minTips_, maxTips_, count_ = 0;
    };

    /**
     * @brief Count samples in [tMin, tMax]; require minAllowed ≤ count ≤ maxAllowed.
     */
    class IntervalCriterion final : public Criterion {
    public:
        IntervalCriterion(double tMin, double tMax, int minAllowed, int maxAllowed);

        void registerSample(double t) noexcept override;
        bool earlyReject() const noexcept override;
        bool finalPassed(const ForestSummary&) const noexcept override;
        void reset() noexcept override { count_ = 0; }

        std::unique_ptr<Criterion> clone() const noexcept override;

    private:
        double tMin_, tMax_;
        int minAllowed_, maxAllowed_, count_ = 0;
    };

    /**
     * @brief Accept when an expression over the forest summary evaluates to nonzero.
     */
    class ExpressionCriterion final : public Criterion {
    public:
        explicit ExpressionCriterion(const CompiledExpression& expression);

        void registerSample(double) noexcept override {}
        bool earlyReject() const noexcept override { return false; }
        bool finalPassed(const ForestSummary& summary) const noexcept override;
        void reset() noexcept override {}

        std::unique_ptr<Criterion> clone() const noexcept override;

    private:
        CompiledExpression expression_;
    };

    /**
     * @brief Composite of multiple Criterion, applied in sequence.
     */
    class CriterionGroup final : public Criterion {
    public:
        CriterionGroup() = default;
        explicit CriterionGroup(const std::vector<std::unique_ptr<Criterion>>& criteria);
        explicit CriterionGroup(const std::vector<std::shared_ptr<Criterion>>& criteria);
        CriterionGroup(const CriterionGroup& other);

        void registerSample(double t) noexcept override;
        bool earlyReject() const noexcept override;
        bool finalPassed(const ForestSummary& summary) const noexcept override;
        void reset() noexcept override;

        std::unique_ptr<Criterion> clone() const noexcept override;

        /** @brief Append a clone of criterion. */
        void add(const Criterion& criterion);

        size_t size() const noexcept { return criteria_.size(); }

    private:
        std::vector<std::unique_ptr<Criterion>> criteria_;
    };
}
