
#include "Criterion.h"
#include <cassert>

using namespace treesim;

// TipCountCriterion
TipCountCriterion::TipCountCriterion(const int minTips, const int maxTips): minTips_(minTips), maxTips_(maxTips) {
    assert(minTips >= 0 && maxTips >= minTips);
}

bool TipCountCriterion::finalPassed(const ForestSummary&) const noexcept {
    return count_ >= minTips_ && count_ <= maxTips_;
}

std::unique_ptr<Criterion> TipCountCriterion::clone() const noexcept {
    return std::make_unique<TipCountCriterion>(*this);
}

// IntervalCriterion
IntervalCriterion::IntervalCriterion(const double tMin, const double tMax, const int minAllowed, const int maxAllowed)
    : tMin_(tMin), tMax_(tMax), minAllowed_(minAllowed), maxAllowed_(maxAllowed) {
    assert(tMin <= tMax && minAllowed >= 0 && maxAllowed >= minAllowed);
}

void IntervalCriterion::registerSample(const double t) noexcept {
    if (t >= tMin_ && t <= tMax_) count_++;
}

bool IntervalCriterion::earlyReject() const noexcept {
    return count_ > maxAllowed_;
}

bool IntervalCriterion::finalPassed(const ForestSummary&) const noexcept {
    return count_ >= minAllowed_ && count_ <= maxAllowed_;
}

std::unique_ptr<Criterion> IntervalCriterion::clone() const noexcept {
    return std::make_unique<IntervalCriterion>(*this);
}

// ExpressionCriterion
ExpressionCriterion::ExpressionCriterion(const CompiledExpression& expression): expression_(expression) {}

bool ExpressionCriterion::finalPassed(const ForestSummary& summary) const noexcept {
    return expression_.eval(summary) != 0.0;
}

std::unique_ptr<Criterion> ExpressionCriterion::clone() const noexcept {
    return std::make_unique<ExpressionCriterion>(*this);
}

// CriterionGroup
CriterionGroup::CriterionGroup(const std::vector<std::unique_ptr<Criterion>>& criteria) {
    criteria_.reserve(criteria.size());
    for (auto& c : criteria)
        criteria_.push_back(c->clone());
}

CriterionGroup::CriterionGroup(const std::vector<std::shared_ptr<Criterion>>& criteria) {
    criteria_.reserve(criteria.size());
    for (auto& c : criteria)
        criteria_.push_back(c->clone());
}

CriterionGroup::CriterionGroup(const CriterionGroup& other) {
    for (auto& c : other.criteria_)
        criteria_.push_back(c->clone());
}

void CriterionGroup::add(const Criterion& criterion) {
    criteria_.push_back(criterion.clone());
}

void CriterionGroup::registerSample(const double t) noexcept {
    for (const auto& c : criteria_)
        c->registerSample(t);
}

bool CriterionGroup::earlyReject() const noexcept {
    for (const auto& c : criteria_)
        if (c->earlyReject()) return true;
    return false;
}

bool CriterionGroup::finalPassed(const ForestSummary& summary) const noexcept {
    for (const auto& c : criteria_)
        if (!c->finalPassed(summary))
            return false;
    return true;
}

std::unique_ptr<Criterion> CriterionGroup::clone() const noexcept {
    return std::make_unique<CriterionGroup>(*this);
}

void CriterionGroup::reset() noexcept {
    for (const auto& c : criteria_)
        c->reset();
}
