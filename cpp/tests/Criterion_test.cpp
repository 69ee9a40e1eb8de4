#include "gtest/gtest.h"
#include "CompiledExpression.h"
#include "Criterion.h"

#include <memory>
#include <stdexcept>
#include <vector>

using namespace treesim;

TEST(TipCountCriterion, EarlyRejectAboveMax) {
    TipCountCriterion criterion(2, 3);
    const ForestSummary summary;
    criterion.registerSample(0.1);
    EXPECT_FALSE(criterion.earlyReject());
    EXPECT_FALSE(criterion.finalPassed(summary));
    criterion.registerSample(0.2);
    criterion.registerSample(0.3);
    EXPECT_FALSE(criterion.earlyReject());
    EXPECT_TRUE(criterion.finalPassed(summary));
    criterion.registerSample(0.4);
    EXPECT_TRUE(criterion.earlyReject());
    EXPECT_FALSE(criterion.finalPassed(summary));

    criterion.reset();
    EXPECT_EQ(criterion.count(), 0);
    EXPECT_FALSE(criterion.earlyReject());
}

TEST(IntervalCriterion, CountsOnlySamplesInsideWindow) {
    IntervalCriterion criterion(1.0, 2.0, 1, 2);
    const ForestSummary summary;
    criterion.registerSample(0.5);
    criterion.registerSample(2.5);
    EXPECT_FALSE(criterion.finalPassed(summary));
    criterion.registerSample(1.0);
    criterion.registerSample(2.0);
    EXPECT_TRUE(criterion.finalPassed(summary));
    criterion.registerSample(1.5);
    EXPECT_TRUE(criterion.earlyReject());
}

TEST(ExpressionCriterion, EvaluatesOverSummary) {
    ExpressionCriterion criterion(CompiledExpression("tips >= 10 and hidden < 2 and time > 1.5"));
    ForestSummary summary;
    summary.tips = 12;
    summary.hiddenTrees = 1;
    summary.time = 2.0;
    EXPECT_TRUE(criterion.finalPassed(summary));
    summary.hiddenTrees = 2;
    EXPECT_FALSE(criterion.finalPassed(summary));
    EXPECT_FALSE(criterion.earlyReject());
}

TEST(CompiledExpression, InvalidExpressionThrows) {
    EXPECT_THROW(CompiledExpression("tips >"), std::runtime_error);
    EXPECT_THROW(CompiledExpression("undeclared_variable > 1"), std::runtime_error);
}

TEST(CriterionGroup, AllMustPassAndAnyMayReject) {
    std::vector<std::unique_ptr<Criterion>> criteria;
    criteria.push_back(std::make_unique<TipCountCriterion>(1, 2));
    criteria.push_back(std::make_unique<IntervalCriterion>(0.0, 1.0, 1, 1));
    CriterionGroup group(criteria);
    EXPECT_EQ(group.size(), 2u);

    const ForestSummary summary;
    group.registerSample(0.5);
    EXPECT_TRUE(group.finalPassed(summary));
    group.registerSample(0.7);
    EXPECT_TRUE(group.earlyReject());
    EXPECT_FALSE(group.finalPassed(summary));

    group.reset();
    EXPECT_FALSE(group.earlyReject());
}

TEST(CriterionGroup, ClonesAreIndependent) {
    CriterionGroup group;
    group.add(TipCountCriterion(1, 1));
    const auto copy = group.clone();

    group.registerSample(0.1);
    group.registerSample(0.2);
    EXPECT_TRUE(group.earlyReject());
    EXPECT_FALSE(copy->earlyReject());
}
