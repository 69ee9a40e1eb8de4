#include "gtest/gtest.h"
#include "Errors.h"
#include "Skyline.h"

#include <cmath>
#include <vector>

using namespace treesim;

namespace {
    Model bd(const double la, const double psi, const double p) {
        return Model(RateModel(la, psi, p));
    }

    Skyline threeIntervals() {
        return Skyline({bd(0.4, 0.1, 0.5), bd(0.5, 0.2, 0.6), bd(0.6, 0.3, 0.7)}, {2.0, 5.0, 10.0});
    }
}

TEST(Skyline, IntervalLookup) {
    const Skyline skyline = threeIntervals();
    EXPECT_EQ(skyline.size(), 3u);
    EXPECT_EQ(skyline.intervalAt(0.0), 0u);
    EXPECT_EQ(skyline.intervalAt(1.999), 0u);
    EXPECT_EQ(skyline.intervalAt(2.0), 1u);
    EXPECT_EQ(skyline.intervalAt(4.5), 1u);
    EXPECT_EQ(skyline.intervalAt(5.0), 2u);
    EXPECT_DOUBLE_EQ(skyline.modelAt(3.0).birthRate(), 0.5);
}

TEST(Skyline, LastModelGovernsBeyondItsEndTime) {
    const Skyline skyline = threeIntervals();
    EXPECT_EQ(skyline.intervalAt(10.0), 2u);
    EXPECT_EQ(skyline.intervalAt(1e6), 2u);
    EXPECT_DOUBLE_EQ(skyline.modelAt(50.0).removalRate(false), 0.3);
}

TEST(Skyline, NextSwitch) {
    const Skyline skyline = threeIntervals();
    EXPECT_DOUBLE_EQ(skyline.nextSwitch(0.0), 2.0);
    EXPECT_DOUBLE_EQ(skyline.nextSwitch(2.0), 5.0);
    EXPECT_DOUBLE_EQ(skyline.nextSwitch(4.9), 5.0);
    EXPECT_TRUE(std::isinf(skyline.nextSwitch(5.0)));
    EXPECT_TRUE(std::isinf(skyline.nextSwitch(100.0)));

    const Skyline single(bd(1.0, 1.0, 0.5));
    EXPECT_EQ(single.intervalAt(123.0), 0u);
    EXPECT_TRUE(std::isinf(single.nextSwitch(0.0)));
}

TEST(Skyline, RejectsMismatchedConfiguration) {
    EXPECT_THROW(Skyline({}, {}), ConfigurationMismatch);
    EXPECT_THROW(Skyline({bd(1, 1, 0.5), bd(1, 1, 0.5)}, {1.0}), ConfigurationMismatch);
    EXPECT_THROW(Skyline({bd(1, 1, 0.5), bd(1, 1, 0.5)}, {2.0, 1.0}), ConfigurationMismatch);
    EXPECT_THROW(Skyline({bd(1, 1, 0.5), bd(1, 1, 0.5)}, {2.0, 2.0}), ConfigurationMismatch);
    EXPECT_THROW(Skyline({bd(1, 1, 0.5)}, {0.0}), ConfigurationMismatch);
    EXPECT_THROW(Skyline({bd(1, 1, 0.5)}, {std::nan("")}), ConfigurationMismatch);
}

TEST(Skyline, CanSample) {
    EXPECT_TRUE(threeIntervals().canSample());
    EXPECT_FALSE(Skyline({bd(1, 0, 0.5), bd(1, 1, 0.0)}, {1.0, 2.0}).canSample());
    EXPECT_TRUE(Skyline({bd(1, 0, 0.5), bd(1, 1, 0.1)}, {1.0, 2.0}).canSample());
}

TEST(Skyline, CanSampleOnlyCountsIntervalsStartingBeforeLimit) {
    const Skyline late({bd(1, 1, 0.0), bd(1, 1, 0.5)}, {5.0, 10.0});
    EXPECT_TRUE(late.canSample());
    EXPECT_FALSE(late.canSample(3.0));
    EXPECT_FALSE(late.canSample(5.0));
    EXPECT_TRUE(late.canSample(5.5));
    EXPECT_TRUE(Skyline({bd(1, 1, 0.5), bd(1, 0, 0.5)}, {5.0, 10.0}).canSample(1.0));
}

TEST(Skyline, WithMaxNotifiedContactsAppliesToEveryModel) {
    const Model ct(RateModel(0.5, 0.2, 0.5), Notification(0.5, 1.0, 1));
    const Skyline skyline = Skyline({ct, bd(0.5, 0.2, 0.5), ct}, {1.0, 2.0, 3.0}).withMaxNotifiedContacts(3);
    EXPECT_EQ(skyline.model(0).maxNotifiedContacts(), 3);
    EXPECT_FALSE(skyline.model(1).notifies());
    EXPECT_EQ(skyline.model(2).maxNotifiedContacts(), 3);
    EXPECT_DOUBLE_EQ(skyline.endTime(2), 3.0);
}
