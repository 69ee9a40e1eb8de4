// RngEngine_test.cpp
#include "gtest/gtest.h"
#include "RngEngine.h"
#include <algorithm>
#include <cmath>
#include <map>
#include <vector>
#include <boost/math/distributions.hpp>

using namespace treesim;

static const size_t N = 1'000'000;

static double ks_critical(size_t n) {
    // approximate Kolmogorov-Smirnov critical value for alpha=0.01
    return 1.63 / std::sqrt(n);
}

TEST(RngEngine, Uniform) {
    RngEngine rng(420);
    double mean0 = 0.5;
    double var0 = 1.0 / 12.0;
    double sigma_mean = std::sqrt(var0 / N);
    std::vector<double> values(N);
    for (size_t i = 0; i < N; ++i) {
        values[i] = rng.uniform();
    }
    double sum = 0, sum2 = 0;
    for (auto& x : values) {
        sum += x;
        sum2 += x * x;
    }
    double mean = sum / N;
    double var = sum2 / N - mean * mean;
    EXPECT_NEAR(mean, mean0, 5*sigma_mean);
    EXPECT_NEAR(var/var0, 1.0, 0.10);
    // KS test
    std::sort(values.begin(), values.end());
    double d = 0;
    for (size_t i = 0; i < N; ++i) {
        double F_emp = double(i + 1) / N;
        double F_theo = values[i];
        d = std::max(d, std::abs(F_emp - F_theo));
    }
    EXPECT_LT(d, ks_critical(N));
}

TEST(RngEngine, Exponential) {
    RngEngine rng(420);
    for (double rate : {0.05, 0.1, 0.5, 1.0, 2.0, 10.0}) {
        std::vector<double> values;
        values.reserve(N);
        for (size_t i = 0; i < N; ++i) {
            values.push_back(rng.exponential(rate));
        }
        double sum = 0;
        for (auto& x : values) sum += x;
        double mean0 = 1.0 / rate;
        double sigma_mean = mean0 / std::sqrt(double(N));
        EXPECT_NEAR(sum / N, mean0, 5*sigma_mean) << " rate=" << rate;
        // KS test
        std::sort(values.begin(), values.end());
        boost::math::exponential_distribution<> dist(rate);
        double d = 0;
        for (size_t i = 0; i < N; ++i) {
            double F_emp = double(i + 1) / N;
            double F_theo = boost::math::cdf(dist, values[i]);
            d = std::max(d, std::abs(F_emp - F_theo));
        }
        EXPECT_LT(d, ks_critical(N)) << "Exponential KS failed at rate=" << rate;
    }
}

TEST(RngEngine, ExponentialZeroRateNeverFires) {
    RngEngine rng(420);
    for (int i = 0; i < 100; ++i)
        EXPECT_TRUE(std::isinf(rng.exponential(0.0)));
}

TEST(RngEngine, Bernoulli) {
    RngEngine rng(420);
    EXPECT_FALSE(rng.bernoulli(0.0));
    EXPECT_TRUE(rng.bernoulli(1.0));
    for (double p : {0.01, 0.3, 0.5, 0.9}) {
        size_t hits = 0;
        for (size_t i = 0; i < N; ++i)
            if (rng.bernoulli(p)) ++hits;
        double sigma = std::sqrt(p * (1 - p) / N);
        EXPECT_NEAR(double(hits) / N, p, 5*sigma) << " p=" << p;
    }
}

TEST(RngEngine, Poisson) {
    RngEngine rng(420);

    for (double lambda : {0.5, 3.0, 10.0, 30.0, 200.0}) {
        // 1) Count observed frequencies
        std::map<int, int> freq;
        for (size_t i = 0; i < N; ++i)
            ++freq[rng.poisson(lambda)];

        // 2) Build (observed, expected) bins, merging low-expected tail
        std::vector<double> obs, expct;
        double tailObs = 0.0, tailExp = 0.0;
        boost::math::poisson_distribution<> dist(lambda);
        for (auto [k, count] : freq) {
            double ek = boost::math::pdf(dist, k) * N;
            if (ek < 5.0) {
                tailObs += count;
                tailExp += ek;
            }
            else {
                obs.push_back(count);
                expct.push_back(ek);
            }
        }
        if (tailExp > 0.0) {
            obs.push_back(tailObs);
            expct.push_back(tailExp);
        }

        ASSERT_GT(obs.size(), 1u) << "Not enough bins for chi2 at lambda=" << lambda;

        // 3) Compute chi²
        double chi2 = 0.0;
        size_t bins = obs.size();
        for (size_t i = 0; i < bins; ++i) {
            double o = obs[i], e = expct[i];
            chi2 += (o - e) * (o - e) / e;
        }

        // 4) Compare to χ²_{bins−1}(0.99)
        boost::math::chi_squared chi2dist(double(bins - 1));
        double crit = boost::math::quantile(chi2dist, 0.99);
        EXPECT_LT(chi2, crit)
            << "Chi² GOF failed for Poisson(lambda=" << lambda << "): chi2=" << chi2 << ", crit=" << crit;
    }
}

TEST(RngEngine, UniformIntCoversClosedRange) {
    RngEngine rng(420);
    const int lo = 5, hi = 20;
    std::vector<size_t> counts(hi - lo + 1, 0);
    const size_t n = 160'000;
    for (size_t i = 0; i < n; ++i) {
        const int x = rng.uniformInt(lo, hi);
        ASSERT_GE(x, lo);
        ASSERT_LE(x, hi);
        ++counts[x - lo];
    }
    const double expected = double(n) / counts.size();
    double chi2 = 0.0;
    for (auto c : counts) chi2 += (c - expected) * (c - expected) / expected;
    boost::math::chi_squared chi2dist(double(counts.size() - 1));
    EXPECT_LT(chi2, boost::math::quantile(chi2dist, 0.99));

    EXPECT_EQ(rng.uniformInt(7, 7), 7);
}

TEST(RngEngine, SameSeedSameStream) {
    RngEngine a(12345), b(12345), c(54321);
    bool differs = false;
    for (int i = 0; i < 1000; ++i) {
        const uint32_t x = a.nextUInt32();
        EXPECT_EQ(x, b.nextUInt32());
        if (x != c.nextUInt32()) differs = true;
    }
    EXPECT_TRUE(differs);
}
