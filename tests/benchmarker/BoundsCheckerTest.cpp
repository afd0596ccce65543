#include "benchmarker/BoundsChecker.hpp"
#include "exceptions/Exceptions.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using namespace ionbench;

class BoundsCheckerTest : public ::testing::Test {
protected:
    BoundsChecker checker{2};
    Eigen::VectorXd lb;
    Eigen::VectorXd ub;

    void SetUp() override {
        lb.resize(2);
        ub.resize(2);
        lb << 0.5, 0.5;
        ub << 1.5, 1.5;
    }

    static Eigen::VectorXd vec(double a, double b) {
        Eigen::VectorXd v(2);
        v << a, b;
        return v;
    }

    // k = p0 * exp(p1 * V), which grows with voltage for p1 > 0.
    static RateBounds exponentialRate() {
        RateFunction f;
        f.name = "k";
        f.polarity = RatePolarity::POSITIVE;
        f.rate = [](const Eigen::VectorXd& p, double V) { return p[0] * std::exp(p[1] * V); };

        RateBounds rb;
        rb.functions.push_back(f);
        rb.rateMin = 1e-3;
        rb.rateMax = 10.0;
        rb.vLow = -10.0;
        rb.vHigh = 10.0;
        rb.discretisation = 5;
        return rb;
    }
};

TEST_F(BoundsCheckerTest, UnboundedAcceptsEverything) {
    EXPECT_FALSE(checker.isBounded());
    EXPECT_TRUE(checker.inParameterBounds(vec(-1e9, 1e9)));
    EXPECT_TRUE(checker.isFeasible(vec(0.0, 0.0)));
    EXPECT_EQ(checker.lowerBounds()[0], -std::numeric_limits<double>::infinity());
    EXPECT_EQ(checker.upperBounds()[1], std::numeric_limits<double>::infinity());
}

TEST_F(BoundsCheckerTest, CandidateBelowLowerBoundIsRejected) {
    checker.setParameterBounds(lb, ub);
    EXPECT_FALSE(checker.inParameterBounds(vec(0.4, 1.0)));
    EXPECT_FALSE(checker.isFeasible(vec(0.4, 1.0)));
}

TEST_F(BoundsCheckerTest, BoundsAreInclusive) {
    checker.setParameterBounds(lb, ub);
    EXPECT_TRUE(checker.inParameterBounds(vec(0.5, 1.5)));
    EXPECT_FALSE(checker.inParameterBounds(vec(0.5, 1.5000001)));
}

TEST_F(BoundsCheckerTest, NaNIsNeverInBounds) {
    checker.setParameterBounds(lb, ub);
    EXPECT_FALSE(checker.inParameterBounds(vec(std::nan(""), 1.0)));
}

TEST_F(BoundsCheckerTest, ToggleKeepsStoredBounds) {
    checker.setParameterBounds(lb, ub);
    checker.setBounded(false);
    EXPECT_TRUE(checker.inParameterBounds(vec(0.4, 1.0)));
    checker.setBounded(true);
    EXPECT_FALSE(checker.inParameterBounds(vec(0.4, 1.0)));

    checker.clearParameterBounds();
    EXPECT_THROW(checker.setBounded(true), ConfigurationException);
}

TEST_F(BoundsCheckerTest, InvalidBoundsThrow) {
    EXPECT_THROW(checker.setParameterBounds(ub, lb), ConfigurationException);
    EXPECT_THROW(checker.setParameterBounds(vec(std::nan(""), 0.0), ub), ConfigurationException);
    Eigen::VectorXd three(3);
    three << 0.0, 0.0, 0.0;
    EXPECT_THROW(checker.setParameterBounds(three, three), InvalidParameterException);
    EXPECT_THROW(checker.inParameterBounds(three), InvalidParameterException);
}

TEST_F(BoundsCheckerTest, ClampProjectsOntoBox) {
    checker.setParameterBounds(lb, ub);
    Eigen::VectorXd clamped = checker.clamp(vec(0.1, 2.0));
    EXPECT_DOUBLE_EQ(clamped[0], 0.5);
    EXPECT_DOUBLE_EQ(clamped[1], 1.5);
}

TEST_F(BoundsCheckerTest, RateBoundsOverSharedSweep) {
    checker.setRateBounds(exponentialRate());
    EXPECT_TRUE(checker.isRateBounded());
    EXPECT_EQ(checker.sweepVoltages().size(), 5u);
    EXPECT_DOUBLE_EQ(checker.sweepVoltages().front(), -10.0);
    EXPECT_DOUBLE_EQ(checker.sweepVoltages().back(), 10.0);

    // 1 * exp(0.1 * V) stays in [e^-1, e^1].
    EXPECT_TRUE(checker.inRateBounds(vec(1.0, 0.1)));
    // exp(10) > rateMax at V = 10.
    EXPECT_FALSE(checker.inRateBounds(vec(1.0, 1.0)));
    // Too slow everywhere.
    EXPECT_FALSE(checker.inRateBounds(vec(1e-6, 0.0)));

    checker.setRateBounded(false);
    EXPECT_TRUE(checker.inRateBounds(vec(1.0, 1.0)));
}

TEST_F(BoundsCheckerTest, RateBoundsAtExtremeVoltageOnly) {
    RateBounds rb = exponentialRate();
    rb.functions[0].voltages = {rb.functions[0].extremeVoltage(rb.vLow, rb.vHigh)};
    checker.setRateBounds(rb);

    // At V = -10 this rate is below rateMin, but only V = +10 is checked.
    EXPECT_TRUE(checker.inRateBounds(vec(0.001, 0.2)));
    EXPECT_FALSE(checker.inRateBounds(vec(1.0, 1.0)));
}

TEST_F(BoundsCheckerTest, NaNRateFails) {
    RateBounds rb = exponentialRate();
    rb.functions[0].rate = [](const Eigen::VectorXd&, double) { return std::nan(""); };
    checker.setRateBounds(rb);
    EXPECT_FALSE(checker.isFeasible(vec(1.0, 0.0)));
}

TEST_F(BoundsCheckerTest, InvalidRateBoundsThrow) {
    RateBounds rb = exponentialRate();
    rb.rateMin = 100.0;
    EXPECT_THROW(checker.setRateBounds(rb), ConfigurationException);

    rb = exponentialRate();
    rb.functions[0].rate = nullptr;
    EXPECT_THROW(checker.setRateBounds(rb), ConfigurationException);

    EXPECT_THROW(checker.setRateBounded(true), ConfigurationException);
}
